#pragma once

#include <tollgate/schema/initiator_tier.hpp>
#include <tollgate/schema/policy_verdict.hpp>

#include <string>

namespace tollgate::schema {

struct policy_decision final {
  policy_verdict_t verdict{policy_verdict_t::allowed};
  std::string reason;
  initiator_tier_t tier{initiator_tier_t::standard};
};

using policy_decision_t = policy_decision;

}  // namespace tollgate::schema

#pragma once

#include <tollgate/schema/initiator_tier.hpp>

#include <optional>
#include <string>

// Resolved once per request; policy never inspects raw caller metadata.
namespace tollgate::schema {

struct initiator_context final {
  std::string initiator;
  initiator_tier_t tier{initiator_tier_t::standard};
  std::optional<std::string> credential;
};

using initiator_context_t = initiator_context;

}  // namespace tollgate::schema

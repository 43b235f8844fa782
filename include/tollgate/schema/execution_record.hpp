#pragma once

#include <tollgate/schema/error_code.hpp>
#include <tollgate/schema/execution_state.hpp>
#include <tollgate/schema/policy_verdict.hpp>
#include <tollgate/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: execution record.
// Point-addressable lifecycle state of one execution_id.
namespace tollgate::schema {

template <uint16_t Version>
struct execution_failure;

template <>
struct execution_failure<1> final {
  uint16_t version{1};
  error_code code{error_code::executor_failure};
  std::string reason;
};

using execution_failure_t = execution_failure<1>;

template <uint16_t Version>
struct execution_record;

template <>
struct execution_record<1> final {
  uint16_t version{1};
  std::string execution_id;
  std::string command_id;
  std::string kind;
  execution_state_t state{execution_state_t::received};
  std::optional<policy_verdict_t> verdict;
  std::optional<std::string> approval_id;
  std::optional<std::string> agent_id;
  std::optional<std::string> result;
  std::optional<execution_failure_t> failure;
  uint32_t attempt_count{};
  hash32_t command_digest{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using execution_record_t = execution_record<1>;

}  // namespace tollgate::schema

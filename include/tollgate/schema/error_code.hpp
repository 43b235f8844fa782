#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Stable numeric codes; the wire names are what callers match on.
namespace tollgate::schema {

enum class error_code : uint32_t {
  invalid_command = 1,
  policy_denied = 2,
  approval_conflict = 3,
  approval_not_found = 4,
  approval_rejected = 5,
  no_available_agent = 6,
  executor_failure = 7,
  timeout = 8,
  cancelled = 9,
  execution_not_found = 10,
  invalid_state = 11,
  idempotency_in_progress = 12,
};

inline constexpr auto kErrorCodeMappings = std::array{
    enum_mapping_t<error_code>{"INVALID_COMMAND", error_code::invalid_command},
    enum_mapping_t<error_code>{"POLICY_DENIED", error_code::policy_denied},
    enum_mapping_t<error_code>{"APPROVAL_CONFLICT",
                               error_code::approval_conflict},
    enum_mapping_t<error_code>{"APPROVAL_NOT_FOUND",
                               error_code::approval_not_found},
    enum_mapping_t<error_code>{"APPROVAL_REJECTED",
                               error_code::approval_rejected},
    enum_mapping_t<error_code>{"NO_AVAILABLE_AGENT",
                               error_code::no_available_agent},
    enum_mapping_t<error_code>{"EXECUTOR_FAILURE",
                               error_code::executor_failure},
    enum_mapping_t<error_code>{"TIMEOUT", error_code::timeout},
    enum_mapping_t<error_code>{"CANCELLED", error_code::cancelled},
    enum_mapping_t<error_code>{"EXECUTION_NOT_FOUND",
                               error_code::execution_not_found},
    enum_mapping_t<error_code>{"INVALID_STATE", error_code::invalid_state},
    enum_mapping_t<error_code>{"IDEMPOTENCY_IN_PROGRESS",
                               error_code::idempotency_in_progress},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace tollgate::schema

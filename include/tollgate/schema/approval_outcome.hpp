#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: approval outcome.
// The decision an operator submits for a pending approval.
namespace tollgate::schema {

enum class approval_outcome_t : uint8_t {
  approve = 0,
  reject = 1,
};

inline constexpr auto kApprovalOutcomeMappings = std::array{
    enum_mapping_t<approval_outcome_t>{"approve", approval_outcome_t::approve},
    enum_mapping_t<approval_outcome_t>{"reject", approval_outcome_t::reject},
};

template <>
inline std::optional<approval_outcome_t> try_from_string<approval_outcome_t>(
    const std::string_view value) {
  return from_string(value, kApprovalOutcomeMappings);
}

inline constexpr std::string_view to_string(const approval_outcome_t value) {
  return to_string(value, kApprovalOutcomeMappings).value_or("unknown");
}

}  // namespace tollgate::schema

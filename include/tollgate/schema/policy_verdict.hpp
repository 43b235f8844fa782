#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: policy verdict.
// Result of policy evaluation for one command.
namespace tollgate::schema {

enum class policy_verdict_t : uint8_t {
  allowed = 0,
  blocked = 1,
  rejected = 2,
};

inline constexpr auto kPolicyVerdictMappings = std::array{
    enum_mapping_t<policy_verdict_t>{"ALLOWED", policy_verdict_t::allowed},
    enum_mapping_t<policy_verdict_t>{"BLOCKED", policy_verdict_t::blocked},
    enum_mapping_t<policy_verdict_t>{"REJECTED", policy_verdict_t::rejected},
};

template <>
inline std::optional<policy_verdict_t> try_from_string<policy_verdict_t>(
    const std::string_view value) {
  return from_string(value, kPolicyVerdictMappings);
}

inline constexpr std::string_view to_string(const policy_verdict_t value) {
  return to_string(value, kPolicyVerdictMappings).value_or("unknown");
}

}  // namespace tollgate::schema

#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: approval status.
// Governance workflow: an approval starts pending and is decided exactly once.
namespace tollgate::schema {

enum class approval_status_t : uint8_t {
  pending = 0,
  approved = 1,
  rejected = 2,
};

inline constexpr auto kApprovalStatusMappings = std::array{
    enum_mapping_t<approval_status_t>{"PENDING", approval_status_t::pending},
    enum_mapping_t<approval_status_t>{"APPROVED", approval_status_t::approved},
    enum_mapping_t<approval_status_t>{"REJECTED", approval_status_t::rejected},
};

template <>
inline std::optional<approval_status_t> try_from_string<approval_status_t>(
    const std::string_view value) {
  return from_string(value, kApprovalStatusMappings);
}

inline constexpr std::string_view to_string(const approval_status_t value) {
  return to_string(value, kApprovalStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const approval_status_t value) {
  return value != approval_status_t::pending;
}

}  // namespace tollgate::schema

#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: initiator tier.
// Privileged initiators are evaluated against their own scoped checks only.
namespace tollgate::schema {

enum class initiator_tier_t : uint8_t {
  standard = 0,
  privileged = 1,
};

inline constexpr auto kInitiatorTierMappings = std::array{
    enum_mapping_t<initiator_tier_t>{"standard", initiator_tier_t::standard},
    enum_mapping_t<initiator_tier_t>{"privileged",
                                     initiator_tier_t::privileged},
};

template <>
inline std::optional<initiator_tier_t> try_from_string<initiator_tier_t>(
    const std::string_view value) {
  return from_string(value, kInitiatorTierMappings);
}

inline constexpr std::string_view to_string(const initiator_tier_t value) {
  return to_string(value, kInitiatorTierMappings).value_or("unknown");
}

}  // namespace tollgate::schema

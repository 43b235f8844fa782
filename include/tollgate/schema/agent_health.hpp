#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tollgate::schema {

enum class agent_health_t : uint8_t {
  healthy = 0,
  unhealthy = 1,
};

inline constexpr auto kAgentHealthMappings = std::array{
    enum_mapping_t<agent_health_t>{"HEALTHY", agent_health_t::healthy},
    enum_mapping_t<agent_health_t>{"UNHEALTHY", agent_health_t::unhealthy},
};

template <>
inline std::optional<agent_health_t> try_from_string<agent_health_t>(
    const std::string_view value) {
  return from_string(value, kAgentHealthMappings);
}

inline constexpr std::string_view to_string(const agent_health_t value) {
  return to_string(value, kAgentHealthMappings).value_or("unknown");
}

}  // namespace tollgate::schema

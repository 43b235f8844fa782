#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: dispatch mode.
// async hands admitted executions to the worker pool; synchronous commits
// them on the caller's thread.
namespace tollgate::schema {

enum class dispatch_mode_t : uint8_t {
  async = 0,
  synchronous = 1,
};

inline constexpr auto kDispatchModeMappings = std::array{
    enum_mapping_t<dispatch_mode_t>{"async", dispatch_mode_t::async},
    enum_mapping_t<dispatch_mode_t>{"synchronous",
                                    dispatch_mode_t::synchronous},
};

template <>
inline std::optional<dispatch_mode_t> try_from_string<dispatch_mode_t>(
    const std::string_view value) {
  return from_string(value, kDispatchModeMappings);
}

inline constexpr std::string_view to_string(const dispatch_mode_t value) {
  return to_string(value, kDispatchModeMappings).value_or("unknown");
}

}  // namespace tollgate::schema

#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tollgate::schema {

enum class idempotency_status_t : uint8_t {
  in_progress = 0,
  succeeded = 1,
  failed = 2,
};

inline constexpr auto kIdempotencyStatusMappings = std::array{
    enum_mapping_t<idempotency_status_t>{"IN_PROGRESS",
                                         idempotency_status_t::in_progress},
    enum_mapping_t<idempotency_status_t>{"SUCCEEDED",
                                         idempotency_status_t::succeeded},
    enum_mapping_t<idempotency_status_t>{"FAILED",
                                         idempotency_status_t::failed},
};

template <>
inline std::optional<idempotency_status_t>
try_from_string<idempotency_status_t>(const std::string_view value) {
  return from_string(value, kIdempotencyStatusMappings);
}

inline constexpr std::string_view to_string(const idempotency_status_t value) {
  return to_string(value, kIdempotencyStatusMappings).value_or("unknown");
}

}  // namespace tollgate::schema

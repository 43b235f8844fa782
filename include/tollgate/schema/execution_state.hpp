#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: execution state.
// Lifecycle of one execution_id. Transitions only move forward; completed and
// failed are final.
namespace tollgate::schema {

enum class execution_state_t : uint8_t {
  received = 0,
  blocked = 1,
  approved = 2,
  dispatched = 3,
  completed = 4,
  failed = 5,
};

inline constexpr auto kExecutionStateMappings = std::array{
    enum_mapping_t<execution_state_t>{"RECEIVED", execution_state_t::received},
    enum_mapping_t<execution_state_t>{"BLOCKED", execution_state_t::blocked},
    enum_mapping_t<execution_state_t>{"APPROVED", execution_state_t::approved},
    enum_mapping_t<execution_state_t>{"DISPATCHED",
                                      execution_state_t::dispatched},
    enum_mapping_t<execution_state_t>{"COMPLETED",
                                      execution_state_t::completed},
    enum_mapping_t<execution_state_t>{"FAILED", execution_state_t::failed},
};

template <>
inline std::optional<execution_state_t> try_from_string<execution_state_t>(
    const std::string_view value) {
  return from_string(value, kExecutionStateMappings);
}

inline constexpr std::string_view to_string(const execution_state_t value) {
  return to_string(value, kExecutionStateMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const execution_state_t value) {
  return value == execution_state_t::completed ||
         value == execution_state_t::failed;
}

/// Allowed edges of the execution state machine.
inline constexpr bool can_transition(const execution_state_t from,
                                     const execution_state_t to) {
  using enum execution_state_t;
  switch (from) {
    case received:
      return to == blocked || to == dispatched || to == failed;
    case blocked:
      return to == approved || to == failed;
    case approved:
      return to == dispatched || to == failed;
    case dispatched:
      return to == completed || to == failed;
    case completed:
    case failed:
    default:
      return false;
  }
}

}  // namespace tollgate::schema

#pragma once

#include <tollgate/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: command.
// A proposed write against a system of record. Immutable once submitted;
// execution_id is the idempotency key.
namespace tollgate::schema {

template <uint16_t Version>
struct command;

template <>
struct command<1> final {
  uint16_t version{1};
  std::string command_id;
  std::string execution_id;
  std::string kind;
  parameters_t parameters;
  std::string initiator;
  std::optional<std::string> credential;
  bool read_only{false};
  bool requires_approval{false};
  parameters_t metadata;
};

using command_t = command<1>;

}  // namespace tollgate::schema

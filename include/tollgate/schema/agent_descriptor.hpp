#pragma once

#include <tollgate/schema/agent_health.hpp>
#include <tollgate/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: agent descriptor.
// Routing view of one capability provider. Not persisted; the registry is
// rebuilt at startup.
namespace tollgate::schema {

template <uint16_t Version>
struct agent_descriptor;

template <>
struct agent_descriptor<1> final {
  uint16_t version{1};
  std::string agent_id;
  std::vector<std::string> capabilities;
  agent_health_t health{agent_health_t::healthy};
  bool isolated{false};
  uint32_t load{};
  uint32_t max_in_flight{1};
  uint64_t success_count{};
  uint64_t failure_count{};
  std::optional<std::string> last_error;
};

using agent_descriptor_t = agent_descriptor<1>;

}  // namespace tollgate::schema

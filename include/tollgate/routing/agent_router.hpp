#pragma once

#include <tollgate/routing/cancellable_timer.hpp>
#include <tollgate/routing/capability_executor.hpp>
#include <tollgate/routing/job_poller.hpp>
#include <tollgate/routing/load_slot.hpp>
#include <tollgate/schema/agent_descriptor.hpp>
#include <tollgate/schema/command.hpp>
#include <tollgate/schema/execution_record.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::routing {

struct agent_registration final {
  std::string agent_id;
  std::vector<std::string> capabilities;
  uint32_t max_in_flight{1};
  std::shared_ptr<capability_executor> executor;
};

struct routing_outcome final {
  bool success{false};
  std::optional<std::string> agent_id;
  std::optional<std::string> result;
  std::optional<tollgate::schema::execution_failure_t> failure;
};

/// Selects and invokes capability providers.
///
/// The kind -> agents route table is resolved once at construction, in
/// registration order, and selection is the first eligible agent in that
/// order. An agent is eligible while it is healthy, not isolated and below
/// max_in_flight. Any failure marks the agent unhealthy and isolates it until
/// `rehabilitate`.
class agent_router final {
 public:
  explicit agent_router(std::vector<agent_registration> registrations,
                        poll_policy policy = {});

  agent_router(const agent_router&) = delete;
  agent_router& operator=(const agent_router&) = delete;

  std::optional<tollgate::schema::agent_descriptor_t> select(
      std::string_view kind) const;

  /// Select and reserve in one step.
  std::optional<load_slot> acquire(std::string_view kind);

  routing_outcome execute(const tollgate::schema::command_t& command);
  routing_outcome execute(const tollgate::schema::command_t& command,
                          load_slot slot);

  bool rehabilitate(std::string_view agent_id);
  bool isolate(std::string_view agent_id, std::string_view reason);

  std::vector<tollgate::schema::agent_descriptor_t> snapshot() const;

  /// Abort every poll loop in progress; later polls end CANCELLED.
  void cancel();

 private:
  friend class load_slot;

  struct agent_entry final {
    tollgate::schema::agent_descriptor_t descriptor;
    std::shared_ptr<capability_executor> executor;
  };

  std::optional<std::size_t> find_eligible(std::string_view kind) const;
  std::optional<std::size_t> find_agent(std::string_view agent_id) const;
  void release(std::size_t index);
  void record_success(std::size_t index);
  void record_failure(std::size_t index, const std::string& reason);

  mutable std::mutex mutex_;
  std::vector<agent_entry> agents_;
  std::map<std::string, std::vector<std::size_t>, std::less<>> routes_;
  poll_policy poll_policy_;
  cancellable_timer timer_;
};

}  // namespace tollgate::routing

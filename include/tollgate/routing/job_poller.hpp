#pragma once

#include <tollgate/routing/cancellable_timer.hpp>
#include <tollgate/routing/capability_executor.hpp>

#include <chrono>
#include <cstdint>

namespace tollgate::routing {

struct poll_policy final {
  uint32_t max_attempts{30};
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds deadline{60000};
};

/// Drives a pending remote job to job_done or job_failed.
///
/// Each step waits `interval` on the timer and polls once. Exceeding
/// `max_attempts` or `deadline` ends in TIMEOUT; cancelling the timer ends in
/// CANCELLED. Executor exceptions end in EXECUTOR_FAILURE.
class job_poller final {
 public:
  job_poller(capability_executor& executor,
             poll_policy policy,
             cancellable_timer& timer);

  job_status run(job_status status);

  uint32_t attempts() const { return attempts_; }

 private:
  capability_executor& executor_;
  poll_policy policy_;
  cancellable_timer& timer_;
  uint32_t attempts_{};
};

}  // namespace tollgate::routing

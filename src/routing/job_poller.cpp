#include <tollgate/routing/job_poller.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <string>

namespace tollgate::routing {

job_poller::job_poller(capability_executor& executor,
                       poll_policy policy,
                       cancellable_timer& timer)
    : executor_{executor}, policy_{policy}, timer_{timer} {}

job_status job_poller::run(job_status status) {
  const auto started = std::chrono::steady_clock::now();
  while (const auto* pending = std::get_if<job_pending>(&status)) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (attempts_ >= policy_.max_attempts || elapsed >= policy_.deadline) {
      spdlog::warn("remote job {} timed out after {} polls",
                   pending->remote_job_id, attempts_);
      return job_failed{"timeout", tollgate::schema::error_code::timeout};
    }
    auto wait = std::min(policy_.interval, policy_.deadline - elapsed);
    if (!timer_.wait_for(wait)) {
      spdlog::warn("remote job {} polling cancelled", pending->remote_job_id);
      return job_failed{"cancelled", tollgate::schema::error_code::cancelled};
    }
    ++attempts_;
    auto job = *pending;
    try {
      status = executor_.poll(job);
    } catch (const std::exception& e) {
      return job_failed{std::string{"poll failed: "} + e.what()};
    } catch (...) {
      return job_failed{"poll raised a non-standard exception"};
    }
    spdlog::debug("remote job {} poll #{}", job.remote_job_id, attempts_);
  }
  return status;
}

}  // namespace tollgate::routing

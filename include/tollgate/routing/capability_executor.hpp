#pragma once

#include <tollgate/schema/error_code.hpp>
#include <tollgate/schema/primitives.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace tollgate::routing {

/// The remote side accepted the command and must be polled.
struct job_pending final {
  std::string remote_job_id;
};

struct job_done final {
  std::string result;
};

struct job_failed final {
  std::string error;
  tollgate::schema::error_code code{
      tollgate::schema::error_code::executor_failure};
};

using job_status = std::variant<job_pending, job_done, job_failed>;

/// Adapter performing the side effect for one or more command kinds.
///
/// Executors need no idempotency of their own: the gateway invokes each
/// execution_id at most once. A thrown exception counts as a failure.
class capability_executor {
 public:
  virtual ~capability_executor() = default;

  virtual job_status execute(std::string_view kind,
                             const tollgate::schema::parameters_t& parameters) = 0;

  /// Advance a pending remote job. Executors that never return job_pending
  /// keep the default.
  virtual job_status poll(const job_pending& pending) {
    return job_failed{"poll not supported for " + pending.remote_job_id};
  }
};

}  // namespace tollgate::routing

#pragma once

#include <tollgate/schema/job_status.hpp>
#include <tollgate/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: queue job.
// One queued execution request. Jobs are process-local.
namespace tollgate::schema {

template <uint16_t Version>
struct job;

template <>
struct job<1> final {
  uint16_t version{1};
  std::string job_id;
  std::string execution_id;
  job_status_t status{job_status_t::queued};
  uint32_t attempts{};
  uint32_t max_attempts{1};
  std::optional<std::string> last_error;
  timestamp_milliseconds_t created_at{};
};

using job_t = job<1>;

}  // namespace tollgate::schema

#pragma once

#include <tollgate/schema/job.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::execution {

inline constexpr auto kMaxRetriesLimit = uint32_t{1};
inline constexpr auto kDefaultRetainedJobs = std::size_t{1024};

/// FIFO of execution requests with bounded retry.
///
/// Safe for multiple producers and consumers. A job is attempted at most
/// `max_retries + 1` times; once it terminates it is never handed out again.
/// Only the most recent `retained_jobs` terminal jobs stay queryable; the
/// execution registry remains the record of what happened to older ones.
class job_queue final {
 public:
  /// Throws std::invalid_argument when max_retries exceeds kMaxRetriesLimit.
  explicit job_queue(uint32_t max_retries = 1,
                     std::size_t retained_jobs = kDefaultRetainedJobs);

  job_queue(const job_queue&) = delete;
  job_queue& operator=(const job_queue&) = delete;

  /// Queue the execution. An active job for the same execution is returned
  /// instead of creating a second one.
  std::string enqueue(std::string_view execution_id);

  /// Block until a job is available, the timeout expires or the queue shuts
  /// down. The claimed job is PROCESSING with its attempt count incremented.
  std::optional<tollgate::schema::job_t> claim(
      std::chrono::milliseconds timeout);

  bool ack(std::string_view job_id);

  /// Report a failed attempt. Returns true when the job was re-queued.
  bool nack(std::string_view job_id, std::string_view error, bool retry);

  /// Cancel a job that has not been claimed yet.
  bool cancel(std::string_view job_id);

  std::optional<tollgate::schema::job_t> get(std::string_view job_id) const;

  /// Most recent job for the execution, while it is active or retained.
  std::optional<tollgate::schema::job_t> find_by_execution(
      std::string_view execution_id) const;

  std::vector<tollgate::schema::job_t> snapshot() const;
  std::size_t pending() const;
  /// Number of jobs held, active and retained terminal ones.
  std::size_t size() const;

  void shutdown();
  bool is_shutdown() const;

  uint32_t max_retries() const { return max_retries_; }

 private:
  tollgate::schema::job_t* find(std::string_view job_id);
  /// Record a job that reached a terminal status and evict the oldest
  /// terminal jobs beyond the retention limit.
  void retire(const tollgate::schema::job_t& job);

  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<std::string> ready_;
  std::deque<std::string> retired_;
  std::map<std::string, tollgate::schema::job_t, std::less<>> jobs_;
  std::map<std::string, std::string, std::less<>> latest_by_execution_;
  uint64_t last_job_sequence_{};
  uint32_t max_retries_{1};
  std::size_t retained_jobs_{kDefaultRetainedJobs};
  bool shutdown_{false};
};

}  // namespace tollgate::execution

#pragma once

#include <tollgate/execution/job_queue.hpp>
#include <tollgate/governance/write_gateway.hpp>
#include <tollgate/schema/write_result.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace tollgate::execution {

using completion_callback_t =
    std::function<void(const tollgate::schema::write_result_t& result)>;

/// Fixed set of threads draining the job queue through the gateway.
///
/// A result with code 0 is acked, a retryable result is nacked for retry and
/// any other result, or an exception, is nacked without retry.
class worker_pool final {
 public:
  worker_pool(job_queue& queue,
              tollgate::governance::write_gateway& gateway,
              std::size_t workers,
              std::chrono::milliseconds claim_timeout =
                  std::chrono::milliseconds{100});
  ~worker_pool();

  worker_pool(const worker_pool&) = delete;
  worker_pool& operator=(const worker_pool&) = delete;

  /// Invoked on a worker thread after every processed job.
  void set_completion_callback(completion_callback_t callback);

  void start();

  /// Shut the queue down and join every worker. In-flight jobs finish first.
  void stop();

  bool running() const { return running_.load(); }
  std::size_t size() const { return workers_; }

 private:
  void run(std::size_t worker_index);
  void process(const tollgate::schema::job_t& job);

  job_queue& queue_;
  tollgate::governance::write_gateway& gateway_;
  std::size_t workers_{};
  std::chrono::milliseconds claim_timeout_;
  completion_callback_t callback_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> threads_;
};

}  // namespace tollgate::execution

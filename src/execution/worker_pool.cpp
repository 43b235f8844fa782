#include <tollgate/execution/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace tollgate::execution {

worker_pool::worker_pool(job_queue& queue,
                         tollgate::governance::write_gateway& gateway,
                         std::size_t workers,
                         std::chrono::milliseconds claim_timeout)
    : queue_{queue},
      gateway_{gateway},
      workers_{std::max<std::size_t>(1, workers)},
      claim_timeout_{claim_timeout} {}

worker_pool::~worker_pool() { stop(); }

void worker_pool::set_completion_callback(completion_callback_t callback) {
  callback_ = std::move(callback);
}

void worker_pool::start() {
  if (running_.exchange(true)) {
    return;
  }
  threads_.reserve(workers_);
  for (auto i = std::size_t{0}; i < workers_; ++i) {
    threads_.emplace_back([this, i] { run(i); });
  }
  spdlog::info("worker pool started with {} worker(s)", workers_);
}

void worker_pool::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  queue_.shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
  spdlog::info("worker pool stopped");
}

void worker_pool::run(const std::size_t worker_index) {
  spdlog::debug("worker {} running", worker_index);
  while (running_.load() && !queue_.is_shutdown()) {
    auto job = queue_.claim(claim_timeout_);
    if (!job) {
      continue;
    }
    process(*job);
  }
  spdlog::debug("worker {} exiting", worker_index);
}

void worker_pool::process(const tollgate::schema::job_t& job) {
  const auto final_attempt = job.attempts > queue_.max_retries();
  try {
    auto result = gateway_.commit_write(job.execution_id, final_attempt);
    if (result.code == 0) {
      queue_.ack(job.job_id);
    } else {
      queue_.nack(job.job_id, result.log, result.retryable);
    }
    if (callback_) {
      callback_(result);
    }
  } catch (const std::exception& e) {
    spdlog::error("job {} for {} raised: {}", job.job_id, job.execution_id,
                  e.what());
    queue_.nack(job.job_id, e.what(), false);
  } catch (...) {
    spdlog::error("job {} for {} raised a non-standard exception",
                  job.job_id, job.execution_id);
    queue_.nack(job.job_id, "non-standard exception", false);
  }
}

}  // namespace tollgate::execution

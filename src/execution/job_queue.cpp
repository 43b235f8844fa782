#include <tollgate/common/clock.hpp>
#include <tollgate/execution/job_queue.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <utility>

namespace tollgate::execution {

namespace {

uint64_t job_sequence(std::string_view job_id) {
  auto value = uint64_t{};
  if (job_id.size() > 1) {
    std::from_chars(job_id.data() + 1, job_id.data() + job_id.size(), value);
  }
  return value;
}

}  // namespace

job_queue::job_queue(const uint32_t max_retries,
                     const std::size_t retained_jobs)
    : max_retries_{max_retries}, retained_jobs_{retained_jobs} {
  if (max_retries_ > kMaxRetriesLimit) {
    throw std::invalid_argument{"max_retries must be 0 or 1"};
  }
}

std::string job_queue::enqueue(std::string_view execution_id) {
  auto job_id = std::string{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto latest = latest_by_execution_.find(execution_id);
    if (latest != std::end(latest_by_execution_)) {
      auto* existing = find(latest->second);
      if (existing != nullptr && tollgate::schema::is_active(existing->status)) {
        spdlog::debug("execution {} already queued as {}", execution_id,
                      existing->job_id);
        return existing->job_id;
      }
    }

    auto job = tollgate::schema::job_t{};
    job.job_id = "j" + std::to_string(++last_job_sequence_);
    job.execution_id = std::string{execution_id};
    job.status = tollgate::schema::job_status_t::queued;
    job.max_attempts = max_retries_ + 1;
    job.created_at = tollgate::common::now_milliseconds();
    job_id = job.job_id;
    latest_by_execution_.insert_or_assign(job.execution_id, job.job_id);
    jobs_.emplace(job.job_id, std::move(job));
    ready_.push_back(job_id);
  }
  condition_.notify_one();
  spdlog::debug("job {} queued for {}", job_id, execution_id);
  return job_id;
}

std::optional<tollgate::schema::job_t> job_queue::claim(
    const std::chrono::milliseconds timeout) {
  auto lock = std::unique_lock{mutex_};
  if (!condition_.wait_for(lock, timeout,
                           [this] { return shutdown_ || !ready_.empty(); })) {
    return std::nullopt;
  }
  if (shutdown_) {
    return std::nullopt;
  }
  auto job_id = std::move(ready_.front());
  ready_.pop_front();
  auto* job = find(job_id);
  if (job == nullptr) {
    return std::nullopt;
  }
  job->status = tollgate::schema::job_status_t::processing;
  ++job->attempts;
  return *job;
}

bool job_queue::ack(std::string_view job_id) {
  auto lock = std::scoped_lock{mutex_};
  auto* job = find(job_id);
  if (job == nullptr ||
      job->status != tollgate::schema::job_status_t::processing) {
    return false;
  }
  job->status = tollgate::schema::job_status_t::succeeded;
  retire(*job);
  return true;
}

bool job_queue::nack(std::string_view job_id,
                     std::string_view error,
                     const bool retry) {
  auto requeued = false;
  {
    auto lock = std::scoped_lock{mutex_};
    auto* job = find(job_id);
    if (job == nullptr ||
        job->status != tollgate::schema::job_status_t::processing) {
      return false;
    }
    job->last_error = std::string{error};
    if (retry && job->attempts <= max_retries_ && !shutdown_) {
      job->status = tollgate::schema::job_status_t::queued;
      ready_.push_back(job->job_id);
      requeued = true;
      spdlog::info("job {} re-queued after attempt {}: {}", job->job_id,
                   job->attempts, error);
    } else {
      job->status = tollgate::schema::job_status_t::failed;
      spdlog::warn("job {} failed after {} attempt(s): {}", job->job_id,
                   job->attempts, error);
      retire(*job);
    }
  }
  if (requeued) {
    condition_.notify_one();
  }
  return requeued;
}

bool job_queue::cancel(std::string_view job_id) {
  auto lock = std::scoped_lock{mutex_};
  auto* job = find(job_id);
  if (job == nullptr || job->status != tollgate::schema::job_status_t::queued) {
    return false;
  }
  std::erase(ready_, job->job_id);
  job->status = tollgate::schema::job_status_t::cancelled;
  spdlog::info("job {} cancelled", job->job_id);
  retire(*job);
  return true;
}

std::optional<tollgate::schema::job_t> job_queue::get(
    std::string_view job_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = jobs_.find(job_id);
  if (it == std::end(jobs_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<tollgate::schema::job_t> job_queue::find_by_execution(
    std::string_view execution_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto latest = latest_by_execution_.find(execution_id);
  if (latest == std::end(latest_by_execution_)) {
    return std::nullopt;
  }
  auto it = jobs_.find(latest->second);
  if (it == std::end(jobs_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<tollgate::schema::job_t> job_queue::snapshot() const {
  auto lock = std::scoped_lock{mutex_};
  auto jobs = std::vector<tollgate::schema::job_t>{};
  jobs.reserve(jobs_.size());
  for (const auto& [id, job] : jobs_) {
    jobs.push_back(job);
  }
  std::sort(std::begin(jobs), std::end(jobs),
            [](const auto& lhs, const auto& rhs) {
              return job_sequence(lhs.job_id) < job_sequence(rhs.job_id);
            });
  return jobs;
}

std::size_t job_queue::pending() const {
  auto lock = std::scoped_lock{mutex_};
  return ready_.size();
}

std::size_t job_queue::size() const {
  auto lock = std::scoped_lock{mutex_};
  return jobs_.size();
}

void job_queue::shutdown() {
  {
    auto lock = std::scoped_lock{mutex_};
    shutdown_ = true;
  }
  condition_.notify_all();
}

bool job_queue::is_shutdown() const {
  auto lock = std::scoped_lock{mutex_};
  return shutdown_;
}

tollgate::schema::job_t* job_queue::find(std::string_view job_id) {
  auto it = jobs_.find(job_id);
  if (it == std::end(jobs_)) {
    return nullptr;
  }
  return &it->second;
}

void job_queue::retire(const tollgate::schema::job_t& job) {
  retired_.push_back(job.job_id);
  while (retired_.size() > retained_jobs_) {
    auto evicted = std::move(retired_.front());
    retired_.pop_front();
    auto it = jobs_.find(evicted);
    if (it == std::end(jobs_)) {
      continue;
    }
    auto latest = latest_by_execution_.find(it->second.execution_id);
    if (latest != std::end(latest_by_execution_) && latest->second == evicted) {
      latest_by_execution_.erase(latest);
    }
    jobs_.erase(it);
  }
}

}  // namespace tollgate::execution

#include <gtest/gtest.h>
#include <tollgate/execution/job_queue.hpp>

#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using tollgate::schema::job_status_t;

}  // namespace

TEST(job_queue, max_retries_is_bounded) {
  EXPECT_NO_THROW(tollgate::execution::job_queue{0});
  EXPECT_NO_THROW(tollgate::execution::job_queue{1});
  EXPECT_THROW(tollgate::execution::job_queue{2}, std::invalid_argument);
}

TEST(job_queue, jobs_are_claimed_in_fifo_order) {
  auto queue = tollgate::execution::job_queue{};
  auto first = queue.enqueue("exec-1");
  auto second = queue.enqueue("exec-2");
  EXPECT_EQ(queue.pending(), 2u);

  auto claimed = queue.claim(10ms);
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->job_id, first);
  EXPECT_EQ(claimed->status, job_status_t::processing);
  EXPECT_EQ(claimed->attempts, 1u);
  EXPECT_EQ(queue.claim(10ms)->job_id, second);
  EXPECT_FALSE(queue.claim(10ms).has_value());
}

TEST(job_queue, active_job_is_deduplicated_per_execution) {
  auto queue = tollgate::execution::job_queue{};
  auto first = queue.enqueue("exec-1");
  EXPECT_EQ(queue.enqueue("exec-1"), first);
  EXPECT_EQ(queue.pending(), 1u);

  auto claimed = queue.claim(10ms);
  EXPECT_EQ(queue.enqueue("exec-1"), first);
  ASSERT_TRUE(queue.ack(claimed->job_id));
  EXPECT_NE(queue.enqueue("exec-1"), first);
}

TEST(job_queue, retry_is_bounded_by_max_retries) {
  auto queue = tollgate::execution::job_queue{1};
  auto job_id = queue.enqueue("exec-1");

  auto attempt = queue.claim(10ms);
  EXPECT_TRUE(queue.nack(attempt->job_id, "no_available_agent", true));
  EXPECT_EQ(queue.get(job_id)->status, job_status_t::queued);

  attempt = queue.claim(10ms);
  ASSERT_TRUE(attempt.has_value());
  EXPECT_EQ(attempt->attempts, 2u);
  EXPECT_FALSE(queue.nack(attempt->job_id, "no_available_agent", true));

  auto job = queue.get(job_id);
  EXPECT_EQ(job->status, job_status_t::failed);
  EXPECT_EQ(job->last_error, std::optional<std::string>{"no_available_agent"});
  EXPECT_FALSE(queue.claim(10ms).has_value());
}

TEST(job_queue, zero_retries_fails_on_first_nack) {
  auto queue = tollgate::execution::job_queue{0};
  auto job_id = queue.enqueue("exec-1");
  auto attempt = queue.claim(10ms);
  EXPECT_EQ(attempt->max_attempts, 1u);
  EXPECT_FALSE(queue.nack(job_id, "boom", true));
  EXPECT_EQ(queue.get(job_id)->status, job_status_t::failed);
}

TEST(job_queue, terminal_jobs_reject_further_reports) {
  auto queue = tollgate::execution::job_queue{};
  auto job_id = queue.enqueue("exec-1");
  EXPECT_FALSE(queue.ack(job_id));
  queue.claim(10ms);
  EXPECT_TRUE(queue.ack(job_id));
  EXPECT_FALSE(queue.ack(job_id));
  EXPECT_FALSE(queue.nack(job_id, "late", true));
  EXPECT_EQ(queue.get(job_id)->status, job_status_t::succeeded);
}

TEST(job_queue, only_queued_jobs_can_be_cancelled) {
  auto queue = tollgate::execution::job_queue{};
  auto first = queue.enqueue("exec-1");
  auto second = queue.enqueue("exec-2");
  EXPECT_TRUE(queue.cancel(second));
  EXPECT_EQ(queue.pending(), 1u);

  queue.claim(10ms);
  EXPECT_FALSE(queue.cancel(first));
  EXPECT_EQ(queue.get(second)->status, job_status_t::cancelled);
  EXPECT_FALSE(queue.claim(10ms).has_value());
}

TEST(job_queue, snapshot_orders_by_creation) {
  auto queue = tollgate::execution::job_queue{};
  for (auto i = 1; i <= 12; ++i) {
    queue.enqueue("exec-" + std::to_string(i));
  }
  auto jobs = queue.snapshot();
  ASSERT_EQ(jobs.size(), 12u);
  EXPECT_EQ(jobs[1].job_id, "j2");
  EXPECT_EQ(jobs.back().job_id, "j12");
  EXPECT_EQ(queue.find_by_execution("exec-3")->job_id, "j3");
}

TEST(job_queue, terminal_history_is_bounded) {
  auto queue = tollgate::execution::job_queue{1, 3};
  for (auto i = 1; i <= 100; ++i) {
    auto job_id = queue.enqueue("exec-" + std::to_string(i));
    ASSERT_TRUE(queue.claim(10ms).has_value());
    if (i % 2 == 0) {
      EXPECT_TRUE(queue.ack(job_id));
    } else {
      EXPECT_FALSE(queue.nack(job_id, "fatal", false));
    }
  }
  auto active = queue.enqueue("exec-active");
  EXPECT_EQ(queue.size(), 4u);
  EXPECT_EQ(queue.snapshot().size(), 4u);
  EXPECT_FALSE(queue.get("j1").has_value());
  EXPECT_FALSE(queue.find_by_execution("exec-1").has_value());
  EXPECT_EQ(queue.get("j100")->status, job_status_t::succeeded);
  EXPECT_EQ(queue.find_by_execution("exec-99")->status, job_status_t::failed);
  EXPECT_EQ(queue.find_by_execution("exec-active")->job_id, active);

  // A requeued execution keeps its new job when the old one is evicted.
  auto again = queue.enqueue("exec-98");
  for (auto i = 0; i < 3; ++i) {
    auto job_id = queue.enqueue("filler-" + std::to_string(i));
    EXPECT_TRUE(queue.cancel(job_id));
  }
  EXPECT_EQ(queue.find_by_execution("exec-98")->job_id, again);
}

TEST(job_queue, shutdown_wakes_blocked_claimers) {
  auto queue = tollgate::execution::job_queue{};
  auto claimed = std::optional<tollgate::schema::job_t>{};
  auto started = std::chrono::steady_clock::now();
  auto consumer = std::thread{[&] { claimed = queue.claim(10s); }};
  std::this_thread::sleep_for(20ms);
  queue.shutdown();
  consumer.join();
  EXPECT_FALSE(claimed.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
  EXPECT_TRUE(queue.is_shutdown());
}

TEST(job_queue, concurrent_consumers_claim_each_job_once) {
  auto queue = tollgate::execution::job_queue{};
  for (auto i = 0; i < 200; ++i) {
    queue.enqueue("exec-" + std::to_string(i));
  }
  auto mutex = std::mutex{};
  auto seen = std::set<std::string>{};
  auto duplicates = 0;
  auto consumers = std::vector<std::thread>{};
  for (auto t = 0; t < 4; ++t) {
    consumers.emplace_back([&] {
      while (auto job = queue.claim(20ms)) {
        queue.ack(job->job_id);
        auto lock = std::scoped_lock{mutex};
        if (!seen.insert(job->job_id).second) {
          ++duplicates;
        }
      }
    });
  }
  for (auto& consumer : consumers) {
    consumer.join();
  }
  EXPECT_EQ(seen.size(), 200u);
  EXPECT_EQ(duplicates, 0);
}

#include <gtest/gtest.h>
#include <tollgate/routing/agent_router.hpp>
#include <tollgate/routing/loopback_executor.hpp>
#include <tollgate/testing/common.hpp>
#include <tollgate/testing/fake_executor.hpp>
#include <tollgate/testing/gateway_fixture.hpp>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using tollgate::testing::counting_executor;
using tollgate::testing::make_agent;
using tollgate::testing::make_command;

}  // namespace

TEST(agent_router, selects_first_eligible_in_registration_order) {
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(
      make_agent("erp-1", {"erp.post"}, std::make_shared<counting_executor>()));
  registrations.push_back(make_agent("crm-1", {"crm.update", "crm.read"},
                                     std::make_shared<counting_executor>()));
  registrations.push_back(make_agent("crm-2", {"crm.update"},
                                     std::make_shared<counting_executor>()));
  auto router = tollgate::routing::agent_router{std::move(registrations)};

  EXPECT_EQ(router.select("crm.update")->agent_id, "crm-1");
  EXPECT_EQ(router.select("erp.post")->agent_id, "erp-1");
  EXPECT_FALSE(router.select("hr.hire").has_value());
}

TEST(agent_router, duplicate_and_executorless_agents_are_skipped) {
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(make_agent("crm-1", {"crm.update"}, nullptr));
  registrations.push_back(make_agent("crm-2", {"crm.update"},
                                     std::make_shared<counting_executor>()));
  registrations.push_back(make_agent("crm-2", {"crm.read"},
                                     std::make_shared<counting_executor>()));
  auto router = tollgate::routing::agent_router{std::move(registrations)};

  auto agents = router.snapshot();
  ASSERT_EQ(agents.size(), 1u);
  EXPECT_EQ(agents[0].agent_id, "crm-2");
  EXPECT_FALSE(router.select("crm.read").has_value());
}

TEST(agent_router, isolation_contains_failing_agent) {
  auto failing = std::make_shared<tollgate::testing::throwing_executor>();
  auto backup = std::make_shared<counting_executor>();
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(make_agent("crm-1", {"crm.update"}, failing));
  registrations.push_back(make_agent("crm-2", {"crm.update"}, backup));
  auto router = tollgate::routing::agent_router{std::move(registrations)};

  auto first = router.execute(make_command("exec-1"));
  EXPECT_FALSE(first.success);
  EXPECT_EQ(first.agent_id, std::optional<std::string>{"crm-1"});
  ASSERT_TRUE(first.failure.has_value());
  EXPECT_EQ(first.failure->code, tollgate::schema::error_code::executor_failure);

  auto second = router.execute(make_command("exec-2"));
  EXPECT_TRUE(second.success);
  EXPECT_EQ(second.agent_id, std::optional<std::string>{"crm-2"});
  EXPECT_EQ(failing->invocations(), 1u);
  EXPECT_EQ(backup->invocations(), 1u);

  auto agents = router.snapshot();
  EXPECT_TRUE(agents[0].isolated);
  EXPECT_EQ(agents[0].health, tollgate::schema::agent_health_t::unhealthy);
  EXPECT_EQ(agents[0].failure_count, 1u);
  EXPECT_TRUE(agents[0].last_error.has_value());
  EXPECT_EQ(agents[1].success_count, 1u);
}

TEST(agent_router, non_standard_throw_isolates_agent) {
  auto failing = std::make_shared<tollgate::testing::int_throwing_executor>();
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(make_agent("crm-1", {"crm.update"}, failing));
  auto router = tollgate::routing::agent_router{std::move(registrations)};

  auto outcome = tollgate::routing::routing_outcome{};
  EXPECT_NO_THROW(outcome = router.execute(make_command("exec-1")));
  EXPECT_FALSE(outcome.success);
  ASSERT_TRUE(outcome.failure.has_value());
  EXPECT_EQ(outcome.failure->code,
            tollgate::schema::error_code::executor_failure);

  auto agents = router.snapshot();
  EXPECT_TRUE(agents[0].isolated);
  EXPECT_EQ(agents[0].load, 0u);
  EXPECT_EQ(failing->invocations(), 1u);
}

TEST(agent_router, rehabilitate_restores_eligibility) {
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(make_agent("crm-1", {"crm.update"},
                                     std::make_shared<counting_executor>()));
  auto router = tollgate::routing::agent_router{std::move(registrations)};

  EXPECT_TRUE(router.isolate("crm-1", "maintenance"));
  EXPECT_FALSE(router.select("crm.update").has_value());
  EXPECT_EQ(router.execute(make_command("exec-1")).failure->code,
            tollgate::schema::error_code::no_available_agent);

  EXPECT_TRUE(router.rehabilitate("crm-1"));
  EXPECT_TRUE(router.select("crm.update").has_value());
  EXPECT_TRUE(router.execute(make_command("exec-2")).success);
  EXPECT_FALSE(router.rehabilitate("nobody"));
  EXPECT_FALSE(router.isolate("nobody", "n/a"));
}

TEST(agent_router, in_flight_limit_applies_backpressure) {
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(make_agent("crm-1", {"crm.update"},
                                     std::make_shared<counting_executor>(), 2));
  auto router = tollgate::routing::agent_router{std::move(registrations)};

  auto first = router.acquire("crm.update");
  auto second = router.acquire("crm.update");
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_FALSE(router.acquire("crm.update").has_value());
  EXPECT_EQ(router.snapshot()[0].load, 2u);

  first->release();
  EXPECT_FALSE(first->held());
  EXPECT_EQ(router.snapshot()[0].load, 1u);
  EXPECT_TRUE(router.acquire("crm.update").has_value());
}

TEST(agent_router, slot_is_released_on_every_exit_path) {
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(make_agent(
      "crm-1", {"crm.update"},
      std::make_shared<tollgate::testing::throwing_executor>()));
  auto router = tollgate::routing::agent_router{std::move(registrations)};

  {
    auto slot = router.acquire("crm.update");
    ASSERT_TRUE(slot.has_value());
    auto moved = std::move(*slot);
    EXPECT_FALSE(slot->held());
    EXPECT_TRUE(moved.held());
    EXPECT_EQ(router.snapshot()[0].load, 1u);
  }
  EXPECT_EQ(router.snapshot()[0].load, 0u);

  router.execute(make_command("exec-1"));
  EXPECT_EQ(router.snapshot()[0].load, 0u);
}

TEST(agent_router, busy_agent_is_skipped_for_concurrent_work) {
  auto gated = std::make_shared<tollgate::testing::gated_executor>();
  auto spare = std::make_shared<counting_executor>();
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(make_agent("crm-1", {"crm.update"}, gated));
  registrations.push_back(make_agent("crm-2", {"crm.update"}, spare));
  auto router = tollgate::routing::agent_router{std::move(registrations)};

  auto outcome = tollgate::routing::routing_outcome{};
  auto worker = std::thread{
      [&] { outcome = router.execute(make_command("exec-slow")); }};
  gated->wait_entered(1);

  auto fast = router.execute(make_command("exec-fast"));
  EXPECT_EQ(fast.agent_id, std::optional<std::string>{"crm-2"});

  gated->release();
  worker.join();
  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(outcome.agent_id, std::optional<std::string>{"crm-1"});
}

TEST(agent_router, pending_job_is_polled_to_completion) {
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(make_agent(
      "crm-1", {"crm.update"},
      std::make_shared<tollgate::testing::pending_executor>(2)));
  auto router = tollgate::routing::agent_router{
      std::move(registrations),
      {.max_attempts = 5, .interval = 1ms, .deadline = 5000ms}};

  auto outcome = router.execute(make_command("exec-1"));
  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(outcome.result, std::optional<std::string>{"finished remote-1"});
}

TEST(agent_router, poll_timeout_fails_and_isolates) {
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  registrations.push_back(make_agent(
      "crm-1", {"crm.update"},
      std::make_shared<tollgate::testing::pending_executor>(1000)));
  auto router = tollgate::routing::agent_router{
      std::move(registrations),
      {.max_attempts = 2, .interval = 1ms, .deadline = 5000ms}};

  auto outcome = router.execute(make_command("exec-1"));
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.failure->code, tollgate::schema::error_code::timeout);
  EXPECT_TRUE(router.snapshot()[0].isolated);
}

TEST(loopback_executor, result_depends_on_parameters) {
  auto executor = tollgate::routing::loopback_executor{};
  auto first = executor.execute("demo.echo", {{"message", "hello"}});
  auto second = executor.execute("demo.echo", {{"message", "world"}});
  ASSERT_TRUE(std::holds_alternative<tollgate::routing::job_done>(first));
  EXPECT_NE(std::get<tollgate::routing::job_done>(first).result,
            std::get<tollgate::routing::job_done>(second).result);
  EXPECT_EQ(std::get<tollgate::routing::job_done>(first).result.rfind("demo.echo:", 0),
            0u);
  EXPECT_EQ(executor.invocations(), 2u);
}

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <tollgate/common/clock.hpp>
#include <tollgate/config/settings.hpp>
#include <tollgate/execution/job_queue.hpp>
#include <tollgate/execution/orchestrator.hpp>
#include <tollgate/execution/worker_pool.hpp>
#include <tollgate/governance/approval_store.hpp>
#include <tollgate/governance/audit_trail.hpp>
#include <tollgate/governance/execution_registry.hpp>
#include <tollgate/governance/idempotency_index.hpp>
#include <tollgate/governance/write_gateway.hpp>
#include <tollgate/routing/agent_router.hpp>
#include <tollgate/routing/loopback_executor.hpp>
#include <tollgate/schema/encoding/scale/encoder.hpp>
#include <tollgate/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr auto kDemoKind = std::string_view{"demo.echo"};

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) { shutdown_requested() = true; }

void setup_logging(const tollgate::config::settings& settings) {
  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      settings.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "tollgate", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(settings.log_level));
}

std::vector<tollgate::routing::agent_registration> make_registrations(
    const tollgate::config::settings& settings) {
  auto registrations = std::vector<tollgate::routing::agent_registration>{};
  for (const auto& spec : settings.agents) {
    registrations.push_back(tollgate::routing::agent_registration{
        .agent_id = spec.agent_id,
        .capabilities = spec.capabilities,
        .max_in_flight = spec.max_in_flight,
        .executor = std::make_shared<tollgate::routing::loopback_executor>()});
  }
  if (registrations.empty() && settings.demo) {
    registrations.push_back(tollgate::routing::agent_registration{
        .agent_id = "loopback-1",
        .capabilities = {std::string{kDemoKind}},
        .max_in_flight = 1,
        .executor = std::make_shared<tollgate::routing::loopback_executor>()});
  }
  return registrations;
}

void run_demo(tollgate::execution::orchestrator& orchestrator) {
  auto stamp = std::to_string(tollgate::common::now_milliseconds());
  auto command = tollgate::schema::command_t{};
  command.command_id = "demo-command-" + stamp;
  command.execution_id = "demo-" + stamp;
  command.kind = std::string{kDemoKind};
  command.initiator = "tollgated";
  command.parameters = {{"message", "hello"}};

  auto response = orchestrator.request_write(command);
  spdlog::info("demo {} submitted: {}", response.execution_id, response.state);
  auto record = orchestrator.wait_for_terminal(command.execution_id,
                                               std::chrono::seconds{5});
  if (!record) {
    spdlog::warn("demo {} left no record", command.execution_id);
    return;
  }
  spdlog::info("demo {} finished {} {}", record->execution_id,
               tollgate::schema::to_string(record->state),
               record->result.value_or(
                   record->failure ? record->failure->reason : ""));
  for (const auto& event : orchestrator.audit_log(command.execution_id)) {
    spdlog::info("  audit #{} {} {}", event.event_id,
                 tollgate::schema::to_string(event.event_type), event.summary);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto loaded = tollgate::config::load_settings(argc, argv);
  if (loaded.show_help) {
    std::cout << loaded.help << std::endl;
    return 0;
  }
  if (loaded.code != 0) {
    std::cerr << "tollgated: " << loaded.log << std::endl;
    return 2;
  }
  const auto& settings = loaded.value;
  setup_logging(settings);

  auto encoder = tollgate::schema::encoding::scale_encoder_t{};
  auto storage = tollgate::storage::make_storage<
      tollgate::storage::rocksdb_storage_tag>(settings.db_path);

  auto approvals = tollgate::governance::approval_store{encoder, storage};
  auto audit = tollgate::governance::audit_trail{encoder, storage};
  auto idempotency = tollgate::governance::idempotency_index{encoder, storage};
  auto executions = tollgate::governance::execution_registry{encoder, storage};
  auto router = tollgate::routing::agent_router{make_registrations(settings),
                                                settings.poll};
  auto gateway = tollgate::governance::write_gateway{
      encoder, approvals, audit, idempotency, executions, router,
      settings.policy};

  auto queue = tollgate::execution::job_queue{settings.max_retries};
  auto orchestrator = tollgate::execution::orchestrator{
      gateway, approvals, audit, executions, queue, settings.dispatch_mode};
  auto pool =
      tollgate::execution::worker_pool{queue, gateway, settings.workers};
  pool.set_completion_callback(
      [&orchestrator](const tollgate::schema::write_result_t& result) {
        orchestrator.notify(result);
      });
  pool.start();
  if (auto recovered = orchestrator.recover(); recovered > 0) {
    spdlog::warn("re-dispatched {} execution(s) left over from the last run",
                 recovered);
  }

  spdlog::info("tollgated ready: {} agent(s), {} worker(s), dispatch {}",
               router.snapshot().size(), pool.size(),
               tollgate::schema::to_string(settings.dispatch_mode));
  if (settings.policy.safe_mode) {
    spdlog::warn("safe mode is on");
  }

  if (settings.demo) {
    run_demo(orchestrator);
  }

  while (!shutdown_requested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds{200});
  }

  spdlog::info("shutting down");
  router.cancel();
  pool.stop();
  spdlog::shutdown();
  return 0;
}

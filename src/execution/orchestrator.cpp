#include <tollgate/execution/orchestrator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace tollgate::execution {

namespace {

constexpr auto kCodespace = std::string_view{"tollgate.orchestrator"};
constexpr auto kProgressPollInterval = std::chrono::milliseconds{20};

}  // namespace

orchestrator::orchestrator(tollgate::governance::write_gateway& gateway,
                           tollgate::governance::approval_store& approvals,
                           tollgate::governance::audit_trail& audit,
                           tollgate::governance::execution_registry& executions,
                           job_queue& queue,
                           tollgate::schema::dispatch_mode_t mode)
    : gateway_{gateway},
      approvals_{approvals},
      audit_{audit},
      executions_{executions},
      queue_{queue},
      mode_{mode} {}

tollgate::schema::write_result_t orchestrator::submit_execution(
    const tollgate::schema::command_t& command) {
  auto result = gateway_.request_write(command);
  if (admitted(result)) {
    dispatch(result.execution_id);
    refresh(result);
  }
  return result;
}

write_response orchestrator::request_write(
    const tollgate::schema::command_t& command) {
  auto result = gateway_.request_write(command);
  auto response = write_response{};
  response.execution_id = result.execution_id;
  response.approval_id = result.approval_id;
  response.code = result.code;
  response.log = result.log;
  response.state =
      result.record
          ? std::string{tollgate::governance::public_state(*result.record)}
          : std::string{"REJECTED"};
  if (admitted(result)) {
    dispatch(result.execution_id);
  }
  return response;
}

tollgate::schema::write_result_t orchestrator::decide_approval(
    std::string_view approval_id,
    const tollgate::schema::approval_outcome_t outcome,
    std::string_view decided_by) {
  auto result = gateway_.decide_approval(approval_id, outcome, decided_by);
  if (result.code == 0 && result.record &&
      result.record->state == tollgate::schema::execution_state_t::approved) {
    dispatch(result.execution_id);
    refresh(result);
  }
  notify(result);
  return result;
}

std::size_t orchestrator::recover() {
  auto ids = executions_.list_in_state(
      tollgate::schema::execution_state_t::received);
  auto approved = executions_.list_in_state(
      tollgate::schema::execution_state_t::approved);
  ids.insert(std::end(ids), std::make_move_iterator(std::begin(approved)),
             std::make_move_iterator(std::end(approved)));

  auto recovered = std::size_t{0};
  for (const auto& execution_id : ids) {
    auto record = executions_.get(execution_id);
    if (!record || !tollgate::governance::is_dispatchable(*record)) {
      continue;
    }
    spdlog::info("recovering undispatched execution {} ({})", execution_id,
                 tollgate::governance::public_state(*record));
    dispatch(execution_id);
    ++recovered;
  }
  return recovered;
}

std::optional<tollgate::schema::execution_record_t>
orchestrator::execution_status(std::string_view execution_id) const {
  return executions_.get(execution_id);
}

tollgate::schema::write_result_t orchestrator::get_status(
    std::string_view execution_id) const {
  auto result = tollgate::schema::write_result_t{};
  result.codespace = std::string{kCodespace};
  result.execution_id = std::string{execution_id};
  result.record = executions_.get(execution_id);
  if (!result.record) {
    result.code = tollgate::schema::to_code(
        tollgate::schema::error_code::execution_not_found);
    result.log = "execution not found";
    return result;
  }
  result.approval_id = result.record->approval_id;
  if (result.record->failure) {
    result.code = tollgate::schema::to_code(result.record->failure->code);
    result.log = result.record->failure->reason;
  }
  return result;
}

std::vector<tollgate::schema::approval_record_t>
orchestrator::pending_approvals() const {
  return approvals_.list_pending();
}

std::vector<tollgate::schema::audit_event_t> orchestrator::audit_log(
    std::string_view execution_id) const {
  return audit_.events(execution_id);
}

std::optional<tollgate::schema::execution_record_t>
orchestrator::wait_for_terminal(std::string_view execution_id,
                                const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto record = executions_.get(execution_id);
  while (!record || !tollgate::schema::is_terminal(record->state)) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    {
      auto lock = std::unique_lock{progress_mutex_};
      progress_.wait_for(
          lock, std::min<std::chrono::steady_clock::duration>(
                    kProgressPollInterval, deadline - now));
    }
    record = executions_.get(execution_id);
  }
  return record;
}

void orchestrator::notify(const tollgate::schema::write_result_t& result) {
  spdlog::debug("progress on {}", result.execution_id);
  progress_.notify_all();
}

bool orchestrator::admitted(const tollgate::schema::write_result_t& result) {
  return result.code == 0 && result.record &&
         tollgate::governance::is_dispatchable(*result.record);
}

void orchestrator::refresh(tollgate::schema::write_result_t& result) const {
  if (mode_ != tollgate::schema::dispatch_mode_t::synchronous) {
    return;
  }
  if (auto record = executions_.get(result.execution_id)) {
    if (record->failure) {
      result.code = tollgate::schema::to_code(record->failure->code);
      result.log = record->failure->reason;
    }
    result.record = std::move(record);
  }
}

void orchestrator::dispatch(const std::string& execution_id) {
  if (mode_ == tollgate::schema::dispatch_mode_t::synchronous) {
    auto committed = gateway_.commit_write(execution_id, true);
    notify(committed);
    return;
  }
  auto job_id = queue_.enqueue(execution_id);
  spdlog::info("execution {} queued as {}", execution_id, job_id);
}

}  // namespace tollgate::execution

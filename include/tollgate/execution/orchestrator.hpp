#pragma once

#include <tollgate/execution/job_queue.hpp>
#include <tollgate/governance/approval_store.hpp>
#include <tollgate/governance/audit_trail.hpp>
#include <tollgate/governance/execution_registry.hpp>
#include <tollgate/governance/write_gateway.hpp>
#include <tollgate/schema/approval_outcome.hpp>
#include <tollgate/schema/approval_record.hpp>
#include <tollgate/schema/audit_event.hpp>
#include <tollgate/schema/command.hpp>
#include <tollgate/schema/dispatch_mode.hpp>
#include <tollgate/schema/execution_record.hpp>
#include <tollgate/schema/write_result.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::execution {

/// Caller-facing answer to a write request.
struct write_response final {
  std::string execution_id;
  /// BLOCKED, ALLOWED or REJECTED at submission time.
  std::string state;
  std::optional<std::string> approval_id;
  uint32_t code{};
  std::string log;
};

/// Top-level coordinator for the request layer. Owns no policy: every
/// decision is the gateway's, every dispatch goes through the queue (or
/// inline in synchronous mode).
class orchestrator final {
 public:
  orchestrator(tollgate::governance::write_gateway& gateway,
               tollgate::governance::approval_store& approvals,
               tollgate::governance::audit_trail& audit,
               tollgate::governance::execution_registry& executions,
               job_queue& queue,
               tollgate::schema::dispatch_mode_t mode =
                   tollgate::schema::dispatch_mode_t::async);

  /// Evaluate and record the command; admitted commands are dispatched.
  tollgate::schema::write_result_t submit_execution(
      const tollgate::schema::command_t& command);

  write_response request_write(const tollgate::schema::command_t& command);

  /// Decide an approval; an approved execution is dispatched.
  tollgate::schema::write_result_t decide_approval(
      std::string_view approval_id,
      tollgate::schema::approval_outcome_t outcome,
      std::string_view decided_by = "operator");

  /// Dispatch every admitted execution that never reached an agent, such as
  /// one whose queued job was lost when the process stopped. Returns the
  /// number of executions dispatched.
  std::size_t recover();

  std::optional<tollgate::schema::execution_record_t> execution_status(
      std::string_view execution_id) const;

  /// Same as execution_status, wrapped in a result with EXECUTION_NOT_FOUND
  /// for unknown ids.
  tollgate::schema::write_result_t get_status(
      std::string_view execution_id) const;

  std::vector<tollgate::schema::approval_record_t> pending_approvals() const;
  std::vector<tollgate::schema::audit_event_t> audit_log(
      std::string_view execution_id) const;

  /// Block until the execution is COMPLETED or FAILED, or the timeout
  /// expires. Returns the last observed record.
  std::optional<tollgate::schema::execution_record_t> wait_for_terminal(
      std::string_view execution_id,
      std::chrono::milliseconds timeout);

  /// Wake waiters after a worker finished a job.
  void notify(const tollgate::schema::write_result_t& result);

  tollgate::schema::dispatch_mode_t mode() const { return mode_; }

 private:
  static bool admitted(const tollgate::schema::write_result_t& result);
  /// In synchronous mode, reload the record after the inline commit.
  void refresh(tollgate::schema::write_result_t& result) const;
  void dispatch(const std::string& execution_id);

  tollgate::governance::write_gateway& gateway_;
  tollgate::governance::approval_store& approvals_;
  tollgate::governance::audit_trail& audit_;
  tollgate::governance::execution_registry& executions_;
  job_queue& queue_;
  tollgate::schema::dispatch_mode_t mode_;
  std::mutex progress_mutex_;
  std::condition_variable progress_;
};

}  // namespace tollgate::execution

#pragma once

#include <tollgate/governance/approval_store.hpp>
#include <tollgate/governance/audit_trail.hpp>
#include <tollgate/governance/execution_lock_table.hpp>
#include <tollgate/governance/execution_registry.hpp>
#include <tollgate/governance/idempotency_index.hpp>
#include <tollgate/governance/policy.hpp>
#include <tollgate/routing/agent_router.hpp>
#include <tollgate/schema/approval_outcome.hpp>
#include <tollgate/schema/command.hpp>
#include <tollgate/schema/encoding/scale/encoder.hpp>
#include <tollgate/schema/write_result.hpp>

#include <mutex>
#include <string_view>

namespace tollgate::governance {

struct gateway_flags final {
  bool safe_mode{false};
  bool credential_enforcement{false};
};

/// Single mediator for every write.
///
/// Policy evaluation, approval issuance and consumption, commit dispatch and
/// audit emission all happen here. Work on one execution_id is serialized by
/// the lock table, so unrelated executions never wait on each other's commit.
/// The approval store and audit trail still take short process-wide critical
/// sections to allocate sequence numbers.
class write_gateway final {
 public:
  write_gateway(tollgate::schema::encoding::scale_encoder_t& encoder,
                approval_store& approvals,
                audit_trail& audit,
                idempotency_index& idempotency,
                execution_registry& executions,
                tollgate::routing::agent_router& router,
                policy_config config);

  /// Validate, evaluate policy and record the execution. The returned record
  /// is BLOCKED with an approval, RECEIVED with verdict ALLOWED, or FAILED
  /// with verdict REJECTED.
  tollgate::schema::write_result_t request_write(
      const tollgate::schema::command_t& command);

  /// Apply an operator decision to the approval and its execution.
  tollgate::schema::write_result_t decide_approval(
      std::string_view approval_id,
      tollgate::schema::approval_outcome_t outcome,
      std::string_view decided_by);

  /// Dispatch an eligible execution exactly once.
  ///
  /// When no agent is available and `final_attempt` is false the record is
  /// left unchanged and the result is marked retryable.
  tollgate::schema::write_result_t commit_write(std::string_view execution_id,
                                                bool final_attempt = true);

  void set_safe_mode(bool enabled);
  gateway_flags flags() const;

 private:
  tollgate::schema::write_result_t replay(
      const tollgate::schema::execution_record_t& record,
      std::string_view summary);
  tollgate::schema::write_result_t fail(
      tollgate::schema::execution_record_t& record,
      tollgate::schema::error_code code,
      std::string_view reason,
      tollgate::schema::audit_event_type_t event_type);
  tollgate::schema::write_result_t refuse(
      std::string_view execution_id,
      tollgate::schema::error_code code,
      std::string log);
  policy_config config_snapshot() const;

  tollgate::schema::encoding::scale_encoder_t& encoder_;
  approval_store& approvals_;
  audit_trail& audit_;
  idempotency_index& idempotency_;
  execution_registry& executions_;
  tollgate::routing::agent_router& router_;
  execution_lock_table locks_;
  mutable std::mutex config_mutex_;
  policy_config config_;
};

/// Caller-facing state name: REJECTED for a policy refusal, ALLOWED for an
/// admitted execution awaiting dispatch, otherwise the execution state.
std::string_view public_state(
    const tollgate::schema::execution_record_t& record);

/// True for an execution that may be committed and has not been dispatched
/// yet: RECEIVED with an ALLOWED verdict, or APPROVED.
bool is_dispatchable(const tollgate::schema::execution_record_t& record);

/// Fingerprint of a command, excluding the presented credential.
tollgate::schema::hash32_t command_digest(
    tollgate::schema::encoding::scale_encoder_t& encoder,
    const tollgate::schema::command_t& command);

}  // namespace tollgate::governance

#include <tollgate/blake3/hash.hpp>
#include <tollgate/common/clock.hpp>
#include <tollgate/common/critical.hpp>
#include <tollgate/governance/write_gateway.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <utility>

namespace tollgate::governance {

namespace {

constexpr auto kCodespace = std::string_view{"tollgate.gateway"};

using tollgate::schema::audit_event_type_t;
using tollgate::schema::error_code;
using tollgate::schema::execution_state_t;

bool usable_execution_id(std::string_view execution_id) {
  return !execution_id.empty() &&
         execution_id.find('|') == std::string_view::npos;
}

/// Reason the command is malformed, or nullopt when it is well formed.
std::optional<std::string> validate(const tollgate::schema::command_t& command) {
  if (command.command_id.empty()) {
    return "command_id is required";
  }
  if (command.kind.empty()) {
    return "kind is required";
  }
  if (command.initiator.empty()) {
    return "initiator is required";
  }
  auto dot = command.kind.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == command.kind.size() ||
      command.kind.find('|') != std::string::npos) {
    return "kind must be <system>.<action>";
  }
  return std::nullopt;
}

tollgate::schema::command_t without_credential(
    const tollgate::schema::command_t& command) {
  auto stored = command;
  stored.credential.reset();
  return stored;
}

tollgate::schema::write_result_t make_result(
    const tollgate::schema::execution_record_t& record) {
  auto result = tollgate::schema::write_result_t{};
  result.codespace = std::string{kCodespace};
  result.execution_id = record.execution_id;
  result.approval_id = record.approval_id;
  if (record.failure) {
    result.code = tollgate::schema::to_code(record.failure->code);
    result.log = record.failure->reason;
  }
  result.record = record;
  return result;
}

}  // namespace

std::string_view public_state(
    const tollgate::schema::execution_record_t& record) {
  if (record.verdict == tollgate::schema::policy_verdict_t::rejected) {
    return "REJECTED";
  }
  if (record.state == execution_state_t::received &&
      record.verdict == tollgate::schema::policy_verdict_t::allowed) {
    return "ALLOWED";
  }
  return tollgate::schema::to_string(record.state);
}

bool is_dispatchable(const tollgate::schema::execution_record_t& record) {
  if (record.state == execution_state_t::approved) {
    return true;
  }
  return record.state == execution_state_t::received &&
         record.verdict == tollgate::schema::policy_verdict_t::allowed;
}

tollgate::schema::hash32_t command_digest(
    tollgate::schema::encoding::scale_encoder_t& encoder,
    const tollgate::schema::command_t& command) {
  auto encoded = encoder.encode(without_credential(command));
  return tollgate::blake3::hash(tollgate::schema::bytes_view_t{encoded});
}

write_gateway::write_gateway(
    tollgate::schema::encoding::scale_encoder_t& encoder,
    approval_store& approvals,
    audit_trail& audit,
    idempotency_index& idempotency,
    execution_registry& executions,
    tollgate::routing::agent_router& router,
    policy_config config)
    : encoder_{encoder},
      approvals_{approvals},
      audit_{audit},
      idempotency_{idempotency},
      executions_{executions},
      router_{router},
      config_{std::move(config)} {}

tollgate::schema::write_result_t write_gateway::request_write(
    const tollgate::schema::command_t& command) {
  if (!usable_execution_id(command.execution_id)) {
    spdlog::warn("rejected command {} with unusable execution_id",
                 command.command_id);
    return refuse(command.execution_id, error_code::invalid_command,
                  "execution_id must be non-empty and must not contain '|'");
  }

  auto guard = locks_.lock(command.execution_id);
  const auto& execution_id = command.execution_id;
  auto stored_command = without_credential(command);
  auto encoded_command = encoder_.encode(stored_command);
  auto digest = tollgate::blake3::hash(
      tollgate::schema::bytes_view_t{encoded_command});

  if (auto existing = executions_.get(execution_id)) {
    if (existing->command_digest == digest) {
      return replay(*existing, "request_replay");
    }
    audit_.append(execution_id, audit_event_type_t::rejected,
                  "execution_id_reused", encoded_command);
    return refuse(execution_id, error_code::invalid_command,
                  "execution_id reused with a different command");
  }

  if (auto problem = validate(command)) {
    audit_.append(execution_id, audit_event_type_t::received,
                  fmt::format("kind={} initiator={}", command.kind,
                              command.initiator),
                  encoded_command);
    audit_.append(execution_id, audit_event_type_t::rejected,
                  "invalid_command: " + *problem, encoded_command);
    spdlog::warn("execution {} rejected: {}", execution_id, *problem);
    return refuse(execution_id, error_code::invalid_command, *problem);
  }

  audit_.append(
      execution_id, audit_event_type_t::received,
      fmt::format("kind={} initiator={}", command.kind, command.initiator),
      encoded_command);

  auto config = config_snapshot();
  auto initiator = resolve_initiator(command, config);
  auto decision = evaluate_policy(initiator, command, config);
  audit_.append(execution_id, audit_event_type_t::policy_eval,
                fmt::format("verdict={} reason={} tier={}",
                            tollgate::schema::to_string(decision.verdict),
                            decision.reason,
                            tollgate::schema::to_string(decision.tier)),
                encoded_command);

  auto now = tollgate::common::now_milliseconds();
  auto record = tollgate::schema::execution_record_t{};
  record.execution_id = execution_id;
  record.command_id = command.command_id;
  record.kind = command.kind;
  record.state = execution_state_t::received;
  record.verdict = decision.verdict;
  record.command_digest = digest;
  record.created_at = now;
  record.updated_at = now;
  executions_.create(stored_command, record);

  switch (decision.verdict) {
    case tollgate::schema::policy_verdict_t::rejected:
      return fail(record, error_code::policy_denied, decision.reason,
                  audit_event_type_t::rejected);
    case tollgate::schema::policy_verdict_t::blocked: {
      auto approval = approvals_.create(execution_id);
      record.approval_id = approval.approval_id;
      if (!executions_.advance(record, execution_state_t::blocked)) {
        tollgate::common::critical("write_gateway",
                                   "new execution could not be blocked",
                                   execution_id);
      }
      audit_.append(execution_id, audit_event_type_t::approval_required,
                    fmt::format("approval_id={} reason={}",
                                approval.approval_id, decision.reason),
                    encoder_.encode(record));
      return make_result(record);
    }
    case tollgate::schema::policy_verdict_t::allowed:
    default:
      spdlog::info("execution {} allowed ({})", execution_id, decision.reason);
      return make_result(record);
  }
}

tollgate::schema::write_result_t write_gateway::decide_approval(
    std::string_view approval_id,
    const tollgate::schema::approval_outcome_t outcome,
    std::string_view decided_by) {
  auto approval = approvals_.get(approval_id);
  if (!approval) {
    return refuse({}, error_code::approval_not_found,
                  "approval not found: " + std::string{approval_id});
  }

  const auto& execution_id = approval->execution_id;
  auto guard = locks_.lock(execution_id);
  auto decided = approvals_.decide(approval_id, outcome, decided_by);
  auto record = executions_.get(execution_id);
  if (!record) {
    tollgate::common::critical("write_gateway",
                               "approval refers to a missing execution",
                               execution_id);
  }

  if (decided.code != 0) {
    audit_.append(execution_id, audit_event_type_t::idempotent_replay,
                  fmt::format("approval_conflict approval_id={}", approval_id),
                  encoder_.encode(*record));
    auto result = refuse(execution_id, error_code::approval_conflict,
                         decided.log);
    result.approval_id = std::string{approval_id};
    result.record = std::move(record);
    return result;
  }

  if (outcome == tollgate::schema::approval_outcome_t::reject) {
    return fail(*record, error_code::approval_rejected, "approval_rejected",
                audit_event_type_t::rejected);
  }

  if (!executions_.advance(*record, execution_state_t::approved)) {
    audit_.append(execution_id, audit_event_type_t::rejected,
                  fmt::format("decision_refused state={}",
                              tollgate::schema::to_string(record->state)),
                  encoder_.encode(*record));
    auto result = refuse(execution_id, error_code::invalid_state,
                         "execution is not awaiting approval");
    result.record = std::move(record);
    return result;
  }
  audit_.append(execution_id, audit_event_type_t::approved,
                fmt::format("approval_id={} decided_by={}", approval_id,
                            decided_by),
                encoder_.encode(*record));
  return make_result(*record);
}

tollgate::schema::write_result_t write_gateway::commit_write(
    std::string_view execution_id,
    const bool final_attempt) {
  auto guard = locks_.lock(execution_id);

  if (auto entry = idempotency_.get(execution_id)) {
    if (is_terminal(*entry)) {
      return replay(*entry->outcome, "commit_replay");
    }
    // A dispatch started but its outcome was never recorded. The side effect
    // may have happened, so it is not attempted again.
    auto record = executions_.get(execution_id);
    if (!record) {
      tollgate::common::critical("write_gateway",
                                 "idempotency entry without execution",
                                 execution_id);
    }
    spdlog::error("execution {} has an unfinished dispatch", execution_id);
    return fail(*record, error_code::idempotency_in_progress,
                "outcome_unknown", audit_event_type_t::failed);
  }

  auto record = executions_.get(execution_id);
  if (!record) {
    return refuse(execution_id, error_code::execution_not_found,
                  "execution not found: " + std::string{execution_id});
  }
  if (tollgate::schema::is_terminal(record->state)) {
    return replay(*record, "commit_replay");
  }

  auto eligible = record->state == execution_state_t::approved ||
                  (record->state == execution_state_t::received &&
                   record->verdict ==
                       tollgate::schema::policy_verdict_t::allowed);
  if (!eligible) {
    audit_.append(execution_id, audit_event_type_t::rejected,
                  fmt::format("commit_refused state={}",
                              tollgate::schema::to_string(record->state)),
                  encoder_.encode(*record));
    spdlog::warn("commit refused for {} in state {}", execution_id,
                 tollgate::schema::to_string(record->state));
    auto result = refuse(execution_id, error_code::invalid_state,
                         "execution is not eligible for dispatch");
    result.approval_id = record->approval_id;
    result.record = std::move(record);
    return result;
  }

  auto command = executions_.command(execution_id);
  if (!command) {
    tollgate::common::critical("write_gateway",
                               "execution without stored command",
                               execution_id);
  }

  auto slot = router_.acquire(record->kind);
  if (!slot) {
    if (!final_attempt) {
      audit_.append(execution_id, audit_event_type_t::retry_scheduled,
                    "no_available_agent", encoder_.encode(*record));
      auto result = refuse(execution_id, error_code::no_available_agent,
                           "no_available_agent");
      result.retryable = true;
      result.approval_id = record->approval_id;
      result.record = std::move(record);
      return result;
    }
    return fail(*record, error_code::no_available_agent, "no_available_agent",
                audit_event_type_t::failed);
  }

  if (!idempotency_.begin(execution_id)) {
    tollgate::common::critical("write_gateway",
                               "idempotency entry appeared during dispatch",
                               execution_id);
  }
  record->attempt_count += 1;
  record->agent_id = slot->agent_id();
  if (!executions_.advance(*record, execution_state_t::dispatched)) {
    tollgate::common::critical("write_gateway",
                               "eligible execution could not be dispatched",
                               execution_id);
  }

  auto outcome = router_.execute(*command, std::move(*slot));
  if (!outcome.success) {
    auto failure =
        outcome.failure.value_or(tollgate::schema::execution_failure_t{});
    return fail(*record, failure.code, failure.reason,
                audit_event_type_t::failed);
  }

  record->result = outcome.result;
  if (!executions_.advance(*record, execution_state_t::completed)) {
    tollgate::common::critical("write_gateway",
                               "dispatched execution could not complete",
                               execution_id);
  }
  idempotency_.complete(*record);
  audit_.append(execution_id, audit_event_type_t::applied,
                fmt::format("agent={}", record->agent_id.value_or("")),
                encoder_.encode(*record));
  spdlog::info("execution {} completed by {}", execution_id,
               record->agent_id.value_or(""));
  return make_result(*record);
}

void write_gateway::set_safe_mode(const bool enabled) {
  auto lock = std::scoped_lock{config_mutex_};
  config_.safe_mode = enabled;
  spdlog::warn("safe mode {}", enabled ? "enabled" : "disabled");
}

gateway_flags write_gateway::flags() const {
  auto lock = std::scoped_lock{config_mutex_};
  return gateway_flags{.safe_mode = config_.safe_mode,
                       .credential_enforcement = config_.credential_enforcement};
}

tollgate::schema::write_result_t write_gateway::replay(
    const tollgate::schema::execution_record_t& record,
    std::string_view summary) {
  audit_.append(record.execution_id, audit_event_type_t::idempotent_replay,
                fmt::format("{} state={}", summary,
                            tollgate::schema::to_string(record.state)),
                encoder_.encode(record));
  spdlog::info("execution {} replayed ({})", record.execution_id, summary);
  return make_result(record);
}

tollgate::schema::write_result_t write_gateway::fail(
    tollgate::schema::execution_record_t& record,
    const tollgate::schema::error_code code,
    std::string_view reason,
    const tollgate::schema::audit_event_type_t event_type) {
  record.failure = tollgate::schema::execution_failure_t{
      .code = code, .reason = std::string{reason}};
  if (!executions_.advance(record, execution_state_t::failed)) {
    tollgate::common::critical("write_gateway",
                               "execution could not be failed",
                               record.execution_id);
  }
  idempotency_.complete(record);
  audit_.append(record.execution_id, event_type,
                fmt::format("{}: {}", tollgate::schema::to_string(code), reason),
                encoder_.encode(record));
  spdlog::warn("execution {} failed with {}: {}", record.execution_id,
               tollgate::schema::to_string(code), reason);
  return make_result(record);
}

tollgate::schema::write_result_t write_gateway::refuse(
    std::string_view execution_id,
    const tollgate::schema::error_code code,
    std::string log) {
  auto result = tollgate::schema::write_result_t{};
  result.code = tollgate::schema::to_code(code);
  result.log = std::move(log);
  result.codespace = std::string{kCodespace};
  result.execution_id = std::string{execution_id};
  return result;
}

policy_config write_gateway::config_snapshot() const {
  auto lock = std::scoped_lock{config_mutex_};
  return config_;
}

}  // namespace tollgate::governance

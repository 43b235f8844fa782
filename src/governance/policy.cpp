#include <tollgate/crypto/credential.hpp>
#include <tollgate/governance/policy.hpp>

namespace tollgate::governance {

namespace {

tollgate::schema::policy_decision_t decide(
    const tollgate::schema::policy_verdict_t verdict,
    std::string_view reason,
    const tollgate::schema::initiator_tier_t tier) {
  return tollgate::schema::policy_decision_t{
      .verdict = verdict, .reason = std::string{reason}, .tier = tier};
}

tollgate::schema::policy_decision_t evaluate_privileged(
    const tollgate::schema::initiator_context_t& initiator,
    const tollgate::schema::command_t& command,
    const policy_config& config) {
  using enum tollgate::schema::policy_verdict_t;
  constexpr auto tier = tollgate::schema::initiator_tier_t::privileged;
  if (config.credential_enforcement) {
    auto presented = initiator.credential.value_or(std::string{});
    if (!tollgate::crypto::credential_matches(presented,
                                              config.privileged_token)) {
      return decide(rejected, kReasonPrivilegedCredentialInvalid, tier);
    }
  }
  if (config.privileged_denied_kinds.contains(command.kind)) {
    return decide(rejected, kReasonPrivilegedKindDenied, tier);
  }
  if (command.requires_approval) {
    return decide(blocked, kReasonApprovalRequested, tier);
  }
  return decide(allowed, kReasonAllowed, tier);
}

tollgate::schema::policy_decision_t evaluate_standard(
    const tollgate::schema::command_t& command,
    const policy_config& config) {
  using enum tollgate::schema::policy_verdict_t;
  constexpr auto tier = tollgate::schema::initiator_tier_t::standard;
  if (config.safe_mode && !command.read_only) {
    return decide(rejected, kReasonSafeMode, tier);
  }
  if (config.denied_kinds.contains(command.kind)) {
    return decide(rejected, kReasonKindDenied, tier);
  }
  if (!config.allowed_kinds.empty() &&
      !config.allowed_kinds.contains(command.kind)) {
    return decide(rejected, kReasonKindNotAllowed, tier);
  }
  if (command.read_only && !command.requires_approval) {
    return decide(allowed, kReasonReadOnly, tier);
  }
  if (command.requires_approval) {
    return decide(blocked, kReasonApprovalRequested, tier);
  }
  if (config.approval_required_by_default ||
      config.approval_required_kinds.contains(command.kind)) {
    return decide(blocked, kReasonApprovalRequired, tier);
  }
  return decide(allowed, kReasonAllowed, tier);
}

}  // namespace

tollgate::schema::initiator_context_t resolve_initiator(
    const tollgate::schema::command_t& command,
    const policy_config& config) {
  auto context = tollgate::schema::initiator_context_t{};
  context.initiator = command.initiator;
  context.credential = command.credential;
  context.tier = config.privileged_initiators.contains(command.initiator)
                     ? tollgate::schema::initiator_tier_t::privileged
                     : tollgate::schema::initiator_tier_t::standard;
  return context;
}

tollgate::schema::policy_decision_t evaluate_policy(
    const tollgate::schema::initiator_context_t& initiator,
    const tollgate::schema::command_t& command,
    const policy_config& config) {
  if (initiator.tier == tollgate::schema::initiator_tier_t::privileged) {
    return evaluate_privileged(initiator, command, config);
  }
  return evaluate_standard(command, config);
}

}  // namespace tollgate::governance

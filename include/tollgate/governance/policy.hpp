#pragma once

#include <tollgate/schema/command.hpp>
#include <tollgate/schema/initiator_context.hpp>
#include <tollgate/schema/policy_decision.hpp>

#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace tollgate::governance {

/// Runtime governance flags and kind lists.
struct policy_config final {
  bool safe_mode{false};
  bool credential_enforcement{false};
  std::string privileged_token;
  std::set<std::string, std::less<>> privileged_initiators;
  std::set<std::string, std::less<>> privileged_denied_kinds;
  std::set<std::string, std::less<>> denied_kinds;
  std::set<std::string, std::less<>> allowed_kinds;
  std::set<std::string, std::less<>> approval_required_kinds;
  bool approval_required_by_default{false};
};

inline constexpr auto kReasonPrivilegedCredentialInvalid =
    std::string_view{"privileged_credential_invalid"};
inline constexpr auto kReasonPrivilegedKindDenied =
    std::string_view{"privileged_kind_denied"};
inline constexpr auto kReasonSafeMode = std::string_view{"safe_mode_enabled"};
inline constexpr auto kReasonKindDenied = std::string_view{"kind_denied"};
inline constexpr auto kReasonKindNotAllowed =
    std::string_view{"kind_not_allowed"};
inline constexpr auto kReasonApprovalRequested =
    std::string_view{"approval_requested"};
inline constexpr auto kReasonApprovalRequired =
    std::string_view{"approval_required"};
inline constexpr auto kReasonReadOnly = std::string_view{"read_only"};
inline constexpr auto kReasonAllowed = std::string_view{"allowed"};

/// Resolve the caller's privilege tier once per request.
tollgate::schema::initiator_context_t resolve_initiator(
    const tollgate::schema::command_t& command,
    const policy_config& config);

/// Pure policy evaluation.
///
/// Privileged initiators are checked only against privilege-scoped rules and
/// never reach the blanket restrictions (safe mode, deny and allow lists).
/// Standard initiators meet the blanket restrictions first, then the approval
/// rules.
tollgate::schema::policy_decision_t evaluate_policy(
    const tollgate::schema::initiator_context_t& initiator,
    const tollgate::schema::command_t& command,
    const policy_config& config);

}  // namespace tollgate::governance

#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit event type.
// Causal order per execution: received, policy_eval, then approval_required,
// approved, and finally applied or failed. Replays may follow any of them.
namespace tollgate::schema {

enum class audit_event_type_t : uint16_t {
  received = 1,
  policy_eval = 2,
  rejected = 3,
  approval_required = 4,
  approved = 5,
  applied = 6,
  failed = 7,
  idempotent_replay = 8,
  retry_scheduled = 9,
};

inline constexpr auto kAuditEventTypeMappings = std::array{
    enum_mapping_t<audit_event_type_t>{"RECEIVED",
                                       audit_event_type_t::received},
    enum_mapping_t<audit_event_type_t>{"POLICY_EVAL",
                                       audit_event_type_t::policy_eval},
    enum_mapping_t<audit_event_type_t>{"REJECTED",
                                       audit_event_type_t::rejected},
    enum_mapping_t<audit_event_type_t>{"APPROVAL_REQUIRED",
                                       audit_event_type_t::approval_required},
    enum_mapping_t<audit_event_type_t>{"APPROVED",
                                       audit_event_type_t::approved},
    enum_mapping_t<audit_event_type_t>{"APPLIED", audit_event_type_t::applied},
    enum_mapping_t<audit_event_type_t>{"FAILED", audit_event_type_t::failed},
    enum_mapping_t<audit_event_type_t>{"IDEMPOTENT_REPLAY",
                                       audit_event_type_t::idempotent_replay},
    enum_mapping_t<audit_event_type_t>{"RETRY_SCHEDULED",
                                       audit_event_type_t::retry_scheduled},
};

template <>
inline std::optional<audit_event_type_t> try_from_string<audit_event_type_t>(
    const std::string_view value) {
  return from_string(value, kAuditEventTypeMappings);
}

inline constexpr std::string_view to_string(const audit_event_type_t value) {
  return to_string(value, kAuditEventTypeMappings).value_or("unknown");
}

}  // namespace tollgate::schema

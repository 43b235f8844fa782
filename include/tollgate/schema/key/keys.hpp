#pragma once

#include <tollgate/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema key layout.
// Keys are raw bytes: an ASCII prefix, the identifier, and for ordered
// collections a big-endian sequence so that prefix scans return insertion
// order. Identifiers never contain the '|' separator.
namespace tollgate::schema::key {

inline constexpr std::string_view kApprovalKeyPrefix{"APPROVAL|"};
inline constexpr std::string_view kApprovalExecutionKeyPrefix{
    "APPROVAL_EXEC|"};
inline constexpr std::string_view kAuditKeyPrefix{"AUDIT|"};
inline constexpr std::string_view kIdempotencyKeyPrefix{"IDEMPOTENCY|"};
inline constexpr std::string_view kExecutionKeyPrefix{"EXECUTION|"};
inline constexpr std::string_view kCommandKeyPrefix{"COMMAND|"};
inline constexpr std::string_view kSequenceKeyPrefix{"SYS|SEQ|"};

inline constexpr std::string_view kApprovalSequenceName{"APPROVAL"};
inline constexpr std::string_view kAuditSequenceName{"AUDIT"};

inline constexpr auto kKeyspaces = std::array{
    kApprovalKeyPrefix,  kApprovalExecutionKeyPrefix, kAuditKeyPrefix,
    kIdempotencyKeyPrefix, kExecutionKeyPrefix,       kCommandKeyPrefix,
    kSequenceKeyPrefix};

tollgate::schema::bytes_t make_prefix_key(std::string_view prefix);
tollgate::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                            std::string_view id);

tollgate::schema::bytes_t make_approval_key(std::string_view approval_id);
tollgate::schema::bytes_t make_approval_execution_key(
    std::string_view execution_id);
tollgate::schema::bytes_t make_execution_key(std::string_view execution_id);
tollgate::schema::bytes_t make_command_key(std::string_view execution_id);
tollgate::schema::bytes_t make_idempotency_key(std::string_view execution_id);
tollgate::schema::bytes_t make_sequence_key(std::string_view name);

/// Scan prefix covering every audit event of one execution.
tollgate::schema::bytes_t make_audit_prefix(std::string_view execution_id);
tollgate::schema::bytes_t make_audit_key(std::string_view execution_id,
                                         uint64_t sequence);

tollgate::schema::bytes_t encode_sequence(uint64_t value);
uint64_t decode_sequence(const tollgate::schema::bytes_view_t& bytes);

}  // namespace tollgate::schema::key

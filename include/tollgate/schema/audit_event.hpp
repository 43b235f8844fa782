#pragma once

#include <tollgate/schema/audit_event_type.hpp>
#include <tollgate/schema/primitives.hpp>

#include <string>

// Schema type: audit event.
// Append-only. event_id is a process-wide sequence; payload_digest is the
// BLAKE3 hash of the encoded event payload.
namespace tollgate::schema {

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  std::string execution_id;
  audit_event_type_t event_type{audit_event_type_t::received};
  timestamp_milliseconds_t timestamp{};
  std::string summary;
  hash32_t payload_digest{};
};

using audit_event_t = audit_event<1>;

}  // namespace tollgate::schema

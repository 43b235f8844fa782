#pragma once

#include <tollgate/schema/approval_status.hpp>
#include <tollgate/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: approval record.
// At most one per execution_id. Mutated only by a decision; never deleted.
namespace tollgate::schema {

template <uint16_t Version>
struct approval_record;

template <>
struct approval_record<1> final {
  uint16_t version{1};
  std::string approval_id;
  std::string execution_id;
  approval_status_t status{approval_status_t::pending};
  timestamp_milliseconds_t created_at{};
  std::optional<timestamp_milliseconds_t> decided_at;
  std::optional<std::string> decided_by;
};

using approval_record_t = approval_record<1>;

}  // namespace tollgate::schema

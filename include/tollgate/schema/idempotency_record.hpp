#pragma once

#include <tollgate/schema/execution_record.hpp>
#include <tollgate/schema/idempotency_status.hpp>
#include <tollgate/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: idempotency record.
// Committed outcome per execution_id. Once terminal it is never rewritten.
namespace tollgate::schema {

template <uint16_t Version>
struct idempotency_record;

template <>
struct idempotency_record<1> final {
  uint16_t version{1};
  std::string execution_id;
  idempotency_status_t status{idempotency_status_t::in_progress};
  std::optional<execution_record_t> outcome;
  timestamp_milliseconds_t recorded_at{};
};

using idempotency_record_t = idempotency_record<1>;

}  // namespace tollgate::schema

#include <tollgate/common/clock.hpp>
#include <tollgate/governance/idempotency_index.hpp>
#include <tollgate/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace tollgate::governance {

idempotency_index::idempotency_index(
    tollgate::schema::encoding::scale_encoder_t& encoder,
    tollgate::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<tollgate::schema::idempotency_record_t> idempotency_index::get(
    std::string_view execution_id) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<tollgate::schema::idempotency_record_t>(
      encoder_, tollgate::schema::key::make_idempotency_key(execution_id));
}

bool idempotency_index::begin(std::string_view execution_id) {
  auto lock = std::scoped_lock{mutex_};
  auto key = tollgate::schema::key::make_idempotency_key(execution_id);
  if (storage_.get<tollgate::schema::idempotency_record_t>(encoder_, key)) {
    return false;
  }
  auto record = tollgate::schema::idempotency_record_t{};
  record.execution_id = std::string{execution_id};
  record.status = tollgate::schema::idempotency_status_t::in_progress;
  record.recorded_at = tollgate::common::now_milliseconds();
  storage_.put(encoder_, key, record);
  return true;
}

bool idempotency_index::complete(
    const tollgate::schema::execution_record_t& outcome) {
  if (!tollgate::schema::is_terminal(outcome.state)) {
    tollgate::common::critical("idempotency_index",
                               "refusing to store a non-terminal outcome",
                               outcome.execution_id);
  }
  auto lock = std::scoped_lock{mutex_};
  auto key = tollgate::schema::key::make_idempotency_key(outcome.execution_id);
  auto existing =
      storage_.get<tollgate::schema::idempotency_record_t>(encoder_, key);
  if (existing && is_terminal(*existing)) {
    spdlog::warn("idempotency entry for {} is already {}",
                 outcome.execution_id,
                 tollgate::schema::to_string(existing->status));
    return false;
  }
  auto record = tollgate::schema::idempotency_record_t{};
  record.execution_id = outcome.execution_id;
  record.status =
      outcome.state == tollgate::schema::execution_state_t::completed
          ? tollgate::schema::idempotency_status_t::succeeded
          : tollgate::schema::idempotency_status_t::failed;
  record.outcome = outcome;
  record.recorded_at = tollgate::common::now_milliseconds();
  storage_.put(encoder_, key, record);
  return true;
}

}  // namespace tollgate::governance

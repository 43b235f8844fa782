#include <tollgate/common/clock.hpp>
#include <tollgate/common/critical.hpp>
#include <tollgate/governance/execution_registry.hpp>
#include <tollgate/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

namespace tollgate::governance {

execution_registry::execution_registry(
    tollgate::schema::encoding::scale_encoder_t& encoder,
    tollgate::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<tollgate::schema::execution_record_t> execution_registry::get(
    std::string_view execution_id) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<tollgate::schema::execution_record_t>(
      encoder_, tollgate::schema::key::make_execution_key(execution_id));
}

std::optional<tollgate::schema::command_t> execution_registry::command(
    std::string_view execution_id) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<tollgate::schema::command_t>(
      encoder_, tollgate::schema::key::make_command_key(execution_id));
}

std::vector<std::string> execution_registry::list_in_state(
    const tollgate::schema::execution_state_t state) const {
  auto lock = std::scoped_lock{mutex_};
  auto ids = std::vector<std::string>{};
  auto prefix = tollgate::schema::key::make_prefix_key(
      tollgate::schema::key::kExecutionKeyPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto record =
        encoder_.try_decode<tollgate::schema::execution_record_t>(value);
    if (!record) {
      tollgate::common::critical("execution_registry",
                                 "corrupt execution record",
                                 tollgate::schema::make_string_view(key));
    }
    if (record->state == state) {
      ids.push_back(std::move(record->execution_id));
    }
  }
  return ids;
}

void execution_registry::create(
    const tollgate::schema::command_t& command,
    const tollgate::schema::execution_record_t& record) {
  auto lock = std::scoped_lock{mutex_};
  storage_.write_batch({
      {tollgate::schema::key::make_command_key(record.execution_id),
       encoder_.encode(command)},
      {tollgate::schema::key::make_execution_key(record.execution_id),
       encoder_.encode(record)},
  });
  spdlog::info("execution {} recorded ({})", record.execution_id,
               tollgate::schema::to_string(record.state));
}

bool execution_registry::advance(tollgate::schema::execution_record_t& record,
                                 const tollgate::schema::execution_state_t next) {
  if (!tollgate::schema::can_transition(record.state, next)) {
    spdlog::warn("execution {} cannot move {} -> {}", record.execution_id,
                 tollgate::schema::to_string(record.state),
                 tollgate::schema::to_string(next));
    return false;
  }
  spdlog::info("execution {} {} -> {}", record.execution_id,
               tollgate::schema::to_string(record.state),
               tollgate::schema::to_string(next));
  record.state = next;
  save(record);
  return true;
}

void execution_registry::save(tollgate::schema::execution_record_t& record) {
  auto lock = std::scoped_lock{mutex_};
  record.updated_at = tollgate::common::now_milliseconds();
  storage_.put(encoder_,
               tollgate::schema::key::make_execution_key(record.execution_id),
               record);
}

}  // namespace tollgate::governance

#include <tollgate/blake3/hash.hpp>
#include <tollgate/common/clock.hpp>
#include <tollgate/governance/audit_trail.hpp>
#include <tollgate/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace tollgate::governance {

audit_trail::audit_trail(tollgate::schema::encoding::scale_encoder_t& encoder,
                         tollgate::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {
  last_event_id_ =
      storage_
          .get<uint64_t>(encoder_,
                         tollgate::schema::key::make_sequence_key(
                             tollgate::schema::key::kAuditSequenceName))
          .value_or(0);
}

tollgate::schema::audit_event_t audit_trail::append(
    std::string_view execution_id,
    const tollgate::schema::audit_event_type_t event_type,
    std::string_view summary,
    const tollgate::schema::bytes_view_t& payload) {
  auto lock = std::scoped_lock{mutex_};
  auto event = tollgate::schema::audit_event_t{};
  event.event_id = last_event_id_ + 1;
  event.execution_id = std::string{execution_id};
  event.event_type = event_type;
  event.timestamp = tollgate::common::now_milliseconds();
  event.summary = std::string{summary};
  event.payload_digest = tollgate::blake3::hash(payload);

  storage_.write_batch({
      {tollgate::schema::key::make_audit_key(execution_id, event.event_id),
       encoder_.encode(event)},
      {tollgate::schema::key::make_sequence_key(
           tollgate::schema::key::kAuditSequenceName),
       encoder_.encode(event.event_id)},
  });
  last_event_id_ = event.event_id;
  spdlog::debug("audit #{} {} {} {}", event.event_id, execution_id,
                tollgate::schema::to_string(event_type), summary);
  return event;
}

std::vector<tollgate::schema::audit_event_t> audit_trail::events(
    std::string_view execution_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto events = std::vector<tollgate::schema::audit_event_t>{};
  auto prefix = tollgate::schema::key::make_audit_prefix(execution_id);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto event = encoder_.try_decode<tollgate::schema::audit_event_t>(value);
    if (!event) {
      tollgate::common::critical("audit_trail", "corrupt audit event",
                                 tollgate::schema::make_string_view(key));
    }
    events.push_back(std::move(*event));
  }
  return events;
}

uint64_t audit_trail::last_event_id() const {
  auto lock = std::scoped_lock{mutex_};
  return last_event_id_;
}

}  // namespace tollgate::governance

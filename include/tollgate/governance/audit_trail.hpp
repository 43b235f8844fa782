#pragma once

#include <tollgate/schema/audit_event.hpp>
#include <tollgate/schema/encoding/scale/encoder.hpp>
#include <tollgate/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

namespace tollgate::governance {

/// Append-only audit log.
///
/// Events are keyed `AUDIT|<execution_id>|<event_id>` with a big-endian
/// event_id, so a prefix scan yields one execution's events in append order.
/// The event_id sequence is persisted in the same write as the event, under
/// one process-wide mutex shared by every execution.
class audit_trail final {
 public:
  audit_trail(tollgate::schema::encoding::scale_encoder_t& encoder,
              tollgate::storage::rocksdb_storage_t& storage);

  /// Append one event. `payload` is the encoded record the event refers to;
  /// only its BLAKE3 digest is stored.
  tollgate::schema::audit_event_t append(
      std::string_view execution_id,
      tollgate::schema::audit_event_type_t event_type,
      std::string_view summary,
      const tollgate::schema::bytes_view_t& payload = {});

  std::vector<tollgate::schema::audit_event_t> events(
      std::string_view execution_id) const;

  uint64_t last_event_id() const;

 private:
  mutable std::mutex mutex_;
  tollgate::schema::encoding::scale_encoder_t& encoder_;
  tollgate::storage::rocksdb_storage_t& storage_;
  uint64_t last_event_id_{};
};

}  // namespace tollgate::governance

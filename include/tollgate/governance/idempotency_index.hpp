#pragma once

#include <tollgate/schema/encoding/scale/encoder.hpp>
#include <tollgate/schema/execution_record.hpp>
#include <tollgate/schema/idempotency_record.hpp>
#include <tollgate/storage/rocksdb/storage.hpp>

#include <mutex>
#include <optional>
#include <string_view>

namespace tollgate::governance {

/// execution_id -> committed outcome.
///
/// A terminal entry is written once and never replaced; it is what makes a
/// side effect happen at most once per execution_id.
class idempotency_index final {
 public:
  idempotency_index(tollgate::schema::encoding::scale_encoder_t& encoder,
                    tollgate::storage::rocksdb_storage_t& storage);

  std::optional<tollgate::schema::idempotency_record_t> get(
      std::string_view execution_id) const;

  /// Mark the execution IN_PROGRESS. Returns false when any entry exists.
  bool begin(std::string_view execution_id);

  /// Store the terminal outcome. Returns false when a terminal outcome was
  /// already stored; the earlier outcome is kept.
  bool complete(const tollgate::schema::execution_record_t& outcome);

 private:
  mutable std::mutex mutex_;
  tollgate::schema::encoding::scale_encoder_t& encoder_;
  tollgate::storage::rocksdb_storage_t& storage_;
};

inline bool is_terminal(const tollgate::schema::idempotency_record_t& record) {
  return record.status != tollgate::schema::idempotency_status_t::in_progress &&
         record.outcome.has_value();
}

}  // namespace tollgate::governance

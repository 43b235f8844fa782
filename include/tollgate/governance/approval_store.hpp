#pragma once

#include <tollgate/schema/approval_outcome.hpp>
#include <tollgate/schema/approval_record.hpp>
#include <tollgate/schema/approval_result.hpp>
#include <tollgate/schema/encoding/scale/encoder.hpp>
#include <tollgate/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace tollgate::governance {

/// Lifecycle of approval records: PENDING, then APPROVED or REJECTED exactly
/// once.
///
/// One instance is shared by every caller in the process. RocksDB is the
/// source of truth, so a record is visible to all threads as soon as `create`
/// returns. `create` and `decide` are linearizable under one mutex.
class approval_store final {
 public:
  approval_store(tollgate::schema::encoding::scale_encoder_t& encoder,
                 tollgate::storage::rocksdb_storage_t& storage);

  /// Create a pending approval for the execution, or return the existing one.
  tollgate::schema::approval_record_t create(std::string_view execution_id);

  /// Decide a pending approval. Fails APPROVAL_NOT_FOUND for an unknown id and
  /// APPROVAL_CONFLICT when the approval was already decided.
  tollgate::schema::approval_result_t decide(
      std::string_view approval_id,
      tollgate::schema::approval_outcome_t outcome,
      std::string_view decided_by);

  std::optional<tollgate::schema::approval_record_t> get(
      std::string_view approval_id) const;
  std::optional<tollgate::schema::approval_record_t> find_by_execution(
      std::string_view execution_id) const;

  /// Pending approvals in creation order.
  std::vector<tollgate::schema::approval_record_t> list_pending() const;

 private:
  std::optional<tollgate::schema::approval_record_t> load(
      std::string_view approval_id) const;

  mutable std::mutex mutex_;
  tollgate::schema::encoding::scale_encoder_t& encoder_;
  tollgate::storage::rocksdb_storage_t& storage_;
  uint64_t last_sequence_{};
};

}  // namespace tollgate::governance

#pragma once

#include <tollgate/schema/command.hpp>
#include <tollgate/schema/encoding/scale/encoder.hpp>
#include <tollgate/schema/execution_record.hpp>
#include <tollgate/storage/rocksdb/storage.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::governance {

/// Point-addressable execution records and the commands they were created
/// from.
class execution_registry final {
 public:
  execution_registry(tollgate::schema::encoding::scale_encoder_t& encoder,
                     tollgate::storage::rocksdb_storage_t& storage);

  std::optional<tollgate::schema::execution_record_t> get(
      std::string_view execution_id) const;
  std::optional<tollgate::schema::command_t> command(
      std::string_view execution_id) const;

  /// Ids of every record in `state`, in key order.
  std::vector<std::string> list_in_state(
      tollgate::schema::execution_state_t state) const;

  /// Persist a new record together with its command.
  void create(const tollgate::schema::command_t& command,
              const tollgate::schema::execution_record_t& record);

  /// Move the record to `next` and persist it. Returns false, leaving the
  /// record untouched, when the transition is not allowed.
  bool advance(tollgate::schema::execution_record_t& record,
               tollgate::schema::execution_state_t next);

  /// Persist field changes that do not change state.
  void save(tollgate::schema::execution_record_t& record);

 private:
  mutable std::mutex mutex_;
  tollgate::schema::encoding::scale_encoder_t& encoder_;
  tollgate::storage::rocksdb_storage_t& storage_;
};

}  // namespace tollgate::governance

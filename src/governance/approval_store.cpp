#include <tollgate/common/clock.hpp>
#include <tollgate/governance/approval_store.hpp>
#include <tollgate/schema/error_code.hpp>
#include <tollgate/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <string>

namespace tollgate::governance {

namespace {

constexpr auto kCodespace = std::string_view{"tollgate.approval"};

uint64_t approval_sequence(std::string_view approval_id) {
  auto value = uint64_t{};
  if (approval_id.size() > 1) {
    std::from_chars(approval_id.data() + 1,
                    approval_id.data() + approval_id.size(), value);
  }
  return value;
}

tollgate::schema::approval_result_t make_error(
    const tollgate::schema::error_code code,
    std::string log) {
  auto result = tollgate::schema::approval_result_t{};
  result.code = tollgate::schema::to_code(code);
  result.log = std::move(log);
  result.codespace = std::string{kCodespace};
  return result;
}

}  // namespace

approval_store::approval_store(
    tollgate::schema::encoding::scale_encoder_t& encoder,
    tollgate::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {
  auto sequence_key = tollgate::schema::key::make_sequence_key(
      tollgate::schema::key::kApprovalSequenceName);
  last_sequence_ = storage_.get<uint64_t>(encoder_, sequence_key).value_or(0);
  spdlog::info("approval store loaded, last approval sequence {}",
               last_sequence_);
}

tollgate::schema::approval_record_t approval_store::create(
    std::string_view execution_id) {
  auto lock = std::scoped_lock{mutex_};
  auto index_key =
      tollgate::schema::key::make_approval_execution_key(execution_id);
  auto existing_id = storage_.get<std::string>(encoder_, index_key);
  if (existing_id) {
    auto existing = load(*existing_id);
    if (!existing) {
      tollgate::common::critical("approval_store",
                                 "approval index points at missing record",
                                 *existing_id);
    }
    return *existing;
  }

  auto sequence = last_sequence_ + 1;
  auto record = tollgate::schema::approval_record_t{};
  record.approval_id = "a" + std::to_string(sequence);
  record.execution_id = std::string{execution_id};
  record.status = tollgate::schema::approval_status_t::pending;
  record.created_at = tollgate::common::now_milliseconds();

  storage_.write_batch({
      {tollgate::schema::key::make_approval_key(record.approval_id),
       encoder_.encode(record)},
      {index_key, encoder_.encode(record.approval_id)},
      {tollgate::schema::key::make_sequence_key(
           tollgate::schema::key::kApprovalSequenceName),
       encoder_.encode(sequence)},
  });
  last_sequence_ = sequence;
  spdlog::info("approval {} created for execution {}", record.approval_id,
               record.execution_id);
  return record;
}

tollgate::schema::approval_result_t approval_store::decide(
    std::string_view approval_id,
    const tollgate::schema::approval_outcome_t outcome,
    std::string_view decided_by) {
  auto lock = std::scoped_lock{mutex_};
  auto record = load(approval_id);
  if (!record) {
    return make_error(tollgate::schema::error_code::approval_not_found,
                      "approval not found: " + std::string{approval_id});
  }
  if (tollgate::schema::is_terminal(record->status)) {
    spdlog::warn("approval {} already {}", approval_id,
                 tollgate::schema::to_string(record->status));
    auto result =
        make_error(tollgate::schema::error_code::approval_conflict,
                   "approval already " +
                       std::string{tollgate::schema::to_string(record->status)});
    result.approval = std::move(record);
    return result;
  }

  record->status = outcome == tollgate::schema::approval_outcome_t::approve
                       ? tollgate::schema::approval_status_t::approved
                       : tollgate::schema::approval_status_t::rejected;
  record->decided_at = tollgate::common::now_milliseconds();
  record->decided_by = std::string{decided_by};
  storage_.put(encoder_,
               tollgate::schema::key::make_approval_key(record->approval_id),
               *record);
  spdlog::info("approval {} {} by {}", record->approval_id,
               tollgate::schema::to_string(record->status), decided_by);

  auto result = tollgate::schema::approval_result_t{};
  result.codespace = std::string{kCodespace};
  result.approval = std::move(record);
  return result;
}

std::optional<tollgate::schema::approval_record_t> approval_store::get(
    std::string_view approval_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load(approval_id);
}

std::optional<tollgate::schema::approval_record_t>
approval_store::find_by_execution(std::string_view execution_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto approval_id = storage_.get<std::string>(
      encoder_,
      tollgate::schema::key::make_approval_execution_key(execution_id));
  if (!approval_id) {
    return std::nullopt;
  }
  return load(*approval_id);
}

std::vector<tollgate::schema::approval_record_t> approval_store::list_pending()
    const {
  auto lock = std::scoped_lock{mutex_};
  auto pending = std::vector<tollgate::schema::approval_record_t>{};
  auto prefix = tollgate::schema::key::make_prefix_key(
      tollgate::schema::key::kApprovalKeyPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto record =
        encoder_.try_decode<tollgate::schema::approval_record_t>(value);
    if (!record) {
      tollgate::common::critical("approval_store", "corrupt approval record",
                                 tollgate::schema::make_string_view(key));
    }
    if (record->status == tollgate::schema::approval_status_t::pending) {
      pending.push_back(std::move(*record));
    }
  }
  std::sort(std::begin(pending), std::end(pending),
            [](const auto& lhs, const auto& rhs) {
              return approval_sequence(lhs.approval_id) <
                     approval_sequence(rhs.approval_id);
            });
  return pending;
}

std::optional<tollgate::schema::approval_record_t> approval_store::load(
    std::string_view approval_id) const {
  return storage_.get<tollgate::schema::approval_record_t>(
      encoder_, tollgate::schema::key::make_approval_key(approval_id));
}

}  // namespace tollgate::governance

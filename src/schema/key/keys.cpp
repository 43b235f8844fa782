#include <tollgate/common/critical.hpp>
#include <tollgate/schema/key/keys.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <iterator>

namespace tollgate::schema::key {

namespace {

void append(tollgate::schema::bytes_t& out, std::string_view value) {
  out.insert(std::end(out), std::begin(value), std::end(value));
}

}  // namespace

tollgate::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return tollgate::schema::make_bytes(prefix);
}

tollgate::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                            std::string_view id) {
  auto key = tollgate::schema::bytes_t{};
  key.reserve(prefix.size() + id.size());
  append(key, prefix);
  append(key, id);
  return key;
}

tollgate::schema::bytes_t make_approval_key(std::string_view approval_id) {
  return make_prefixed_key(kApprovalKeyPrefix, approval_id);
}

tollgate::schema::bytes_t make_approval_execution_key(
    std::string_view execution_id) {
  return make_prefixed_key(kApprovalExecutionKeyPrefix, execution_id);
}

tollgate::schema::bytes_t make_execution_key(std::string_view execution_id) {
  return make_prefixed_key(kExecutionKeyPrefix, execution_id);
}

tollgate::schema::bytes_t make_command_key(std::string_view execution_id) {
  return make_prefixed_key(kCommandKeyPrefix, execution_id);
}

tollgate::schema::bytes_t make_idempotency_key(std::string_view execution_id) {
  return make_prefixed_key(kIdempotencyKeyPrefix, execution_id);
}

tollgate::schema::bytes_t make_sequence_key(std::string_view name) {
  return make_prefixed_key(kSequenceKeyPrefix, name);
}

tollgate::schema::bytes_t make_audit_prefix(std::string_view execution_id) {
  auto key = make_prefixed_key(kAuditKeyPrefix, execution_id);
  key.push_back(static_cast<uint8_t>('|'));
  return key;
}

tollgate::schema::bytes_t make_audit_key(std::string_view execution_id,
                                         uint64_t sequence) {
  auto key = make_audit_prefix(execution_id);
  auto suffix = encode_sequence(sequence);
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

tollgate::schema::bytes_t encode_sequence(uint64_t value) {
  auto big = boost::endian::native_to_big(value);
  auto out = tollgate::schema::bytes_t(sizeof(big));
  std::memcpy(out.data(), &big, sizeof(big));
  return out;
}

uint64_t decode_sequence(const tollgate::schema::bytes_view_t& bytes) {
  auto big = uint64_t{};
  if (bytes.size() != sizeof(big)) {
    tollgate::common::critical("sequence value has unexpected width");
  }
  std::memcpy(&big, bytes.data(), sizeof(big));
  return boost::endian::big_to_native(big);
}

}  // namespace tollgate::schema::key

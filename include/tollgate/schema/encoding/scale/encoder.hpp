#pragma once

#include <tollgate/common/critical.hpp>
#include <tollgate/schema/encoding/encoder.hpp>
#include <tollgate/schema/encoding/scale/approval_record.hpp>
#include <tollgate/schema/encoding/scale/audit_event.hpp>
#include <tollgate/schema/encoding/scale/command.hpp>
#include <tollgate/schema/encoding/scale/execution_record.hpp>
#include <tollgate/schema/encoding/scale/idempotency_record.hpp>

#include <iterator>
#include <optional>

#include <scale/scale.hpp>

namespace tollgate::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tollgate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tollgate::schema::bytes_t& out);

  template <typename T>
  T decode(const tollgate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tollgate::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
tollgate::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    tollgate::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        tollgate::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const tollgate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    tollgate::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const tollgate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace tollgate::schema::encoding

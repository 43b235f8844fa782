#pragma once

#include <tollgate/schema/primitives.hpp>

#include <optional>

namespace tollgate::schema::encoding {

// Codec selection is a build-time choice: callers name the library by tag,
// e.g. encoder<scale_encoder_tag>.
template <typename Library>
struct encoder {
  template <typename T>
  tollgate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tollgate::schema::bytes_t& out);

  template <typename T>
  T decode(const tollgate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tollgate::schema::bytes_view_t& bytes);
};

}  // namespace tollgate::schema::encoding

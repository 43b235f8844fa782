#pragma once
#include <tollgate/schema/primitives.hpp>

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tollgate::storage {

using key_value_entry_t =
    std::pair<tollgate::schema::bytes_t, tollgate::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tollgate::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tollgate::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const tollgate::schema::bytes_view_t& prefix) const;

  /// Persist every already-encoded entry in one atomic write.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tollgate::storage

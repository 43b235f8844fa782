#include <blake3.h>
#include <tollgate/blake3/hash.hpp>

namespace tollgate::blake3 {

namespace {

tollgate::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  // BLAKE3_OUT_LEN
  auto output = tollgate::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

tollgate::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

tollgate::schema::hash32_t hash(const tollgate::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace tollgate::blake3

#include <tollgate/crypto/credential.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <memory>

namespace tollgate::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

std::optional<tollgate::schema::hash32_t> sha256(std::string_view value) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return std::nullopt;
  }
  if (EVP_DigestUpdate(ctx.get(), value.data(), value.size()) != 1) {
    return std::nullopt;
  }
  auto out = tollgate::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1 ||
      length != out.size()) {
    return std::nullopt;
  }
  return out;
}

bool credential_matches(std::string_view presented,
                        std::string_view expected) {
  if (expected.empty()) {
    return false;
  }
  auto lhs = sha256(presented);
  auto rhs = sha256(expected);
  if (!lhs || !rhs) {
    return false;
  }
  return CRYPTO_memcmp(lhs->data(), rhs->data(), lhs->size()) == 0;
}

}  // namespace tollgate::crypto

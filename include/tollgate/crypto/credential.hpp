#pragma once
#include <tollgate/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace tollgate::crypto {

/// SHA-256 of `value`; nullopt when the OpenSSL digest fails.
std::optional<tollgate::schema::hash32_t> sha256(std::string_view value);

/// Constant-time comparison of a presented credential against the expected
/// token. Both sides are hashed first so that length differences leak nothing.
/// An empty expected token never matches.
bool credential_matches(std::string_view presented, std::string_view expected);

}  // namespace tollgate::crypto

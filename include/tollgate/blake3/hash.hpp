#pragma once
#include <tollgate/schema/primitives.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace tollgate::blake3 {

tollgate::schema::hash32_t hash(const std::string_view& str);
tollgate::schema::hash32_t hash(const tollgate::schema::bytes_view_t& bytes);

}  // namespace tollgate::blake3

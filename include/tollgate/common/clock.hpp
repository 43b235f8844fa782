#pragma once

#include <tollgate/schema/primitives.hpp>

#include <chrono>
#include <cstdint>

namespace tollgate::common {

inline tollgate::schema::timestamp_milliseconds_t now_milliseconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<tollgate::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace tollgate::common

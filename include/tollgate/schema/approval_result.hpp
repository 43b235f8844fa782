#pragma once

#include <tollgate/schema/approval_record.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace tollgate::schema {

template <uint16_t Version>
struct approval_result;

template <>
struct approval_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<approval_record_t> approval;
};

using approval_result_t = approval_result<1>;

}  // namespace tollgate::schema

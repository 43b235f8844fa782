#pragma once

#include <tollgate/schema/execution_record.hpp>
#include <tollgate/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: write result.
// Envelope returned by gateway operations. code is 0 on success, otherwise an
// error_code value; log carries the human-readable reason.
namespace tollgate::schema {

template <uint16_t Version>
struct write_result;

template <>
struct write_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::string execution_id;
  std::optional<std::string> approval_id;
  std::optional<execution_record_t> record;
  bool retryable{false};
};

using write_result_t = write_result<1>;

}  // namespace tollgate::schema

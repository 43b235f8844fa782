#pragma once

#include <tollgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: queue job status.
namespace tollgate::schema {

enum class job_status_t : uint8_t {
  queued = 0,
  processing = 1,
  succeeded = 2,
  failed = 3,
  cancelled = 4,
};

inline constexpr auto kJobStatusMappings = std::array{
    enum_mapping_t<job_status_t>{"QUEUED", job_status_t::queued},
    enum_mapping_t<job_status_t>{"PROCESSING", job_status_t::processing},
    enum_mapping_t<job_status_t>{"SUCCEEDED", job_status_t::succeeded},
    enum_mapping_t<job_status_t>{"FAILED", job_status_t::failed},
    enum_mapping_t<job_status_t>{"CANCELLED", job_status_t::cancelled},
};

template <>
inline std::optional<job_status_t> try_from_string<job_status_t>(
    const std::string_view value) {
  return from_string(value, kJobStatusMappings);
}

inline constexpr std::string_view to_string(const job_status_t value) {
  return to_string(value, kJobStatusMappings).value_or("unknown");
}

inline constexpr bool is_active(const job_status_t value) {
  return value == job_status_t::queued || value == job_status_t::processing;
}

}  // namespace tollgate::schema

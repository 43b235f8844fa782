#pragma once

#include <tollgate/routing/capability_executor.hpp>

#include <atomic>
#include <cstdint>

namespace tollgate::routing {

/// Executor with no external side effect. It acknowledges every command with
/// the BLAKE3 digest of its encoded parameters.
class loopback_executor final : public capability_executor {
 public:
  job_status execute(std::string_view kind,
                     const tollgate::schema::parameters_t& parameters) override;

  uint64_t invocations() const { return invocations_.load(); }

 private:
  std::atomic<uint64_t> invocations_{0};
};

}  // namespace tollgate::routing

#include <tollgate/blake3/hash.hpp>
#include <tollgate/routing/loopback_executor.hpp>
#include <tollgate/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace tollgate::routing {

job_status loopback_executor::execute(
    std::string_view kind,
    const tollgate::schema::parameters_t& parameters) {
  auto encoder = tollgate::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(parameters);
  auto digest = tollgate::blake3::hash(tollgate::schema::bytes_view_t{encoded});
  ++invocations_;
  spdlog::info("loopback executed {} ({} parameters)", kind, parameters.size());
  return job_done{std::string{kind} + ":" + tollgate::schema::to_hex(digest)};
}

}  // namespace tollgate::routing

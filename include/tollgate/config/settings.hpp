#pragma once

#include <tollgate/governance/policy.hpp>
#include <tollgate/routing/job_poller.hpp>
#include <tollgate/schema/dispatch_mode.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::config {

inline constexpr auto kEnvironmentPrefix = std::string_view{"TOLLGATE_"};

/// One `agent = <id>:<cap>[,<cap>...][:<max_in_flight>]` declaration.
struct agent_spec final {
  std::string agent_id;
  std::vector<std::string> capabilities;
  uint32_t max_in_flight{1};
};

struct settings final {
  std::string db_path{"tollgate.db"};
  std::string log_file{"tollgate.log"};
  std::string log_level{"info"};
  std::size_t workers{4};
  uint32_t max_retries{1};
  tollgate::schema::dispatch_mode_t dispatch_mode{
      tollgate::schema::dispatch_mode_t::async};
  tollgate::routing::poll_policy poll;
  tollgate::governance::policy_config policy;
  std::vector<agent_spec> agents;
  bool demo{false};
};

struct settings_result final {
  uint32_t code{};
  std::string log;
  std::string help;
  bool show_help{false};
  settings value;
};

std::optional<agent_spec> try_parse_agent_spec(std::string_view text);

/// Merge command line, `TOLLGATE_*` environment variables and the optional
/// `--config` INI file, in that order of precedence, then validate.
settings_result load_settings(int argc, const char* const argv[]);

}  // namespace tollgate::config

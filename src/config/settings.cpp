#include <tollgate/config/settings.hpp>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace tollgate::config {

namespace {

namespace po = boost::program_options;

std::vector<std::string> split(std::string_view text, const char separator) {
  auto parts = std::vector<std::string>{};
  auto start = std::size_t{0};
  while (true) {
    auto end = text.find(separator, start);
    parts.emplace_back(text.substr(start, end - start));
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return parts;
}

template <typename Container>
std::set<std::string, std::less<>> to_set(const Container& values) {
  return {std::begin(values), std::end(values)};
}

settings_result make_error(std::string log) {
  auto result = settings_result{};
  result.code = 1;
  result.log = std::move(log);
  return result;
}

po::options_description make_description() {
  auto description = po::options_description{"tollgated"};
  // clang-format off
  description.add_options()
      ("help,h", "Show the help message")
      ("config,c", po::value<std::string>(), "INI configuration file")
      ("db-path", po::value<std::string>()->default_value("tollgate.db"),
       "RocksDB directory")
      ("log-file", po::value<std::string>()->default_value("tollgate.log"),
       "Log file")
      ("log-level", po::value<std::string>()->default_value("info"),
       "trace, debug, info, warn, error or critical")
      ("workers", po::value<std::size_t>()->default_value(4),
       "Worker threads")
      ("max-retries", po::value<uint32_t>()->default_value(1),
       "Retries per job after the first attempt (0 or 1)")
      ("dispatch-mode", po::value<std::string>()->default_value("async"),
       "async or synchronous")
      ("safe-mode", po::value<bool>()->default_value(false)->implicit_value(true),
       "Reject every non-read-only command from standard initiators")
      ("credential-enforcement",
       po::value<bool>()->default_value(false)->implicit_value(true),
       "Require the privileged token from privileged initiators")
      ("privileged-token", po::value<std::string>()->default_value(""),
       "Token privileged initiators must present")
      ("privileged-initiator",
       po::value<std::vector<std::string>>()->composing(),
       "Initiator evaluated with privilege-scoped checks only")
      ("privileged-denied-kind",
       po::value<std::vector<std::string>>()->composing(),
       "Kind refused even to privileged initiators")
      ("denied-kind", po::value<std::vector<std::string>>()->composing(),
       "Kind refused to standard initiators")
      ("allowed-kind", po::value<std::vector<std::string>>()->composing(),
       "When set, the only kinds standard initiators may submit")
      ("approval-required-kind",
       po::value<std::vector<std::string>>()->composing(),
       "Kind that always needs an approval")
      ("approval-required-by-default",
       po::value<bool>()->default_value(false)->implicit_value(true),
       "Every non-read-only command needs an approval")
      ("agent", po::value<std::vector<std::string>>()->composing(),
       "<id>:<cap>[,<cap>...][:<max_in_flight>]")
      ("poll-max-attempts", po::value<uint32_t>()->default_value(30),
       "Polls per remote job")
      ("poll-interval-ms", po::value<uint64_t>()->default_value(1000),
       "Delay between polls")
      ("poll-deadline-ms", po::value<uint64_t>()->default_value(60000),
       "Deadline per remote job")
      ("demo", po::bool_switch()->default_value(false),
       "Submit one demo command at startup");
  // clang-format on
  return description;
}

std::vector<std::string> strings(const po::variables_map& vm,
                                 const char* name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

}  // namespace

std::optional<agent_spec> try_parse_agent_spec(std::string_view text) {
  auto fields = split(text, ':');
  if (fields.size() < 2 || fields.size() > 3 || fields[0].empty()) {
    return std::nullopt;
  }
  auto spec = agent_spec{};
  spec.agent_id = fields[0];
  for (auto& capability : split(fields[1], ',')) {
    if (capability.empty()) {
      return std::nullopt;
    }
    spec.capabilities.push_back(std::move(capability));
  }
  if (fields.size() == 3) {
    const auto& limit = fields[2];
    auto value = uint32_t{};
    auto [end, error] =
        std::from_chars(limit.data(), limit.data() + limit.size(), value);
    if (error != std::errc{} || end != limit.data() + limit.size() ||
        value == 0) {
      return std::nullopt;
    }
    spec.max_in_flight = value;
  }
  return spec;
}

settings_result load_settings(const int argc, const char* const argv[]) {
  auto description = make_description();
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::store(po::parse_environment(
                  description,
                  [&description](const std::string& variable) -> std::string {
                    if (!variable.starts_with(kEnvironmentPrefix)) {
                      return {};
                    }
                    auto name = variable.substr(kEnvironmentPrefix.size());
                    std::ranges::transform(name, std::begin(name), [](char c) {
                      return c == '_' ? '-'
                                      : static_cast<char>(std::tolower(
                                            static_cast<unsigned char>(c)));
                    });
                    if (description.find_nothrow(name, false) == nullptr) {
                      return {};
                    }
                    return name;
                  }),
              vm);
    if (vm.contains("config")) {
      const auto& path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        return make_error("cannot open config file " + path);
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    return make_error(e.what());
  }

  auto result = settings_result{};
  if (vm.contains("help")) {
    auto help = std::ostringstream{};
    help << description;
    result.help = help.str();
    result.show_help = true;
    return result;
  }

  auto& value = result.value;
  value.db_path = vm["db-path"].as<std::string>();
  value.log_file = vm["log-file"].as<std::string>();
  value.log_level = vm["log-level"].as<std::string>();
  value.workers = vm["workers"].as<std::size_t>();
  value.max_retries = vm["max-retries"].as<uint32_t>();
  value.demo = vm["demo"].as<bool>();

  auto mode = tollgate::schema::try_from_string<tollgate::schema::dispatch_mode_t>(
      vm["dispatch-mode"].as<std::string>());
  if (!mode) {
    return make_error("dispatch-mode must be async or synchronous");
  }
  value.dispatch_mode = *mode;

  value.poll.max_attempts = vm["poll-max-attempts"].as<uint32_t>();
  value.poll.interval =
      std::chrono::milliseconds{vm["poll-interval-ms"].as<uint64_t>()};
  value.poll.deadline =
      std::chrono::milliseconds{vm["poll-deadline-ms"].as<uint64_t>()};

  auto& policy = value.policy;
  policy.safe_mode = vm["safe-mode"].as<bool>();
  policy.credential_enforcement = vm["credential-enforcement"].as<bool>();
  policy.privileged_token = vm["privileged-token"].as<std::string>();
  policy.privileged_initiators = to_set(strings(vm, "privileged-initiator"));
  policy.privileged_denied_kinds =
      to_set(strings(vm, "privileged-denied-kind"));
  policy.denied_kinds = to_set(strings(vm, "denied-kind"));
  policy.allowed_kinds = to_set(strings(vm, "allowed-kind"));
  policy.approval_required_kinds =
      to_set(strings(vm, "approval-required-kind"));
  policy.approval_required_by_default =
      vm["approval-required-by-default"].as<bool>();

  for (const auto& declaration : strings(vm, "agent")) {
    auto spec = try_parse_agent_spec(declaration);
    if (!spec) {
      return make_error("invalid agent declaration: " + declaration);
    }
    value.agents.push_back(std::move(*spec));
  }

  if (value.max_retries > 1) {
    return make_error(
        fmt::format("max-retries must be 0 or 1, got {}", value.max_retries));
  }
  if (value.workers == 0) {
    return make_error("workers must be at least 1");
  }
  if (value.poll.max_attempts == 0) {
    return make_error("poll-max-attempts must be at least 1");
  }
  if (policy.credential_enforcement && policy.privileged_token.empty()) {
    return make_error(
        "credential-enforcement requires a non-empty privileged-token");
  }
  return result;
}

}  // namespace tollgate::config

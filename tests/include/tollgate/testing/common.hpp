#pragma once

#include <tollgate/schema/command.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace tollgate::testing {

inline std::string make_db_path(const std::string& prefix) {
  auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  auto path = std::filesystem::temp_directory_path() /
              (prefix + "_" + std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto ec = std::error_code{};
  std::filesystem::remove_all(path, ec);
}

inline tollgate::schema::command_t make_command(const std::string& execution_id,
                                                const std::string& kind = "crm.update",
                                                const std::string& initiator = "alice") {
  auto command = tollgate::schema::command_t{};
  command.command_id = "cmd-" + execution_id;
  command.execution_id = execution_id;
  command.kind = kind;
  command.initiator = initiator;
  command.parameters = {{"record", "42"}, {"field", "status"}};
  return command;
}

}  // namespace tollgate::testing

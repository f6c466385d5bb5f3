#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace anvil {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
  bool timed_out{ false };
  bool cancelled{ false };
};

struct shell_run_cfg {
  std::function<void(std::string_view)> on_output_line;  // stdout and stderr, per line
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
  std::optional<std::chrono::milliseconds> timeout;
  std::atomic_bool const *cancel{ nullptr };
  std::chrono::milliseconds kill_grace{ 2000 };  // SIGTERM -> SIGKILL
};

shell_env_t shell_getenv();

// Run `script` with /bin/sh in its own process group. On timeout or when `cancel` becomes
// true the whole group gets SIGTERM, then SIGKILL after `kill_grace`; the result reports
// which one happened. Throws std::system_error when the process cannot be started.
shell_result shell_run(std::string_view script, shell_run_cfg const &cfg);

}  // namespace anvil

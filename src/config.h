#pragma once

#include "tui.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace anvil {

inline constexpr char const kDefaultIndexUrl[]{
  "https://github.com/sycomix/Anvil_Index.git"
};

// Process-wide settings, resolved once at startup and carried by value.
struct anvil_config {
  std::filesystem::path root;
  bool auto_submit{ true };
  std::optional<tui::level> log_level;
  std::optional<std::chrono::seconds> build_timeout;
  std::optional<unsigned> jobs;
  std::string index_url{ kDefaultIndexUrl };
  // Environment defaults; a formula or forge flag takes precedence.
  std::optional<std::string> msvc_runtime;  // "MD" or "MT"
  bool force_pic{ false };
};

// Command-line values that take precedence over the environment.
struct config_overrides {
  std::optional<std::filesystem::path> root;
  std::optional<long> timeout_seconds;
  std::optional<unsigned> jobs;
  bool no_submit{ false };
};

using env_lookup_t = std::function<std::optional<std::string>(std::string_view)>;

// Reads from the real process environment.
env_lookup_t config_process_env();

// Throws std::runtime_error on malformed values (bad timeout, jobs, runtime) or when no
// root can be determined (neither ANVIL_ROOT nor HOME).
anvil_config config_resolve(env_lookup_t const &env, config_overrides const &overrides = {});

// "1", "true", "yes", "on" -> true; "0", "false", "no", "off" -> false; else nullopt.
std::optional<bool> config_parse_bool(std::string_view value);

// "MD"/"MT" in any case, normalized to upper case. Throws on anything else.
std::string config_parse_msvc_runtime(std::string_view value);

}  // namespace anvil

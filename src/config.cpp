#include "config.h"

#include "util.h"

#include <charconv>
#include <cstdlib>
#include <stdexcept>

namespace anvil {

namespace {

template <typename T>
T parse_positive(std::string_view name, std::string_view raw) {
  auto const value{ util_trim(raw) };
  T out{};
  auto const [ptr, ec]{ std::from_chars(value.data(), value.data() + value.size(), out) };
  if (ec != std::errc{} || ptr != value.data() + value.size() || out <= 0) {
    throw std::runtime_error(std::string{ name } + " must be a positive integer, got '" +
                             std::string{ raw } + "'");
  }
  return out;
}

}  // namespace

env_lookup_t config_process_env() {
  return [](std::string_view name) -> std::optional<std::string> {
    std::string const key{ name };
    if (char const *value{ std::getenv(key.c_str()) }) { return std::string{ value }; }
    return std::nullopt;
  };
}

std::optional<bool> config_parse_bool(std::string_view value) {
  auto const lowered{ util_to_lower(util_trim(value)) };
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  return std::nullopt;
}

std::string config_parse_msvc_runtime(std::string_view value) {
  auto const lowered{ util_to_lower(util_trim(value)) };
  if (lowered == "md") { return "MD"; }
  if (lowered == "mt") { return "MT"; }
  throw std::runtime_error("MSVC runtime must be MD or MT, got '" + std::string{ value } +
                           "'");
}

anvil_config config_resolve(env_lookup_t const &env, config_overrides const &overrides) {
  auto const get{ [&](std::string_view name) -> std::optional<std::string> {
    auto value{ env(name) };
    if (value && util_trim(*value).empty()) { return std::nullopt; }
    return value;
  } };

  anvil_config cfg{};

  if (overrides.root) {
    cfg.root = *overrides.root;
  } else if (auto root{ get("ANVIL_ROOT") }) {
    cfg.root = *root;
  } else if (auto home{ get("HOME") }) {
    cfg.root = std::filesystem::path{ *home } / ".anvil";
  } else {
    throw std::runtime_error("Cannot determine anvil root: set ANVIL_ROOT or HOME");
  }

  if (auto submit{ get("ANVIL_AUTO_SUBMIT") }) {
    // Anything that is not an explicit "off" value keeps submission enabled.
    auto const parsed{ config_parse_bool(*submit) };
    cfg.auto_submit = parsed.value_or(true);
  }
  if (overrides.no_submit) { cfg.auto_submit = false; }

  if (auto level{ get("ANVIL_LOG_LEVEL") }) {
    cfg.log_level = tui::level_from_string(util_trim(*level));
    if (!cfg.log_level) {
      throw std::runtime_error("ANVIL_LOG_LEVEL must be debug, info, warn or error, got '" +
                               *level + "'");
    }
  }

  if (overrides.timeout_seconds) {
    if (*overrides.timeout_seconds <= 0) {
      throw std::runtime_error("--timeout must be a positive number of seconds");
    }
    cfg.build_timeout = std::chrono::seconds{ *overrides.timeout_seconds };
  } else if (auto timeout{ get("ANVIL_BUILD_TIMEOUT") }) {
    cfg.build_timeout =
        std::chrono::seconds{ parse_positive<long>("ANVIL_BUILD_TIMEOUT", *timeout) };
  }

  if (overrides.jobs) {
    if (*overrides.jobs == 0) { throw std::runtime_error("--jobs must be at least 1"); }
    cfg.jobs = *overrides.jobs;
  } else if (auto jobs{ get("ANVIL_JOBS") }) {
    cfg.jobs = parse_positive<unsigned>("ANVIL_JOBS", *jobs);
  }

  if (auto url{ get("ANVIL_INDEX_URL") }) { cfg.index_url = std::string{ util_trim(*url) }; }

  if (auto runtime{ get("ANVIL_MSVC_RUNTIME") }) {
    cfg.msvc_runtime = config_parse_msvc_runtime(*runtime);
  }

  if (auto pic{ get("ANVIL_FORCE_PIC") }) {
    cfg.force_pic = config_parse_bool(*pic).value_or(false);
  }

  return cfg;
}

}  // namespace anvil

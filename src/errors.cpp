#include "errors.h"

#include <string_view>
#include <utility>

namespace anvil {

namespace {

std::string join(std::vector<std::string> const &parts, std::string_view sep) {
  std::string out;
  for (size_t i{ 0 }; i < parts.size(); ++i) {
    if (i > 0) { out.append(sep); }
    out.append(parts[i]);
  }
  return out;
}

}  // namespace

detection_failure::detection_failure(std::filesystem::path const &source_dir,
                                     std::string const &reason)
    : anvil_error{ reason + " in " + source_dir.string() } {}

formula_parse_error::formula_parse_error(std::string context, std::string const &detail)
    : anvil_error{ "Failed to parse formula " + context + ": " + detail },
      context_{ std::move(context) } {}

tool_not_found_error::tool_not_found_error(std::string ecosystem,
                                           std::vector<std::string> candidates)
    : anvil_error{ "No " + ecosystem + " tool found on PATH (tried: " +
                   join(candidates, ", ") + ")" },
      ecosystem_{ std::move(ecosystem) },
      candidates_{ std::move(candidates) } {}

build_command_failed::build_command_failed(std::string command,
                                           int exit_code,
                                           std::filesystem::path workspace)
    : anvil_error{ "Build command failed with exit code " + std::to_string(exit_code) +
                   ": " + command + " (workspace kept at " + workspace.string() + ")" },
      command_{ std::move(command) },
      exit_code_{ exit_code },
      workspace_{ std::move(workspace) } {}

no_artifacts_produced::no_artifacts_produced(std::string const &name)
    : anvil_error{ "Build of '" + name + "' produced no binaries or library artifacts" } {}

dependency_cycle_error::dependency_cycle_error(std::vector<std::string> cycle)
    : anvil_error{ "Dependency cycle detected: " + join(cycle, " -> ") },
      cycle_{ std::move(cycle) } {}

build_timeout::build_timeout(std::string command, long seconds)
    : anvil_error{ "Build command timed out after " + std::to_string(seconds) +
                   "s: " + command },
      command_{ std::move(command) } {}

forge_cancelled::forge_cancelled(std::filesystem::path workspace)
    : anvil_error{ "Forge cancelled (workspace kept at " + workspace.string() + ")" },
      workspace_{ std::move(workspace) } {}

formula_not_found::formula_not_found(std::string const &name)
    : anvil_error{ "No formula named '" + name + "' in the index" } {}

}  // namespace anvil

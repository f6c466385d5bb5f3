#include "cli.h"
#include "config.h"
#include "errors.h"
#include "libgit2_util.h"
#include "termination.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <variant>

int main(int argc, char **argv) {
  anvil::tui::init();
  anvil::termination_handler_install();

  auto args{ anvil::cli_parse(argc, argv) };

  std::optional<anvil::anvil_config> config;
  std::string config_error;
  try {
    config = anvil::config_resolve(anvil::config_process_env(), args.overrides);
  } catch (std::exception const &ex) { config_error = ex.what(); }

  auto threshold{ args.verbosity };
  if (!threshold && config) { threshold = config->log_level; }
  if (!threshold) { threshold = anvil::tui::level::TUI_INFO; }
  anvil::tui::scope tui_scope{ threshold, args.decorated_logging };

  anvil::libgit2_scope git_guard;

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      anvil::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    anvil::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  if (!config) {
    anvil::tui::error("Execution failed: %s", config_error.c_str());
    return EXIT_FAILURE;
  }

  try {
    auto cmd{ std::visit([&config](auto const &cfg) { return anvil::cmd::create(cfg, *config); },
                         *args.cmd_cfg) };
    cmd->execute();
  } catch (anvil::build_command_failed const &ex) {
    anvil::tui::error("Execution failed: %s", ex.what());
    anvil::tui::error("Workspace preserved at %s", ex.workspace().string().c_str());
    return EXIT_FAILURE;
  } catch (anvil::forge_cancelled const &ex) {
    anvil::tui::error("Execution failed: %s", ex.what());
    anvil::tui::error("Workspace preserved at %s", ex.workspace().string().c_str());
    return EXIT_FAILURE;
  } catch (std::exception const &ex) {
    anvil::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

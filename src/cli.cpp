#include "cli.h"

#include "CLI/CLI.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace anvil {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "anvil - decentralized source-based package manager" };
  app.allow_windows_style_options(false);
  app.require_subcommand(0, 1);

  bool verbose{ false };
  bool quiet{ false };
  std::optional<std::filesystem::path> root;
  auto *verbose_flag{ app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated debug logging (timestamp and level on every line)") };
  app.add_flag("--quiet,-q", quiet, "Only log warnings and errors")->excludes(verbose_flag);
  app.add_option("--root", root, "Anvil root directory (overrides ANVIL_ROOT)");

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto select{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_forge::register_cli(app, select);
  cmd_search::register_cli(app, select);
  cmd_uninstall::register_cli(app, select);
  cmd_update::register_cli(app, select);
  cmd_submit::register_cli(app, select);
  cmd_hammer::register_cli(app, select);
  cmd_unhammer::register_cli(app, select);
  cmd_repos::register_cli(app, select);
  cmd_housekeeping::register_cli(app, select);
  cmd_index_repair::register_cli(app, select);
  cmd_list::register_cli(app, select);
  cmd_info::register_cli(app, select);
  cmd_version::register_cli(app, select);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) {
    args.cli_output = std::string(e.what());
    cmd_cfg.reset();
  }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else if (quiet) {
    args.verbosity = tui::level::TUI_WARN;
  }
  args.overrides.root = root;

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    if (auto const *forge{ std::get_if<cmd_forge::cfg>(&*cmd_cfg) }) {
      args.overrides.timeout_seconds = forge->timeout_seconds;
      args.overrides.jobs = forge->jobs;
      args.overrides.no_submit = forge->no_submit;
    }
    args.cmd_cfg = std::move(cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace anvil

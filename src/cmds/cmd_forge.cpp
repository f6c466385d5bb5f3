#include "cmd_forge.h"

#include "config.h"
#include "forge.h"
#include "repo_index.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_forge::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("forge", "Build and install from an index name, URL or path") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("locator", cfg_ptr->locator, "Index name, repository URL or local directory")
      ->required();
  sub->add_option("--msvc-runtime", cfg_ptr->msvc_runtime, "MSVC runtime for builds (MD or MT)")
      ->check(CLI::IsMember({ "MD", "MT" }, CLI::ignore_case));
  sub->add_flag("--force-pic", cfg_ptr->force_pic, "Add -fPIC to C/C++ flags");
  sub->add_option("--timeout", cfg_ptr->timeout_seconds, "Per-command timeout in seconds")
      ->check(CLI::PositiveNumber);
  sub->add_option("--jobs,-j", cfg_ptr->jobs, "Parallel build jobs")
      ->check(CLI::PositiveNumber);
  sub->add_flag("--keep-workspace", cfg_ptr->keep_workspace, "Keep the build workspace");
  sub->add_flag("--no-submit", cfg_ptr->no_submit, "Do not submit unindexed sources");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_forge::cmd_forge(cmd_forge::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_forge::execute() {
  // --timeout, --jobs and --no-submit reach the pipeline through the resolved config.
  forge_options options{ .force_pic = cfg_.force_pic, .keep_workspace = cfg_.keep_workspace };
  if (cfg_.msvc_runtime) { options.msvc_runtime = config_parse_msvc_runtime(*cfg_.msvc_runtime); }

  repo_index index{ home_ };
  forge_pipeline pipeline{ home_,
                           index,
                           std::move(options),
                           forge_auto_submit_hook(index, home_.config().auto_submit) };

  auto const installed{ pipeline.forge(cfg_.locator) };
  tui::print_stdout("Installed %s%s%s to %s\n",
                    installed.name.c_str(),
                    installed.version.empty() ? "" : " ",
                    installed.version.c_str(),
                    installed.install_path.string().c_str());
  for (auto const &bin : installed.linked_binaries) {
    tui::print_stdout("  %s\n", (home_.bin_dir() / bin).string().c_str());
  }
  if (installed.linked_binaries.empty() && !installed.library_artifacts.empty()) {
    tui::print_stdout("  %zu library artifacts under %s\n",
                      installed.library_artifacts.size(),
                      (installed.install_path / "lib").string().c_str());
  }
}

}  // namespace anvil

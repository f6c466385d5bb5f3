#include "cmd_update.h"

#include "repo_index.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_update::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("update", "Sync the central index and local hammers") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_update::cmd_update(cmd_update::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_update::execute() {
  home_.ensure_layout();
  repo_index index{ home_, repo_index::open_mode::RECOVER };
  auto const summary{ index.update() };
  if (summary.recovered_from) {
    tui::warn("Rebuilt unreadable index; old database kept at %s",
              summary.recovered_from->string().c_str());
  }
  if (!summary.central_synced) {
    tui::warn("Central index not synced; merged what is on disk");
  }
  tui::print_stdout("Added %zu central and %zu local entries",
                    summary.central_added,
                    summary.local_added);
  if (summary.repaired) { tui::print_stdout(", repaired %zu", summary.repaired); }
  tui::print_stdout("\n");
}

}  // namespace anvil

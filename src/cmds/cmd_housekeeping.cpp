#include "cmd_housekeeping.h"

#include "housekeeping.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_housekeeping::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("housekeeping",
                                "Remove stale workspaces and orphaned binary links") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_housekeeping::cmd_housekeeping(cmd_housekeeping::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_housekeeping::execute() {
  auto const s{ housekeeping_run(home_) };
  tui::print_stdout("Removed %zu workspaces, %zu stray files, %zu orphaned links\n",
                    s.removed_workspaces,
                    s.removed_stray_files,
                    s.removed_orphan_binaries);
  if (s.busy_workspaces) { tui::print_stdout("%zu workspaces in use\n", s.busy_workspaces); }
  if (s.recovered_installs || s.removed_backups) {
    tui::print_stdout("Restored %zu interrupted installs, removed %zu old backups\n",
                      s.recovered_installs,
                      s.removed_backups);
  }
}

}  // namespace anvil

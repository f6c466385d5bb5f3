#include "cmd_index_repair.h"

#include "repo_index.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_index_repair::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *index{ app.add_subcommand("index", "Index maintenance") };
  index->require_subcommand(1);
  auto *sub{ index->add_subcommand("repair", "Fix invalid, stale and duplicate index rows") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_index_repair::cmd_index_repair(cmd_index_repair::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_index_repair::execute() {
  home_.ensure_layout();
  repo_index index{ home_, repo_index::open_mode::RECOVER };
  if (auto const &moved{ index.recovered_from() }) {
    tui::print_stdout("Rebuilt unreadable index; old database kept at %s\n",
                      moved->string().c_str());
  }
  tui::print_stdout("Repaired %zu index rows\n", index.repair());
}

}  // namespace anvil

#include "cmd_repos.h"

#include "cmd_common.h"
#include "hammers.h"
#include "repo_index.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_repos::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("repos", "List index entries and registered hammers") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_repos::cmd_repos(cmd_repos::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_repos::execute() {
  repo_index const index{ home_ };
  auto const entries{ index.list() };
  tui::print_stdout("Index (%zu entries):\n", entries.size());
  print_index_entries(entries);

  auto const hammers{ hammer_list(home_) };
  tui::print_stdout("\nHammers (%zu):\n", hammers.size());
  for (auto const &h : hammers) {
    tui::print_stdout("%s  %zu formulas  %s\n",
                      h.name.c_str(),
                      h.formulas,
                      h.remote ? h.remote->c_str() : "(local)");
  }
}

}  // namespace anvil

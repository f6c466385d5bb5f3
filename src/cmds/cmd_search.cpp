#include "cmd_search.h"

#include "cmd_common.h"
#include "repo_index.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_search::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("search", "Search the index by name or description") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("term", cfg_ptr->term, "Search term")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_search::cmd_search(cmd_search::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_search::execute() {
  repo_index const index{ home_ };
  auto const results{ index.search(cfg_.term) };
  if (results.empty()) {
    tui::warn("No packages found matching '%s'", cfg_.term.c_str());
    return;
  }
  tui::info("Found %zu packages", results.size());
  print_index_entries(results);
}

}  // namespace anvil

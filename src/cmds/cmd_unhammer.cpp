#include "cmd_unhammer.h"

#include "hammers.h"
#include "repo_index.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_unhammer::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("unhammer", "Remove a hammer and its index entries") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("name", cfg_ptr->name, "Hammer name")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_unhammer::cmd_unhammer(cmd_unhammer::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_unhammer::execute() {
  repo_index index{ home_ };
  auto const removed{ hammer_remove(home_, index, cfg_.name) };
  tui::print_stdout("Removed hammer %s (%zu entries)\n", cfg_.name.c_str(), removed);
}

}  // namespace anvil

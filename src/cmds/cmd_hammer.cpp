#include "cmd_hammer.h"

#include "hammers.h"
#include "repo_index.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_hammer::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("hammer", "Register a formula repository") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("name", cfg_ptr->name, "Hammer name")->required();
  sub->add_option("url", cfg_ptr->url, "Git URL to clone (omit for an empty local hammer)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_hammer::cmd_hammer(cmd_hammer::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_hammer::execute() {
  home_.ensure_layout();
  repo_index index{ home_ };
  auto const added{ hammer_add(home_, index, cfg_.name, cfg_.url) };
  tui::print_stdout("Hammer %s: %zu entries added\n", cfg_.name.c_str(), added);
}

}  // namespace anvil

#include "cmd_uninstall.h"

#include "install_store.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_uninstall::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("uninstall", "Remove an installed package and its links") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("name", cfg_ptr->name, "Package name")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_uninstall::cmd_uninstall(cmd_uninstall::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_uninstall::execute() {
  auto const result{ install_store_uninstall(home_, cfg_.name) };
  tui::print_stdout("Uninstalled %s (%zu links removed)\n",
                    cfg_.name.c_str(),
                    result.removed_links);
}

}  // namespace anvil

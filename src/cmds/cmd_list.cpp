#include "cmd_list.h"

#include "install_store.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("list", "List installed packages") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_list::cmd_list(cmd_list::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_list::execute() {
  auto const installed{ install_store_list(home_) };
  if (installed.empty()) {
    tui::info("No packages installed");
    return;
  }
  for (auto const &r : installed) {
    tui::print_stdout("%s  %s  %s\n",
                      r.name.c_str(),
                      r.version.empty() ? "-" : r.version.c_str(),
                      r.source.c_str());
  }
}

}  // namespace anvil

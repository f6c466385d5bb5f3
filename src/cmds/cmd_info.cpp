#include "cmd_info.h"

#include "cmd_common.h"
#include "errors.h"
#include "install_store.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_info::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("info", "Show the install record of a package") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("name", cfg_ptr->name, "Package name")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_info::cmd_info(cmd_info::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_info::execute() {
  auto const r{ receipt_read(home_, cfg_.name) };
  if (!r) { throw anvil_error{ "Package '" + cfg_.name + "' is not installed" }; }
  print_receipt(*r);
}

}  // namespace anvil

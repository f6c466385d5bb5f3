#include "cmd_submit.h"

#include "repo_index.h"
#include "submit.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace anvil {

void cmd_submit::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("submit", "Add a repository to a hammer and the index") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("hammer", cfg_ptr->hammer, "Hammer receiving the formula")->required();
  sub->add_option("url", cfg_ptr->url, "Repository URL")->required();
  sub->add_option("description", cfg_ptr->description, "Short description");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_submit::cmd_submit(cmd_submit::cfg cfg, anvil_config const &settings)
    : cfg_{ std::move(cfg) }, home_{ settings } {}

void cmd_submit::execute() {
  home_.ensure_layout();
  repo_index index{ home_ };
  auto const link{ submit_to_hammer(home_,
                                    index,
                                    cfg_.hammer,
                                    { .url = cfg_.url, .description = cfg_.description }) };
  tui::print_stdout("Submit to the central index:\n%s\n", link.c_str());
}

}  // namespace anvil

#pragma once

#include "anvil_home.h"
#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace anvil {

class cmd_repos : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_repos> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_repos(cfg cfg, anvil_config const &settings);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  anvil_home home_;
};

}  // namespace anvil

#pragma once

#include "anvil_home.h"
#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace anvil {

// Pull the central index and merge it with the local hammers.
class cmd_update : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_update> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_update(cfg cfg, anvil_config const &settings);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  anvil_home home_;
};

}  // namespace anvil

#pragma once

#include "anvil_home.h"
#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace anvil {

class cmd_index_repair : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_index_repair> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_index_repair(cfg cfg, anvil_config const &settings);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  anvil_home home_;
};

}  // namespace anvil

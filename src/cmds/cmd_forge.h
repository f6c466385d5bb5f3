#pragma once

#include "anvil_home.h"
#include "cmd.h"

#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace anvil {

// Build and install a package from an index name, URL or local directory.
class cmd_forge : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_forge> {
    std::string locator;
    std::optional<std::string> msvc_runtime;
    bool force_pic{ false };
    std::optional<long> timeout_seconds;
    std::optional<unsigned> jobs;
    bool keep_workspace{ false };
    bool no_submit{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_forge(cfg cfg, anvil_config const &settings);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  anvil_home home_;
};

}  // namespace anvil

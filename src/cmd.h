#pragma once

#include "config.h"
#include "util.h"

#include <memory>

namespace anvil {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute() = 0;

  // Instantiate the command selected by `config` with the process configuration.
  template <typename config>
  static ptr_t create(config const &cfg, anvil_config const &settings);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, anvil_config const &settings) {
  return std::make_unique<typename config::cmd_t>(cfg, settings);
}

}  // namespace anvil

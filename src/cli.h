#pragma once

#include "cmds/cmd_forge.h"
#include "cmds/cmd_hammer.h"
#include "cmds/cmd_housekeeping.h"
#include "cmds/cmd_index_repair.h"
#include "cmds/cmd_info.h"
#include "cmds/cmd_list.h"
#include "cmds/cmd_repos.h"
#include "cmds/cmd_search.h"
#include "cmds/cmd_submit.h"
#include "cmds/cmd_unhammer.h"
#include "cmds/cmd_uninstall.h"
#include "cmds/cmd_update.h"
#include "cmds/cmd_version.h"
#include "config.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace anvil {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_forge::cfg,
                                 cmd_hammer::cfg,
                                 cmd_housekeeping::cfg,
                                 cmd_index_repair::cfg,
                                 cmd_info::cfg,
                                 cmd_list::cfg,
                                 cmd_repos::cfg,
                                 cmd_search::cfg,
                                 cmd_submit::cfg,
                                 cmd_unhammer::cfg,
                                 cmd_uninstall::cfg,
                                 cmd_update::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  config_overrides overrides;              // --root, plus forge's --timeout/--jobs/--no-submit
  std::optional<tui::level> verbosity;     // nullopt defers to ANVIL_LOG_LEVEL
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace anvil

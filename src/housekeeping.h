#pragma once

#include "anvil_home.h"

#include <cstddef>

namespace anvil {

struct housekeeping_summary {
  std::size_t removed_workspaces{ 0 };
  std::size_t busy_workspaces{ 0 };
  std::size_t removed_stray_files{ 0 };
  std::size_t removed_orphan_binaries{ 0 };
  std::size_t recovered_installs{ 0 };  // interrupted re-forges put back in place
  std::size_t removed_backups{ 0 };
};

// Reconcile build/, opt/ and bin/ with the installed packages. Workspaces, packages and
// links owned by an in-flight forge are left alone.
housekeeping_summary housekeeping_run(anvil_home const &home);

}  // namespace anvil

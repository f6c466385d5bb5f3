#pragma once

#include "anvil_home.h"
#include "platform.h"
#include "util.h"

#include <filesystem>
#include <optional>
#include <string>

namespace anvil {

inline constexpr char const kWorkspaceLockName[]{ ".anvil-workspace.lock" };

// build/<name>-<random hex>/, owned by one forge through a lock file inside it. The
// directory survives destruction unless commit() removed it, so failed builds can be
// inspected; housekeeping reclaims it once the lock is free.
class build_workspace : unmovable {
 public:
  build_workspace(anvil_home const &home, std::string const &name);

  std::filesystem::path const &dir() const { return dir_; }

  // Remove the workspace after a successful forge unless `keep`. Returns false when
  // removal failed (logged).
  bool commit(bool keep);

 private:
  anvil_home const &home_;
  std::filesystem::path dir_;
  std::optional<platform::file_lock> lock_;
};

// Lock-file path for a workspace directory.
std::filesystem::path workspace_lock_path(std::filesystem::path const &workspace_dir);

}  // namespace anvil

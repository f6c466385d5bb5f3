#include "workspace.h"

#include "errors.h"
#include "tui.h"

#include <system_error>
#include <utility>

namespace anvil {
namespace {

constexpr int kClaimAttempts{ 16 };

}  // namespace

std::filesystem::path workspace_lock_path(std::filesystem::path const &workspace_dir) {
  return workspace_dir / kWorkspaceLockName;
}

build_workspace::build_workspace(anvil_home const &home, std::string const &name)
    : home_{ home } {
  validate_component_name("package", name);
  std::filesystem::create_directories(home.build_dir());

  // Housekeeping can lock and remove a fresh directory before its owner locks it; such a
  // candidate is abandoned for a new name.
  for (int attempt{ 0 }; !lock_; ++attempt) {
    if (attempt == kClaimAttempts) {
      throw anvil_error{ "Could not claim a build workspace for " + name };
    }
    auto const candidate{ home.build_dir() / (name + "-" + util_random_hex(8)) };
    if (!std::filesystem::create_directory(candidate)) { continue; }

    try {
      platform::file_lock lock{ workspace_lock_path(candidate), platform::lock_mode::try_once };
      if (lock && std::filesystem::is_directory(candidate)) {
        dir_ = candidate;
        lock_.emplace(std::move(lock));
      }
    } catch (std::system_error const &e) {
      tui::debug("Workspace %s vanished: %s", candidate.string().c_str(), e.what());
    }
  }
  tui::debug("Workspace %s", dir_.string().c_str());
}

bool build_workspace::commit(bool keep) {
  if (keep) {
    tui::info("Keeping workspace %s", dir_.string().c_str());
    return true;
  }
  lock_.reset();
  return util_safe_remove_all(dir_, { home_.root(), home_.build_dir() });
}

}  // namespace anvil

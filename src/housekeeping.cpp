#include "housekeeping.h"

#include "artifacts.h"
#include "install_store.h"
#include "platform.h"
#include "tui.h"
#include "util.h"
#include "workspace.h"

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace anvil {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view kPreviousMarker{ ".previous-" };

bool package_in_flight(anvil_home const &home, std::string const &name) {
  platform::file_lock probe{ home.package_lock(name), platform::lock_mode::try_once };
  return !probe;
}

// Package owning `target`, when it lies in opt/<name>/ for a valid package name.
std::optional<std::string> owning_package(anvil_home const &home, fs::path const &target) {
  auto const rel{ target.lexically_normal().lexically_relative(home.opt_dir()) };
  if (rel.empty() || rel.begin() == rel.end()) { return std::nullopt; }
  auto const first{ rel.begin()->string() };
  if (first.empty() || first == "." || first == ".." || first.starts_with(".")) {
    return std::nullopt;
  }
  return first;
}

void sweep_build_dir(anvil_home const &home, housekeeping_summary &summary) {
  std::error_code ec;
  if (!fs::is_directory(home.build_dir(), ec)) { return; }

  for (auto const &entry : fs::directory_iterator{ home.build_dir() }) {
    auto const path{ entry.path() };
    if (!entry.is_directory(ec) || entry.is_symlink(ec)) {
      fs::remove(path, ec);
      if (ec) {
        tui::warn("Could not remove %s: %s", path.string().c_str(), ec.message().c_str());
        continue;
      }
      tui::info("Removed stray file %s", path.filename().string().c_str());
      ++summary.removed_stray_files;
      continue;
    }

    platform::file_lock lock{ workspace_lock_path(path), platform::lock_mode::try_once };
    if (!lock) {
      tui::debug("Workspace %s is in use", path.filename().string().c_str());
      ++summary.busy_workspaces;
      continue;
    }
    if (util_safe_remove_all(path, { home.root(), home.build_dir() })) {
      tui::info("Removed workspace %s", path.filename().string().c_str());
      ++summary.removed_workspaces;
    }
  }
}

// Bin links of a restored install were removed when its re-forge started.
void relink_restored(anvil_home const &home, std::string const &name) {
  auto const restored{ receipt_read(home, name) };
  if (!restored || restored->linked_binaries.empty()) { return; }

  std::vector<std::string> names;
  for (auto const &entry : restored->linked_binaries) {
    names.push_back(util_iends_with(entry, ".bat") ? fs::path{ entry }.stem().string() : entry);
  }
  try {
    auto const binaries{ artifacts_find_binaries(home.package_dir(name), {}, names) };
    for (auto const &link :
         artifacts_link_binaries(binaries, home.bin_dir(), platform::platform_key())) {
      tui::debug("Relinked %s", link.link.string().c_str());
    }
  } catch (std::exception const &e) {
    tui::warn("Could not relink binaries of %s: %s", name.c_str(), e.what());
  }
}

// opt/.<name>.previous-<hex> survives only when a re-forge was interrupted.
void sweep_backups(anvil_home const &home, housekeeping_summary &summary) {
  std::error_code ec;
  if (!fs::is_directory(home.opt_dir(), ec)) { return; }

  for (auto const &entry : fs::directory_iterator{ home.opt_dir() }) {
    auto const filename{ entry.path().filename().string() };
    auto const marker{ filename.find(kPreviousMarker) };
    if (!filename.starts_with(".") || marker == std::string::npos || !entry.is_directory(ec)) {
      continue;
    }

    auto const name{ filename.substr(1, marker - 1) };
    if (name.empty() || name.starts_with(".") || package_in_flight(home, name)) { continue; }

    if (install_store_is_installed(home, name)) {
      if (util_safe_remove_all(entry.path(), { home.root(), home.opt_dir() })) {
        tui::info("Removed stale backup of %s", name.c_str());
        ++summary.removed_backups;
      }
      continue;
    }

    auto const prefix{ home.package_dir(name) };
    if (fs::exists(prefix, ec) &&
        !util_safe_remove_all(prefix, { home.root(), home.opt_dir() })) {
      continue;
    }
    platform::atomic_rename(entry.path(), prefix);
    relink_restored(home, name);
    tui::info("Restored interrupted install of %s", name.c_str());
    ++summary.recovered_installs;
  }
}

void sweep_bin_dir(anvil_home const &home, housekeeping_summary &summary) {
  std::error_code ec;
  if (!fs::is_directory(home.bin_dir(), ec)) { return; }

  std::vector<fs::path> orphans;
  for (auto const &entry : fs::directory_iterator{ home.bin_dir() }) {
    auto const target{ artifacts_link_target(entry.path()) };
    if (!target) { continue; }

    auto const package{ owning_package(home, *target) };
    if (package && package_in_flight(home, *package)) { continue; }
    if (package && install_store_is_installed(home, *package) && fs::exists(*target, ec)) {
      continue;
    }
    tui::info("Removing orphaned %s -> %s",
              entry.path().filename().string().c_str(),
              target->string().c_str());
    orphans.push_back(entry.path());
  }
  summary.removed_orphan_binaries += artifacts_unlink(orphans);
}

}  // namespace

housekeeping_summary housekeeping_run(anvil_home const &home) {
  housekeeping_summary summary;
  sweep_build_dir(home, summary);
  sweep_backups(home, summary);
  sweep_bin_dir(home, summary);
  return summary;
}

}  // namespace anvil

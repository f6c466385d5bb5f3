#include "hammers.h"

#include "errors.h"
#include "libgit2_util.h"
#include "termination.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <system_error>

namespace anvil {
namespace {

namespace fs = std::filesystem;

std::size_t count_formulas(fs::path const &dir) {
  std::size_t count{ 0 };
  for (auto const &sub : { dir, dir / "formulas" }) {
    std::error_code ec;
    if (!fs::is_directory(sub, ec)) { continue; }
    for (auto const &entry : fs::directory_iterator{ sub }) {
      auto const ext{ entry.path().extension() };
      if (entry.is_regular_file(ec) && (ext == ".json" || ext == ".lua")) { ++count; }
    }
  }
  return count;
}

}  // namespace

std::size_t hammer_add(anvil_home const &home,
                       repo_index &index,
                       std::string const &name,
                       std::optional<std::string> const &url) {
  auto const dir{ home.hammer_dir(name) };
  fs::create_directories(home.hammers_dir());

  if (url) {
    if (util_trim(*url).empty()) { throw anvil_error{ "Hammer URL is empty" }; }
    tui::info("Fetching hammer %s from %s", name.c_str(), url->c_str());
    libgit2_pull_or_clone(*url, dir, &termination_cancel_flag());
  } else {
    std::error_code ec;
    if (fs::exists(dir, ec)) {
      tui::info("Hammer %s already exists", name.c_str());
    } else {
      tui::info("Created local hammer %s", name.c_str());
    }
    fs::create_directories(dir / "formulas");
  }

  auto const added{ index.merge_hammer(name) };
  tui::info("Merged %zu entries from hammer %s", added, name.c_str());
  return added;
}

std::size_t hammer_remove(anvil_home const &home, repo_index &index, std::string const &name) {
  auto const dir{ home.hammer_dir(name) };
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) { throw anvil_error{ "Unknown hammer '" + name + "'" }; }

  auto const removed{ index.remove_hammer(name) };
  if (!util_safe_remove_all(dir, { home.root(), home.hammers_dir() })) {
    throw anvil_error{ "Failed to remove " + dir.string() };
  }
  tui::info("Removed hammer %s (%zu index entries)", name.c_str(), removed);
  return removed;
}

std::vector<hammer_info> hammer_list(anvil_home const &home) {
  std::vector<hammer_info> result;
  std::error_code ec;
  if (!fs::is_directory(home.hammers_dir(), ec)) { return result; }

  for (auto const &entry : fs::directory_iterator{ home.hammers_dir() }) {
    auto const name{ entry.path().filename().string() };
    if (!entry.is_directory(ec) || name.starts_with(".")) { continue; }
    result.push_back({ .name = name,
                       .dir = entry.path(),
                       .remote = libgit2_is_repository(entry.path())
                                     ? libgit2_origin_url(entry.path())
                                     : std::nullopt,
                       .formulas = count_formulas(entry.path()) });
  }

  std::sort(result.begin(), result.end(), [](auto const &a, auto const &b) {
    return a.name < b.name;
  });
  return result;
}

}  // namespace anvil

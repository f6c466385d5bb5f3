#include "artifacts.h"

#include "anvil_home.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <set>
#include <stdexcept>
#include <system_error>

namespace anvil {
namespace {

namespace fs = std::filesystem;

constexpr std::array kNonBinarySuffixes{ ".py", ".sh",  ".txt", ".md",    ".c",     ".h",
                                         ".o",  ".a",   ".so",  ".dll",   ".dylib", ".d",
                                         ".rlib", ".json", ".cmake", ".in", ".lib" };

bool is_hidden(fs::path const &p) {
  auto const name{ p.filename().string() };
  return !name.empty() && name.front() == '.';
}

bool has_non_binary_suffix(fs::path const &p) {
  auto const name{ p.filename().string() };
  return std::any_of(kNonBinarySuffixes.begin(), kNonBinarySuffixes.end(), [&](char const *s) {
    return util_iends_with(name, s);
  });
}

bool starts_with_shebang(fs::path const &p) {
  std::ifstream in{ p, std::ios::binary };
  char buf[2]{};
  return in.read(buf, 2) && buf[0] == '#' && buf[1] == '!';
}

// Compiled executable produced by a build, or a file named after the package.
bool is_build_output(fs::path const &p, std::string const &package_name) {
  if (is_hidden(p)) { return false; }
  auto const name{ p.filename().string() };
  if (name == package_name || name == package_name + ".exe") { return true; }
  if (has_non_binary_suffix(p)) { return false; }
  if (util_iends_with(name, ".exe")) { return true; }
  return platform::is_executable(p) && !starts_with_shebang(p);
}

bool lexically_within(fs::path const &path, fs::path const &root) {
  auto const rel{ path.lexically_normal().lexically_relative(root.lexically_normal()) };
  return !rel.empty() && *rel.begin() != "..";
}

void copy_entry(fs::path const &from, fs::path const &to) {
  fs::create_directories(to.parent_path());
  std::error_code ec;
  fs::remove(to, ec);
  if (fs::is_symlink(fs::symlink_status(from))) {
    fs::copy_symlink(from, to);
  } else {
    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
  }
  tui::debug("artifacts: %s -> %s", from.string().c_str(), to.string().c_str());
}

template <typename Fn>
void for_each_file(fs::path const &dir, bool recursive, Fn &&fn) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    tui::debug("artifacts: skipping missing directory %s", dir.string().c_str());
    return;
  }

  std::vector<fs::path> files;
  if (recursive) {
    fs::recursive_directory_iterator it{ dir, fs::directory_options::skip_permission_denied };
    for (fs::recursive_directory_iterator end; it != end; ++it) {
      if (it->is_directory() && is_hidden(it->path())) {
        it.disable_recursion_pending();
        continue;
      }
      if (it->is_regular_file() || it->is_symlink()) { files.push_back(it->path()); }
    }
  } else {
    for (auto const &entry : fs::directory_iterator{ dir }) {
      if (entry.is_regular_file() || entry.is_symlink()) { files.push_back(entry.path()); }
    }
  }
  std::sort(files.begin(), files.end());
  for (auto const &f : files) { fn(f); }
}

std::string shim_text(fs::path const &target) {
  return "@echo off\r\n\"" + target.string() + "\" %*\r\n";
}

}  // namespace

char const *library_class_name(library_class kind) {
  switch (kind) {
    case library_class::STATIC: return "static";
    case library_class::DYNAMIC: return "dynamic";
    case library_class::IMPORT: return "import";
  }
  return "unknown";
}

std::optional<library_class> library_class_parse(std::string_view name) {
  if (name == "static") { return library_class::STATIC; }
  if (name == "dynamic") { return library_class::DYNAMIC; }
  if (name == "import") { return library_class::IMPORT; }
  return std::nullopt;
}

std::optional<library_class> artifacts_classify_library(fs::path const &path,
                                                        std::string_view platform) {
  auto const name{ util_to_lower(path.filename().string()) };
  if (name.empty() || name.front() == '.') { return std::nullopt; }

  if (name.ends_with(".dll.a")) { return library_class::IMPORT; }
  if (name.ends_with(".lib")) {
    if (platform == "windows") {
      std::error_code ec;
      auto dll{ path };
      dll.replace_extension(".dll");
      if (fs::exists(dll, ec)) { return library_class::IMPORT; }
    }
    return library_class::STATIC;
  }
  if (name.ends_with(".a") || name.ends_with(".rlib")) { return library_class::STATIC; }
  if (name.ends_with(".so") || name.ends_with(".dylib") || name.ends_with(".dll") ||
      name.find(".so.") != std::string::npos) {
    return library_class::DYNAMIC;
  }
  return std::nullopt;
}

std::vector<fs::path> artifacts_copy(copy_artifacts_step const &step,
                                     fs::path const &source_dir,
                                     fs::path const &prefix,
                                     std::string const &package_name,
                                     std::string_view platform) {
  using selection = copy_artifacts_step::selection;

  auto const dest_dir{ step.dest.empty() ? prefix : prefix / step.dest };
  std::vector<fs::path> written;
  std::set<std::string> seen;

  for (auto const &rel : step.from) {
    auto const from_dir{ rel.empty() ? source_dir : source_dir / rel };

    if (step.what == selection::TREE) {
      std::error_code ec;
      if (!fs::is_directory(from_dir, ec)) { continue; }
      fs::create_directories(dest_dir);
      fs::copy(from_dir,
               dest_dir,
               fs::copy_options::recursive | fs::copy_options::overwrite_existing);
      written.push_back(dest_dir);
      continue;
    }

    for_each_file(from_dir, step.recursive, [&](fs::path const &file) {
      if (lexically_within(file, prefix)) { return; }

      bool wanted{ false };
      switch (step.what) {
        case selection::EXECUTABLES: wanted = is_build_output(file, package_name); break;
        case selection::LIBRARIES:
          wanted = artifacts_classify_library(file, platform).has_value();
          break;
        case selection::FILES:
          wanted = !is_hidden(file) &&
                   (step.suffixes.empty() ||
                    std::any_of(step.suffixes.begin(), step.suffixes.end(), [&](auto const &s) {
                      return util_iends_with(file.filename().string(), s);
                    }));
          break;
        case selection::TREE: break;
      }
      if (!wanted || !seen.insert(file.filename().string()).second) { return; }

      auto const to{ dest_dir / file.filename() };
      copy_entry(file, to);
      written.push_back(to);
    });
  }

  return written;
}

std::vector<library_artifact> artifacts_collect_libraries(fs::path const &prefix,
                                                          std::string_view platform) {
  std::vector<library_artifact> result;
  for_each_file(prefix / "lib", true, [&](fs::path const &file) {
    if (auto const kind{ artifacts_classify_library(file, platform) }) {
      result.push_back({ .path = file.lexically_relative(prefix), .kind = *kind });
    }
  });
  return result;
}

std::vector<fs::path> artifacts_find_binaries(fs::path const &prefix,
                                              fs::path const &workspace,
                                              std::vector<std::string> const &names) {
  std::vector<fs::path> found;

  if (names.empty()) {
    for (auto const &dir : { prefix / "bin", prefix }) {
      for_each_file(dir, false, [&](fs::path const &file) {
        if (is_hidden(file) || file.filename() == kReceiptFilename) { return; }
        auto const name{ file.filename().string() };
        bool const script_like{ util_iends_with(name, ".exe") || util_iends_with(name, ".bat") ||
                                util_iends_with(name, ".py") || util_iends_with(name, ".sh") };
        if (platform::is_executable(file) || script_like) { found.push_back(file); }
      });
    }
    return found;
  }

  auto const search{ [](fs::path const &root, std::string const &name) -> std::optional<fs::path> {
    std::optional<fs::path> best;
    for_each_file(root, true, [&](fs::path const &file) {
      if (best && platform::is_executable(*best)) { return; }
      if (file.filename() != name && file.stem() != name) { return; }
      if (!best || platform::is_executable(file)) { best = file; }
    });
    return best;
  } };

  for (auto const &name : names) {
    if (auto hit{ search(prefix, name) }) {
      found.push_back(*hit);
      continue;
    }

    std::error_code ec;
    if (!workspace.empty() && fs::is_directory(workspace, ec)) {
      if (auto hit{ search(workspace, name) }) {
        auto const dest{ prefix / "bin" / hit->filename() };
        copy_entry(*hit, dest);
        found.push_back(dest);
        continue;
      }
    }
    tui::warn("Binary '%s' was not produced by the build", name.c_str());
  }
  return found;
}

std::vector<bin_link> artifacts_link_binaries(std::vector<fs::path> const &binaries,
                                              fs::path const &bin_dir,
                                              std::string_view platform) {
  fs::create_directories(bin_dir);
  std::vector<bin_link> links;

  try {
    for (auto const &binary : binaries) {
      auto const target{ fs::absolute(binary).lexically_normal() };
      bool const shim{ platform == "windows" };
      auto const link{ shim ? bin_dir / (target.stem().string() + ".bat")
                            : bin_dir / target.filename() };

      if (auto const previous{ artifacts_link_target(link) }; previous && *previous != target) {
        tui::warn("Replacing %s (was %s)", link.string().c_str(), previous->string().c_str());
      }

      std::error_code ec;
      fs::remove(link, ec);
      if (ec) {
        throw std::system_error{ ec, "cannot replace " + link.string() };
      }

      if (shim) {
        util_write_file_atomic(link, shim_text(target));
      } else {
        fs::create_symlink(target, link);
      }
      tui::debug("Linked %s -> %s", link.string().c_str(), target.string().c_str());
      links.push_back({ .link = link, .target = target });
    }
  } catch (...) {
    // A partial set of links never outlives the call.
    std::vector<fs::path> created;
    for (auto const &link : links) { created.push_back(link.link); }
    artifacts_unlink(created);
    throw;
  }

  return links;
}

std::optional<fs::path> artifacts_link_target(fs::path const &entry) {
  std::error_code ec;
  auto const status{ fs::symlink_status(entry, ec) };
  if (ec || !fs::exists(status)) { return std::nullopt; }

  if (fs::is_symlink(status)) {
    auto target{ fs::read_symlink(entry, ec) };
    if (ec) { return std::nullopt; }
    if (target.is_relative()) { target = entry.parent_path() / target; }
    return target.lexically_normal();
  }

  if (!fs::is_regular_file(status) || !util_iends_with(entry.filename().string(), ".bat")) {
    return std::nullopt;
  }

  std::string text;
  try {
    text = util_load_text(entry);
  } catch (std::exception const &e) {
    tui::debug("artifacts: cannot read shim %s: %s", entry.string().c_str(), e.what());
    return std::nullopt;
  }
  auto const open{ text.find('"') };
  if (open == std::string::npos) { return std::nullopt; }
  auto const close{ text.find('"', open + 1) };
  if (close == std::string::npos) { return std::nullopt; }
  return fs::path{ text.substr(open + 1, close - open - 1) }.lexically_normal();
}

std::vector<fs::path> artifacts_links_into(fs::path const &bin_dir, fs::path const &root) {
  std::vector<fs::path> result;
  std::error_code ec;
  if (!fs::is_directory(bin_dir, ec)) { return result; }

  for (auto const &entry : fs::directory_iterator{ bin_dir }) {
    if (auto const target{ artifacts_link_target(entry.path()) };
        target && lexically_within(*target, root)) {
      result.push_back(entry.path());
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::size_t artifacts_unlink(std::vector<fs::path> const &links) {
  std::size_t removed{ 0 };
  for (auto const &link : links) {
    std::error_code ec;
    if (fs::remove(link, ec)) {
      ++removed;
    } else if (ec) {
      tui::warn("Failed to remove %s: %s", link.string().c_str(), ec.message().c_str());
    }
  }
  return removed;
}

}  // namespace anvil

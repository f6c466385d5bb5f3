#pragma once

#include "build_plan.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace anvil {

enum class library_class { STATIC, DYNAMIC, IMPORT };

char const *library_class_name(library_class kind);
std::optional<library_class> library_class_parse(std::string_view name);

struct library_artifact {
  std::filesystem::path path;  // relative to the install prefix
  library_class kind;

  bool operator==(library_artifact const &) const = default;
};

// Static: .a .rlib .lib. Dynamic: .so (incl. versioned .so.N) .dylib .dll. Import: .dll.a,
// and on windows a .lib with a same-stem .dll beside it.
std::optional<library_class> artifacts_classify_library(std::filesystem::path const &path,
                                                        std::string_view platform);

// Execute a builtin copy step. Missing source directories are skipped. Returns the
// destination paths written.
std::vector<std::filesystem::path> artifacts_copy(copy_artifacts_step const &step,
                                                  std::filesystem::path const &source_dir,
                                                  std::filesystem::path const &prefix,
                                                  std::string const &package_name,
                                                  std::string_view platform);

// Library artifacts under `prefix`/lib, sorted by path.
std::vector<library_artifact> artifacts_collect_libraries(std::filesystem::path const &prefix,
                                                          std::string_view platform);

// Locate binaries to link. With `names`, each is matched by filename or stem under the
// prefix first, then the workspace; workspace hits are copied into `prefix`/bin. Without
// names, executables directly in `prefix`/bin and `prefix` are taken. Hidden files are
// skipped. Result paths lie under `prefix`.
std::vector<std::filesystem::path> artifacts_find_binaries(
    std::filesystem::path const &prefix,
    std::filesystem::path const &workspace,
    std::vector<std::string> const &names);

struct bin_link {
  std::filesystem::path link;    // entry in bin/
  std::filesystem::path target;  // binary under opt/<name>

  bool operator==(bin_link const &) const = default;
};

// Create one bin/ entry per binary: a symlink, or on windows a `<stem>.bat` shim. An
// existing entry of the same name is replaced.
std::vector<bin_link> artifacts_link_binaries(std::vector<std::filesystem::path> const &binaries,
                                              std::filesystem::path const &bin_dir,
                                              std::string_view platform);

// Target of a bin/ entry: symlink destination (possibly dangling) or the quoted path in
// a shim. nullopt for anything else.
std::optional<std::filesystem::path> artifacts_link_target(std::filesystem::path const &entry);

// bin/ entries whose target lies under `root`.
std::vector<std::filesystem::path> artifacts_links_into(std::filesystem::path const &bin_dir,
                                                        std::filesystem::path const &root);

// Remove bin/ entries; failures are logged. Returns the number removed.
std::size_t artifacts_unlink(std::vector<std::filesystem::path> const &links);

}  // namespace anvil

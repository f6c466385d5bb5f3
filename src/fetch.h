#pragma once

#include "formula.h"

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

namespace anvil {

struct acquired_source {
  std::filesystem::path dir;          // directory the build runs in
  std::optional<std::string> remote;  // git remote or download URL, when there is one
  bool in_place{ false };             // local directory used without copying
};

// Make `src` available for building. Git sources are cloned into `workspace`/<name>,
// archives are downloaded (when remote) and extracted beneath `workspace`, local
// directories are used in place with their origin remote read through libgit2.
// Throws anvil_error for unusable locators and std::runtime_error for transfer failures.
acquired_source fetch_source(formula_source const &src,
                             std::filesystem::path const &workspace,
                             std::string const &name,
                             std::atomic_bool const *cancel = nullptr);

// Direct locator (URL or path) as a formula source; nullopt for bare names.
std::optional<formula_source> fetch_classify_locator(std::string const &locator);

// Filesystem path for a local locator: strips file://, expands ~/, makes absolute.
std::filesystem::path fetch_local_path(std::string const &locator);

}  // namespace anvil

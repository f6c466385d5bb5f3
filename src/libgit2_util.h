#pragma once

#include "util.h"

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

namespace anvil {

// RAII wrapper for libgit2 global initialization/shutdown.
struct libgit2_scope : unmovable {
  libgit2_scope();
  ~libgit2_scope();
};

// Clone the default branch of `url` into `dest` (created if missing, must be empty).
// Tries a shallow clone first and falls back to a full one. A set `cancel` flag aborts
// the transfer. Throws std::runtime_error with libgit2's message.
void libgit2_clone(std::string const &url,
                   std::filesystem::path const &dest,
                   std::atomic_bool const *cancel = nullptr);

// Fetch origin and hard-reset the checked-out branch to its remote counterpart; clone
// when `dest` is not a repository yet.
void libgit2_pull_or_clone(std::string const &url,
                           std::filesystem::path const &dest,
                           std::atomic_bool const *cancel = nullptr);

// URL of the "origin" remote of the repository containing `dir`, if any.
std::optional<std::string> libgit2_origin_url(std::filesystem::path const &dir);

bool libgit2_is_repository(std::filesystem::path const &dir);

}  // namespace anvil

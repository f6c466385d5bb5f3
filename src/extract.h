#pragma once

#include <cstdint>
#include <filesystem>

namespace anvil {

struct extract_options {
  int strip_components{ 0 };
};

// Extract `archive_path` beneath `destination`. Entries with absolute paths, `..`
// components or symlinked parents are refused. Returns the number of regular files
// written; throws std::runtime_error on failure or when nothing was extracted.
std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options = {});

bool extract_is_archive_extension(std::filesystem::path const &path);

// Source tarballs usually wrap everything in one top-level directory (name-1.0/).
// Returns that directory when it is the only entry in `dir`, else `dir` itself.
std::filesystem::path extract_source_root(std::filesystem::path const &dir);

}  // namespace anvil

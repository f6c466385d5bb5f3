#pragma once

// Helpers shared by unit tests. Linked into the test binary only.

#include "config.h"
#include "util.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace anvil::test {

// Unique temporary directory, removed recursively on destruction.
class temp_dir : unmovable {
 public:
  explicit temp_dir(std::string_view tag = "unit");
  ~temp_dir();

  std::filesystem::path const &path() const { return path_; }
  std::filesystem::path operator/(std::filesystem::path const &rel) const {
    return path_ / rel;
  }

 private:
  std::filesystem::path path_;
};

// Create parent directories and write `content` to `path`.
void write_file(std::filesystem::path const &path, std::string_view content);

// Write a `#!/bin/sh` script and mark it executable.
void write_script(std::filesystem::path const &path, std::string_view body);

struct archive_member {
  std::string path;
  std::string content;
  int mode{ 0644 };
};

// Writes a gzip'd pax tarball.
void write_tar_gz(std::filesystem::path const &out, std::vector<archive_member> const &files);

// Config rooted at `root` with auto-submit off and a central index URL that does not
// resolve, so nothing touches the network.
anvil_config offline_config(std::filesystem::path const &root);

// Initialize a git repository at `dir` if needed and commit every file in it. Returns
// the repository path as a URL-like string usable as a clone source.
std::string git_commit_all(std::filesystem::path const &dir, std::string_view message);

}  // namespace anvil::test

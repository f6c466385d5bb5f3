#pragma once

#include "anvil_home.h"
#include "repo_index.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace anvil {

struct hammer_info {
  std::string name;
  std::filesystem::path dir;
  std::optional<std::string> remote;  // origin of a cloned hammer
  std::size_t formulas{ 0 };
};

// Register a formula repository under hammers/<name>. With `url` it is cloned, or pulled
// when already present; without one an empty local hammer is created. Its entries are
// merged into the index right away. Returns the number of rows added.
std::size_t hammer_add(anvil_home const &home,
                       repo_index &index,
                       std::string const &name,
                       std::optional<std::string> const &url);

// Remove hammers/<name> and its local index rows. Throws anvil_error for unknown hammers.
// Returns the number of rows removed.
std::size_t hammer_remove(anvil_home const &home, repo_index &index, std::string const &name);

// Registered hammers sorted by name.
std::vector<hammer_info> hammer_list(anvil_home const &home);

}  // namespace anvil

#pragma once

#include "config.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace anvil {

// Context handle passed to every component: the resolved configuration plus the on-disk
// layout under the anvil root.
class anvil_home {
 public:
  explicit anvil_home(anvil_config cfg);

  anvil_config const &config() const { return cfg_; }

  std::filesystem::path const &root() const { return cfg_.root; }
  std::filesystem::path index_dir() const { return root() / "index"; }
  std::filesystem::path index_db() const { return index_dir() / "index.db"; }
  std::filesystem::path index_lock() const { return index_dir() / "index.lock"; }
  std::filesystem::path central_index_dir() const { return index_dir() / "central"; }
  std::filesystem::path hammers_dir() const { return root() / "hammers"; }
  std::filesystem::path opt_dir() const { return root() / "opt"; }
  std::filesystem::path bin_dir() const { return root() / "bin"; }
  std::filesystem::path build_dir() const { return root() / "build"; }

  std::filesystem::path package_dir(std::string_view name) const;
  std::filesystem::path receipt_path(std::string_view name) const;
  std::filesystem::path package_lock(std::string_view name) const;
  std::filesystem::path hammer_dir(std::string_view name) const;

  // Create the directory skeleton. Idempotent.
  void ensure_layout() const;

 private:
  anvil_config cfg_;
};

inline constexpr char const kReceiptFilename[]{ "anvil-receipt.json" };

// Package and hammer names become single path components; rejects empty names, path
// separators, "." / ".." and a leading '.' (reserved for anvil's own bookkeeping).
void validate_component_name(std::string_view kind, std::string_view name);

}  // namespace anvil

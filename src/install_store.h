#pragma once

#include "anvil_home.h"
#include "artifacts.h"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace anvil {

// Installed package record. A package is installed iff its receipt exists.
struct receipt {
  std::string name;
  std::string version;
  std::filesystem::path install_path;
  std::string source;    // locator the package was forged from
  std::string detector;  // plan origin: "formula", "cargo", ...
  std::vector<std::string> linked_binaries;  // entry names in bin/
  std::vector<library_artifact> library_artifacts;
  std::string installed_at;  // UTC, ISO 8601

  bool operator==(receipt const &) const = default;
};

nlohmann::json receipt_to_json(receipt const &r);

// Throws anvil_error naming `context` when the document is malformed.
receipt receipt_from_json(nlohmann::json const &doc, std::string const &context);

// Written last in a forge, via temp file + rename.
void receipt_write(anvil_home const &home, receipt const &r);

// nullopt when not installed; throws anvil_error on an unreadable receipt.
std::optional<receipt> receipt_read(anvil_home const &home, std::string_view name);

// Installed packages sorted by name. Unreadable receipts are logged and skipped.
std::vector<receipt> install_store_list(anvil_home const &home);

bool install_store_is_installed(anvil_home const &home, std::string_view name);

struct uninstall_result {
  std::size_t removed_links{ 0 };
  bool removed_package_dir{ false };
};

// Removes bin/ entries pointing into opt/<name>, then the receipt, then the package
// directory. Throws anvil_error for an unknown package or one being forged.
uninstall_result install_store_uninstall(anvil_home const &home, std::string_view name);

}  // namespace anvil

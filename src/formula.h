#pragma once

#include "nlohmann/json.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace anvil {

enum class source_kind { GIT, LOCAL, ARCHIVE };

struct formula_source {
  source_kind kind;
  std::string locator;  // URL or filesystem path
};

// How a platform-specific command sequence combines with "common".
enum class platform_mode { APPEND, REPLACE };

// Typed package descriptor. Immutable once loaded for an operation.
struct formula {
  std::string name;
  std::string version;
  std::string description;
  std::optional<formula_source> source;
  std::vector<std::string> dependencies;
  std::map<std::string, std::vector<std::string>> build;  // platform key -> commands
  platform_mode mode{ platform_mode::APPEND };
  std::vector<std::string> binaries;
  std::optional<std::string> msvc_runtime;  // "MD" or "MT"
  std::optional<bool> force_pic;

  bool has_build_plan() const;
};

// Parse a formula JSON document. `context` names the document in error messages;
// `default_name` is used when the document has no "name" (anvil.json inside a source
// tree). Unknown fields are ignored. Throws formula_parse_error.
formula formula_parse_json(std::string_view text,
                           std::string const &context,
                           std::optional<std::string> const &default_name = std::nullopt);

formula formula_from_json(nlohmann::json const &doc,
                          std::string const &context,
                          std::optional<std::string> const &default_name = std::nullopt);

// Run an anvil.lua script; it must return a table with the same keys as the JSON form.
formula formula_parse_lua(std::filesystem::path const &script,
                          std::optional<std::string> const &default_name = std::nullopt);

// Load anvil.json or anvil.lua from `path` according to its extension.
formula formula_load_file(std::filesystem::path const &path,
                          std::optional<std::string> const &default_name = std::nullopt);

nlohmann::json formula_to_json(formula const &f);

// "common" followed by the `platform` sequence, or the platform sequence alone when the
// formula uses platform_mode::REPLACE and defines one.
std::vector<std::string> formula_commands_for(formula const &f, std::string_view platform);

// Kind inferred from a locator when "type" is absent: existing path or non-URL -> LOCAL,
// archive extension -> ARCHIVE, otherwise GIT.
source_kind formula_infer_source_kind(std::string_view locator, bool from_path_key);

char const *source_kind_name(source_kind kind);

}  // namespace anvil

#pragma once

#include "formula.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace anvil {

// Builtin plan step: collect build outputs from the source tree into the install prefix.
struct copy_artifacts_step {
  enum class selection {
    EXECUTABLES,  // executable regular files, skipping scripts/objects/libraries
    LIBRARIES,    // typed library artifacts (static, dynamic, import)
    FILES,        // regular files, optionally filtered by suffix
    TREE,         // whole directory tree
  };

  selection what;
  std::vector<std::string> from;  // source-relative directories; "" is the source root
  std::string dest;               // prefix-relative destination
  std::vector<std::string> suffixes;
  bool recursive{ false };

  bool operator==(copy_artifacts_step const &) const = default;
};

// A shell command template or a builtin step.
using plan_step = std::variant<std::string, copy_artifacts_step>;

struct build_plan {
  std::string detector;  // "anvil.json", "cargo", "cmake", ...
  std::string name;
  std::string version;
  std::vector<plan_step> steps;
  std::vector<std::string> binaries;
  std::vector<std::string> dependencies;
  bool library_only{ false };  // artifacts go to lib/ only, nothing is linked into bin/
  bool from_formula{ false };
  std::optional<std::string> msvc_runtime;
  std::optional<bool> force_pic;
};

// Plan for an explicit or indexed formula on `platform`.
build_plan plan_from_formula(formula const &f, std::string_view platform);

struct plan_substitutions {
  std::filesystem::path prefix;
  std::string name;
  unsigned jobs;
};

// Textual {PREFIX}, {NAME} and {JOBS} substitution. The prefix is rendered with forward
// slashes.
std::string plan_render_command(std::string_view command_template,
                                plan_substitutions const &subs);

std::vector<std::string> plan_shell_commands(build_plan const &plan);

std::string plan_describe_step(plan_step const &step);

}  // namespace anvil

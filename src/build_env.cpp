#include "build_env.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace anvil {
namespace {

bool is_mt(std::optional<std::string> const &runtime) {
  return runtime && util_to_lower(*runtime) == "mt";
}

void append_flag(shell_env_t &env, char const *key, std::string_view flag) {
  auto &value{ env[key] };
  if (value.find(flag) != std::string::npos) { return; }
  if (!value.empty()) { value.push_back(' '); }
  value.append(flag);
}

// Runtime family from "value 'MD_DynamicRelease'": leading upper-case letters before '_'.
std::optional<std::string> runtime_token(std::string_view text, std::size_t quote_pos) {
  auto const begin{ quote_pos + 1 };
  auto end{ begin };
  while (end < text.size() && std::isupper(static_cast<unsigned char>(text[end]))) { ++end; }
  if (end == begin || end >= text.size() || text[end] != '_') { return std::nullopt; }
  return std::string{ text.substr(begin, end - begin) };
}

std::optional<std::pair<std::string, std::string>> runtime_mismatch(std::string_view text) {
  constexpr std::string_view kLead{ "value '" };
  constexpr std::string_view kMid{ "' doesn't match value '" };

  for (auto pos{ text.find(kLead) }; pos != std::string_view::npos;
       pos = text.find(kLead, pos + 1)) {
    auto const left{ runtime_token(text, pos + kLead.size() - 1) };
    if (!left) { continue; }
    auto const mid{ text.find(kMid, pos) };
    if (mid == std::string_view::npos) { return std::nullopt; }
    auto const right{ runtime_token(text, mid + kMid.size() - 1) };
    if (!right) { continue; }
    return std::pair{ *left, *right };
  }
  return std::nullopt;
}

}  // namespace

shell_env_t build_env_make(shell_env_t base, build_env_options const &options) {
  if (options.platform == "windows") {
    bool const mt{ is_mt(options.msvc_runtime) };
    std::string const cl_flag{ mt ? "/MT" : "/MD" };

    auto &cl{ base["CL"] };
    if (cl.find("/MT") != std::string::npos || cl.find("/MD") != std::string::npos) {
      cl = util_replace_all(util_replace_all(cl, "/MT", cl_flag), "/MD", cl_flag);
    } else {
      cl = std::string{ util_trim(cl_flag + " " + cl) };
    }
    base["CMAKE_MSVC_RUNTIME_LIBRARY"] = mt ? "MultiThreaded" : "MultiThreadedDLL";
    return base;
  }

  if (options.force_pic) {
    append_flag(base, "CFLAGS", "-fPIC");
    append_flag(base, "CXXFLAGS", "-fPIC");
  }
  return base;
}

std::vector<std::string> build_env_apply_cmake_runtime(
    std::vector<std::string> commands,
    std::optional<std::string> const &msvc_runtime,
    std::string_view platform) {
  if (platform != "windows" || !msvc_runtime) { return commands; }

  std::string const value{ is_mt(msvc_runtime) ? "MultiThreaded" : "MultiThreadedDLL" };
  constexpr std::string_view kFlag{ "-DCMAKE_MSVC_RUNTIME_LIBRARY=" };

  for (auto &command : commands) {
    if (command.find("cmake ") == std::string::npos) { continue; }
    // `cmake --build` and `cmake --install` do not take cache definitions.
    if (command.find("cmake --build") != std::string::npos ||
        command.find("cmake --install") != std::string::npos) {
      continue;
    }

    if (auto const pos{ command.find(kFlag) }; pos != std::string::npos) {
      auto const value_begin{ pos + kFlag.size() };
      auto const value_end{ std::min(command.find_first_of(" \t", value_begin),
                                     command.size()) };
      command.replace(value_begin, value_end - value_begin, value);
    } else {
      command.append(" ").append(kFlag).append(value);
    }
  }
  return commands;
}

std::vector<std::string> build_env_link_suggestions(std::string_view output) {
  std::vector<std::string> suggestions;
  if (output.empty()) { return suggestions; }

  if (output.find("LNK2038") != std::string_view::npos &&
      output.find("RuntimeLibrary") != std::string_view::npos) {
    if (auto const mismatch{ runtime_mismatch(output) }) {
      suggestions.push_back("Detected MSVC runtime mismatch between " + mismatch->first +
                            " and " + mismatch->second +
                            ". Consider building with a consistent C runtime.");
    } else {
      suggestions.push_back(
          "Detected MSVC runtime mismatch (LNK2038). Consider building with consistent "
          "/MD or /MT options.");
    }
    suggestions.push_back("Fix options to try:");
    suggestions.push_back(
        " - Set environment variable ANVIL_MSVC_RUNTIME=MD (dynamic CRT) or "
        "ANVIL_MSVC_RUNTIME=MT (static CRT), or pass --msvc-runtime");
    suggestions.push_back(
        " - For per-formula control, add \"msvc_runtime\": \"MD\" or \"MT\" to the "
        "project's anvil.json");
    suggestions.push_back(
        " - For CMake projects, add -DCMAKE_MSVC_RUNTIME_LIBRARY=MultiThreadedDLL or "
        "MultiThreaded to match");
  }

  bool const pic{ output.find("recompile with -fPIC") != std::string_view::npos ||
                  (output.find("relocation") != std::string_view::npos &&
                   output.find("R_X86_64") != std::string_view::npos) };
  if (pic) {
    suggestions.push_back(
        "Detected link-time relocation errors suggesting -fPIC is required for shared "
        "libraries.");
    suggestions.push_back("Fix options to try:");
    suggestions.push_back(
        " - Set environment variable ANVIL_FORCE_PIC=1 or pass --force-pic to add -fPIC "
        "to CFLAGS/CXXFLAGS.");
    suggestions.push_back(
        " - Add \"force_pic\": true to the project's anvil.json to force PIC for that "
        "formula");
  }

  return suggestions;
}

}  // namespace anvil

#pragma once

#include "shell.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace anvil {

struct build_env_options {
  std::optional<std::string> msvc_runtime;  // "MD" or "MT"; windows defaults to MD
  bool force_pic{ false };
  std::string_view platform;
};

// Environment for build commands: `base` plus CL / CMAKE_MSVC_RUNTIME_LIBRARY on windows,
// or -fPIC appended to CFLAGS/CXXFLAGS elsewhere when force_pic is set.
shell_env_t build_env_make(shell_env_t base, build_env_options const &options);

// On windows, make every cmake invocation carry -DCMAKE_MSVC_RUNTIME_LIBRARY matching the
// requested runtime (replacing an existing value). Other platforms are returned unchanged.
std::vector<std::string> build_env_apply_cmake_runtime(
    std::vector<std::string> commands,
    std::optional<std::string> const &msvc_runtime,
    std::string_view platform);

// Suggestions for LNK2038 runtime mismatches and -fPIC relocation errors found in build
// output; empty when nothing is recognized.
std::vector<std::string> build_env_link_suggestions(std::string_view output);

}  // namespace anvil

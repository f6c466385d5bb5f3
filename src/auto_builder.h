#pragma once

#include "build_plan.h"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace anvil {

// Returns true if `tool` can be invoked. Names containing '/' are paths relative to the
// source directory (e.g. "./gradlew").
using tool_probe_t = std::function<bool(std::string const &tool)>;

tool_probe_t auto_builder_path_probe(std::filesystem::path const &source_dir);

struct detect_request {
  std::filesystem::path source_dir;
  std::string platform;
  std::string name;     // defaults to the source directory name
  tool_probe_t probe;   // defaults to auto_builder_path_probe(source_dir)
};

// Inspect `source_dir` and produce a build plan. An anvil.json or anvil.lua in the tree
// is authoritative; otherwise ecosystem markers are matched in fixed priority.
// Throws formula_parse_error, tool_not_found_error or detection_failure.
build_plan auto_builder_detect(detect_request req);

// Detector names in match order, for diagnostics.
std::vector<std::string_view> auto_builder_detector_names();

}  // namespace anvil

#include "auto_builder.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <utility>

namespace anvil {
namespace {

namespace fs = std::filesystem;

using selection = copy_artifacts_step::selection;

struct detect_context {
  fs::path const &dir;
  std::string_view platform;
  std::string const &name;
  tool_probe_t const &probe;

  bool windows() const { return platform == "windows"; }

  bool has(char const *rel) const {
    std::error_code ec;
    return fs::exists(dir / rel, ec);
  }

  bool has_dir(char const *rel) const {
    std::error_code ec;
    return fs::is_directory(dir / rel, ec);
  }

  // Top-level regular files ending with `suffix`, sorted by name.
  std::vector<fs::path> files_with_suffix(std::string_view suffix) const {
    std::vector<fs::path> result;
    std::error_code ec;
    for (fs::directory_iterator it{ dir, ec }, end; !ec && it != end; it.increment(ec)) {
      if (!it->is_regular_file(ec)) { continue; }
      if (util_iends_with(it->path().filename().string(), suffix)) {
        result.push_back(it->path());
      }
    }
    std::sort(result.begin(), result.end());
    return result;
  }

  std::string read(char const *rel) const {
    try {
      return util_load_text(dir / rel);
    } catch (std::exception const &e) {
      tui::debug("auto_builder: cannot read %s: %s", rel, e.what());
      return {};
    }
  }

  // First candidate the probe accepts; throws tool_not_found_error when none does.
  std::string pick(char const *ecosystem, std::vector<std::string> candidates) const {
    for (auto const &candidate : candidates) {
      if (probe(candidate)) {
        tui::debug("auto_builder: %s tool -> %s", ecosystem, candidate.c_str());
        return candidate;
      }
    }
    throw tool_not_found_error{ ecosystem, std::move(candidates) };
  }

  std::string pick_make() const {
    return pick("make", { "make", "gmake", "mingw32-make", "nmake" });
  }
};

bool dir_has_go_files(fs::path const &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) { return false; }
  for (fs::recursive_directory_iterator it{ dir, ec }, end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == ".go") { return true; }
  }
  return false;
}

std::string make_parallel(std::string const &make) {
  return make == "nmake" ? make : make + " -j{JOBS}";
}

bool makefile_has_install_target(std::string const &text) {
  return text.starts_with("install:") || text.find("\ninstall:") != std::string::npos;
}

copy_artifacts_step copy_build_outputs() {
  return { .what = selection::EXECUTABLES,
           .from = { "", "bin", "build", "dist", "target/release", "cmd" },
           .dest = "bin",
           .recursive = true };
}

build_plan plan_for(detect_context const &ctx, char const *detector) {
  return { .detector = detector, .name = ctx.name };
}

// Language manifests --------------------------------------------------------------

bool cargo_matches(detect_context const &ctx) { return ctx.has("Cargo.toml"); }

bool cargo_has_binary(detect_context const &ctx, std::string const &manifest) {
  if (ctx.has("src/main.rs")) { return true; }
  if (manifest.find("[[bin]]") != std::string::npos) { return true; }
  std::error_code ec;
  auto const bin_dir{ ctx.dir / "src" / "bin" };
  return fs::is_directory(bin_dir, ec) && !fs::is_empty(bin_dir, ec);
}

build_plan cargo_build(detect_context const &ctx) {
  auto const cargo{ ctx.pick("cargo", { "cargo" }) };
  auto const manifest{ ctx.read("Cargo.toml") };
  auto plan{ plan_for(ctx, "cargo") };

  copy_artifacts_step const libraries{ .what = selection::LIBRARIES,
                                       .from = { "target/release" },
                                       .dest = "lib" };

  bool const virtual_workspace{ manifest.find("[workspace]") != std::string::npos &&
                                manifest.find("[package]") == std::string::npos };
  if (virtual_workspace) {
    plan.steps.emplace_back(cargo + " build --release");
    plan.steps.emplace_back(copy_artifacts_step{ .what = selection::EXECUTABLES,
                                                 .from = { "target/release" },
                                                 .dest = "bin" });
    plan.steps.emplace_back(libraries);
  } else if (cargo_has_binary(ctx, manifest)) {
    plan.steps.emplace_back(cargo + " install --path . --root \"{PREFIX}\"");
  } else {
    plan.steps.emplace_back(cargo + " build --release");
    plan.steps.emplace_back(libraries);
    plan.library_only = true;
  }
  return plan;
}

bool node_matches(detect_context const &ctx) { return ctx.has("package.json"); }

// Executables a package.json declares: "bin" as a map of names, or a single path named
// after the (unscoped) package.
std::vector<std::string> node_bin_names(detect_context const &ctx) {
  auto const manifest{ nlohmann::json::parse(ctx.read("package.json"), nullptr, false) };
  if (manifest.is_discarded() || !manifest.is_object()) { return {}; }

  std::vector<std::string> names;
  auto const bin{ manifest.find("bin") };
  if (bin == manifest.end()) { return names; }
  if (bin->is_object()) {
    for (auto const &item : bin->items()) { names.push_back(item.key()); }
  } else if (bin->is_string()) {
    auto const declared{ manifest.find("name") };
    auto name{ declared != manifest.end() && declared->is_string() ? declared->get<std::string>()
                                                                     : ctx.name };
    if (auto const slash{ name.rfind('/') }; slash != std::string::npos) {
      name.erase(0, slash + 1);
    }
    names.push_back(name.empty() ? ctx.name : name);
  }
  return names;
}

build_plan node_build(detect_context const &ctx) {
  auto binaries{ node_bin_names(ctx) };
  if (binaries.empty()) {
    throw detection_failure{ ctx.dir, "package.json declares no \"bin\" executables" };
  }

  auto const tool{ ctx.pick("node", { "npm", "pnpm", "yarn" }) };
  auto plan{ plan_for(ctx, "node") };
  plan.binaries = std::move(binaries);
  plan.steps.emplace_back(tool + " install");
  plan.steps.emplace_back(tool + " run build || true");
  if (tool == "npm") {
    plan.steps.emplace_back("npm install --global --prefix \"{PREFIX}\" .");
  } else if (tool == "pnpm") {
    plan.steps.emplace_back(
        "pnpm add --global --global-dir \"{PREFIX}/lib/pnpm\" --global-bin-dir \"{PREFIX}/bin\" "
        "\"file:$PWD\"");
  } else {
    plan.steps.emplace_back(
        "yarn global add \"file:$PWD\" --global-folder \"{PREFIX}/lib/yarn\" "
        "--prefix \"{PREFIX}\"");
  }
  return plan;
}

bool python_project_matches(detect_context const &ctx) {
  return ctx.has("pyproject.toml") || ctx.has("setup.py");
}

build_plan python_project_build(detect_context const &ctx) {
  auto const python{ ctx.pick("python", { "python3", "python" }) };
  auto plan{ plan_for(ctx, "python") };
  plan.steps.emplace_back(python + " -m pip install . --target \"{PREFIX}\" --upgrade");
  return plan;
}

bool requirements_matches(detect_context const &ctx) {
  return ctx.has("requirements.txt");
}

build_plan requirements_build(detect_context const &ctx) {
  auto const python{ ctx.pick("python", { "python3", "python" }) };
  auto plan{ plan_for(ctx, "requirements") };
  plan.steps.emplace_back(python + " -m pip install -r requirements.txt --target \"{PREFIX}\"");
  return plan;
}

bool gem_matches(detect_context const &ctx) {
  return !ctx.files_with_suffix(".gemspec").empty();
}

build_plan gem_build(detect_context const &ctx) {
  auto const gem{ ctx.pick("gem", { "gem" }) };
  auto const spec{ ctx.files_with_suffix(".gemspec").front().filename().string() };
  auto plan{ plan_for(ctx, "gem") };
  plan.steps.emplace_back(gem + " build \"" + spec + "\"");
  plan.steps.emplace_back(gem + " install *.gem --install-dir \"{PREFIX}\" --bindir "
                                "\"{PREFIX}/bin\" --no-document");
  return plan;
}

bool swift_matches(detect_context const &ctx) { return ctx.has("Package.swift"); }

build_plan swift_build(detect_context const &ctx) {
  auto const swift{ ctx.pick("swift", { "swift" }) };
  auto plan{ plan_for(ctx, "swift") };
  plan.steps.emplace_back(swift + " build -c release");
  plan.steps.emplace_back(copy_artifacts_step{ .what = selection::EXECUTABLES,
                                               .from = { ".build/release" },
                                               .dest = "bin" });
  return plan;
}

bool maven_matches(detect_context const &ctx) { return ctx.has("pom.xml"); }

build_plan maven_build(detect_context const &ctx) {
  auto const mvn{ ctx.pick("maven", { "mvn" }) };
  auto plan{ plan_for(ctx, "maven") };
  plan.steps.emplace_back(mvn + " package");
  plan.steps.emplace_back(copy_artifacts_step{ .what = selection::FILES,
                                               .from = { "target" },
                                               .dest = "",
                                               .suffixes = { ".jar" } });
  return plan;
}

bool gradle_matches(detect_context const &ctx) {
  return ctx.has("build.gradle") || ctx.has("build.gradle.kts") || ctx.has("gradlew");
}

build_plan gradle_build(detect_context const &ctx) {
  auto const gradle{ ctx.pick("gradle", ctx.has("gradlew")
                                            ? std::vector<std::string>{ "./gradlew", "gradle" }
                                            : std::vector<std::string>{ "gradle" }) };
  auto plan{ plan_for(ctx, "gradle") };
  plan.steps.emplace_back(gradle + " build");
  plan.steps.emplace_back(copy_artifacts_step{ .what = selection::FILES,
                                               .from = { "build/libs" },
                                               .dest = "" });
  return plan;
}

bool zig_matches(detect_context const &ctx) { return ctx.has("build.zig"); }

build_plan zig_build(detect_context const &ctx) {
  auto const zig{ ctx.pick("zig", { "zig" }) };
  auto plan{ plan_for(ctx, "zig") };
  plan.steps.emplace_back(zig + " build -Doptimize=ReleaseSafe --prefix \"{PREFIX}\"");
  return plan;
}

// Module descriptor ---------------------------------------------------------------

bool go_matches(detect_context const &ctx) {
  return ctx.has("go.mod") || ctx.has("main.go") || !ctx.files_with_suffix(".go").empty();
}

build_plan go_build(detect_context const &ctx) {
  bool const root_main{ ctx.has("main.go") };
  bool const cmd_mains{ dir_has_go_files(ctx.dir / "cmd") };
  if (!root_main && !cmd_mains) {
    throw detection_failure{ ctx.dir, "Go module has no main package" };
  }

  auto const go{ ctx.pick("go", { "go" }) };
  auto plan{ plan_for(ctx, "go") };
  if (root_main) {
    plan.steps.emplace_back(go + " build -o \"{PREFIX}/bin/{NAME}\" .");
    plan.binaries.push_back(ctx.name);
  } else {
    plan.steps.emplace_back(go + " build -o \"{PREFIX}/bin/\" ./cmd/...");
  }
  return plan;
}

// Project file --------------------------------------------------------------------

bool dotnet_matches(detect_context const &ctx) {
  return !ctx.files_with_suffix(".csproj").empty();
}

build_plan dotnet_build(detect_context const &ctx) {
  auto const dotnet{ ctx.pick("dotnet", { "dotnet" }) };
  auto plan{ plan_for(ctx, "dotnet") };
  plan.steps.emplace_back(dotnet + " publish -c Release -o \"{PREFIX}\"");
  return plan;
}

// Generic build descriptions ------------------------------------------------------

bool cmake_matches(detect_context const &ctx) { return ctx.has("CMakeLists.txt"); }

build_plan cmake_build(detect_context const &ctx) {
  auto const cmake{ ctx.pick("cmake", { "cmake" }) };
  auto plan{ plan_for(ctx, "cmake") };

  std::string configure{ cmake +
                         " -S . -B build -DCMAKE_BUILD_TYPE=Release "
                         "-DCMAKE_INSTALL_PREFIX=\"{PREFIX}\"" };
  if (ctx.windows()) { configure += " -A x64 -DCMAKE_MSVC_RUNTIME_LIBRARY=MultiThreadedDLL"; }

  plan.steps.emplace_back(std::move(configure));
  plan.steps.emplace_back(cmake + " --build build --config Release --parallel {JOBS}");
  plan.steps.emplace_back(cmake + " --install build --config Release");
  return plan;
}

bool meson_matches(detect_context const &ctx) { return ctx.has("meson.build"); }

build_plan meson_build(detect_context const &ctx) {
  auto const meson{ ctx.pick("meson", { "meson" }) };
  ctx.pick("ninja", { "ninja" });
  auto plan{ plan_for(ctx, "meson") };
  plan.steps.emplace_back(meson + " setup build --prefix \"{PREFIX}\" --buildtype release");
  plan.steps.emplace_back(meson + " compile -C build -j {JOBS}");
  plan.steps.emplace_back(meson + " install -C build");
  return plan;
}

bool autotools_matches(detect_context const &ctx) { return ctx.has("configure"); }

build_plan autotools_build(detect_context const &ctx) {
  auto const make{ ctx.pick_make() };
  auto plan{ plan_for(ctx, "autotools") };
  plan.steps.emplace_back("sh ./configure --prefix=\"{PREFIX}\"");
  plan.steps.emplace_back(make_parallel(make));
  plan.steps.emplace_back(make + " install");
  return plan;
}

std::optional<char const *> makefile_name(detect_context const &ctx) {
  for (char const *candidate : { "GNUmakefile", "Makefile", "makefile" }) {
    if (ctx.has(candidate)) { return candidate; }
  }
  return std::nullopt;
}

bool make_matches(detect_context const &ctx) { return makefile_name(ctx).has_value(); }

build_plan make_build(detect_context const &ctx) {
  auto const make{ ctx.pick_make() };
  auto plan{ plan_for(ctx, "make") };
  plan.steps.emplace_back(make_parallel(make));

  if (makefile_has_install_target(ctx.read(*makefile_name(ctx)))) {
    plan.steps.emplace_back(make + " install PREFIX=\"{PREFIX}\"");
  } else {
    plan.steps.emplace_back(copy_build_outputs());
  }
  return plan;
}

bool scons_matches(detect_context const &ctx) { return ctx.has("SConstruct"); }

build_plan scons_build(detect_context const &ctx) {
  auto const scons{ ctx.pick("scons", { "scons" }) };
  auto plan{ plan_for(ctx, "scons") };
  plan.steps.emplace_back(scons + " -j{JOBS} PREFIX=\"{PREFIX}\"");
  plan.steps.emplace_back(scons + " install PREFIX=\"{PREFIX}\" || true");
  plan.steps.emplace_back(copy_build_outputs());
  return plan;
}

bool bazel_matches(detect_context const &ctx) {
  return ctx.has("WORKSPACE") || ctx.has("WORKSPACE.bazel") || ctx.has("MODULE.bazel") ||
         (ctx.has("BUILD") && !ctx.has_dir("BUILD")) || ctx.has("BUILD.bazel");
}

build_plan bazel_build(detect_context const &ctx) {
  auto const bazel{ ctx.pick("bazel", { "bazel" }) };
  auto plan{ plan_for(ctx, "bazel") };
  plan.steps.emplace_back(bazel + " build //...");
  plan.steps.emplace_back(copy_artifacts_step{ .what = selection::EXECUTABLES,
                                               .from = { "bazel-bin" },
                                               .dest = "bin",
                                               .recursive = true });
  return plan;
}

// Build graph ---------------------------------------------------------------------

bool ninja_matches(detect_context const &ctx) { return ctx.has("build.ninja"); }

build_plan ninja_build(detect_context const &ctx) {
  auto const ninja{ ctx.pick("ninja", { "ninja" }) };
  auto plan{ plan_for(ctx, "ninja") };
  plan.steps.emplace_back(ninja + " -j{JOBS}");
  plan.steps.emplace_back(ninja + " install || true");
  plan.steps.emplace_back(copy_build_outputs());
  return plan;
}

// Archives ------------------------------------------------------------------------

constexpr std::array kArchiveSuffixes{ ".tar.xz", ".7z",  ".tar.bz2", ".tar.gz",
                                       ".tgz",    ".tar", ".zip" };

std::optional<fs::path> find_archive(detect_context const &ctx) {
  for (auto const *suffix : kArchiveSuffixes) {
    if (auto files{ ctx.files_with_suffix(suffix) }; !files.empty()) {
      return files.front();
    }
  }
  return std::nullopt;
}

bool archive_matches(detect_context const &ctx) { return find_archive(ctx).has_value(); }

build_plan archive_build(detect_context const &ctx) {
  auto const file{ find_archive(ctx)->filename().string() };
  auto plan{ plan_for(ctx, "archive") };
  plan.steps.emplace_back("mkdir -p \"{PREFIX}\"");
  if (util_iends_with(file, ".zip")) {
    auto const unzip{ ctx.pick("unzip", { "unzip" }) };
    plan.steps.emplace_back(unzip + " -o \"" + file + "\" -d \"{PREFIX}\"");
  } else if (util_iends_with(file, ".7z")) {
    auto const seven{ ctx.pick("7z", { "7z", "7za" }) };
    plan.steps.emplace_back(seven + " x -y -o\"{PREFIX}\" \"" + file + "\"");
  } else {
    auto const tar{ ctx.pick("tar", { "tar" }) };
    plan.steps.emplace_back(tar + " -xf \"" + file + "\" -C \"{PREFIX}\"");
  }
  return plan;
}

struct detector {
  std::string_view name;
  bool (*matches)(detect_context const &);
  build_plan (*build)(detect_context const &);
};

constexpr std::array kDetectors{
  detector{ "cargo", cargo_matches, cargo_build },
  detector{ "node", node_matches, node_build },
  detector{ "python", python_project_matches, python_project_build },
  detector{ "requirements", requirements_matches, requirements_build },
  detector{ "gem", gem_matches, gem_build },
  detector{ "swift", swift_matches, swift_build },
  detector{ "maven", maven_matches, maven_build },
  detector{ "gradle", gradle_matches, gradle_build },
  detector{ "zig", zig_matches, zig_build },
  detector{ "go", go_matches, go_build },
  detector{ "dotnet", dotnet_matches, dotnet_build },
  detector{ "cmake", cmake_matches, cmake_build },
  detector{ "meson", meson_matches, meson_build },
  detector{ "autotools", autotools_matches, autotools_build },
  detector{ "make", make_matches, make_build },
  detector{ "scons", scons_matches, scons_build },
  detector{ "bazel", bazel_matches, bazel_build },
  detector{ "ninja", ninja_matches, ninja_build },
  detector{ "archive", archive_matches, archive_build },
};

std::optional<fs::path> explicit_formula(fs::path const &dir) {
  for (char const *candidate : { "anvil.json", "anvil.lua" }) {
    std::error_code ec;
    if (fs::is_regular_file(dir / candidate, ec)) { return dir / candidate; }
  }
  return std::nullopt;
}

}  // namespace

tool_probe_t auto_builder_path_probe(fs::path const &source_dir) {
  return [source_dir](std::string const &tool) {
    if (tool.find('/') != std::string::npos) {
      return platform::is_executable(source_dir / tool);
    }
    return platform::find_on_path(tool).has_value();
  };
}

build_plan auto_builder_detect(detect_request req) {
  std::error_code ec;
  if (!fs::is_directory(req.source_dir, ec)) {
    throw detection_failure{ req.source_dir, "Source directory does not exist" };
  }
  if (req.name.empty()) {
    req.name = req.source_dir.lexically_normal().filename().string();
    if (req.name.empty()) {
      req.name = req.source_dir.lexically_normal().parent_path().filename().string();
    }
  }
  if (!req.probe) { req.probe = auto_builder_path_probe(req.source_dir); }

  if (auto const path{ explicit_formula(req.source_dir) }) {
    tui::info("Using explicit formula %s", path->filename().string().c_str());
    auto const f{ formula_load_file(*path, req.name) };
    auto plan{ plan_from_formula(f, req.platform) };
    plan.detector = path->filename().string();
    return plan;
  }

  detect_context const ctx{ .dir = req.source_dir,
                             .platform = req.platform,
                             .name = req.name,
                             .probe = req.probe };

  for (auto const &d : kDetectors) {
    if (!d.matches(ctx)) { continue; }
    tui::info("Detected %.*s build system", static_cast<int>(d.name.size()), d.name.data());
    return d.build(ctx);
  }

  throw detection_failure{ req.source_dir };
}

std::vector<std::string_view> auto_builder_detector_names() {
  std::vector<std::string_view> names{ "anvil.json", "anvil.lua" };
  for (auto const &d : kDetectors) { names.push_back(d.name); }
  return names;
}

}  // namespace anvil

#include "auto_builder.h"

#include "errors.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <set>
#include <string>
#include <variant>

namespace anvil {
namespace {

tool_probe_t probe_of(std::set<std::string> tools) {
  return [tools = std::move(tools)](std::string const &tool) { return tools.contains(tool); };
}

tool_probe_t probe_all() {
  return [](std::string const &) { return true; };
}

build_plan detect(test::temp_dir const &dir,
                  tool_probe_t probe = probe_all(),
                  std::string platform = "linux") {
  return auto_builder_detect({ .source_dir = dir.path() / "pkg",
                               .platform = std::move(platform),
                               .probe = std::move(probe) });
}

std::vector<std::string> commands(build_plan const &plan) {
  return plan_shell_commands(plan);
}

}  // namespace

TEST_CASE("auto_builder prefers language manifests over generic build files") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "Cargo.toml", "[package]\nname = \"pkg\"\n");
  test::write_file(dir / "pkg" / "src" / "main.rs", "fn main() {}\n");
  test::write_file(dir / "pkg" / "Makefile", "all:\n\tcc main.c\n");

  auto const plan{ detect(dir) };
  CHECK(plan.detector == "cargo");
  CHECK(plan.name == "pkg");
  CHECK(commands(plan) ==
        std::vector<std::string>{ "cargo install --path . --root \"{PREFIX}\"" });
  CHECK_FALSE(plan.library_only);
}

TEST_CASE("auto_builder explicit formula wins over every marker") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "Cargo.toml", "[package]\n");
  test::write_file(dir / "pkg" / "anvil.json",
                   R"({"build": {"common": ["./build.sh {PREFIX}"], "linux": ["strip x"]},
                       "binaries": ["tool"], "dependencies": ["zlib"]})");

  auto const plan{ detect(dir) };
  CHECK(plan.detector == "anvil.json");
  CHECK(plan.from_formula);
  CHECK(plan.name == "pkg");
  CHECK(commands(plan) == std::vector<std::string>{ "./build.sh {PREFIX}", "strip x" });
  CHECK(plan.binaries == std::vector<std::string>{ "tool" });
  CHECK(plan.dependencies == std::vector<std::string>{ "zlib" });
}

TEST_CASE("auto_builder malformed explicit formula never falls back") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "anvil.json", "{ not json");
  test::write_file(dir / "pkg" / "Makefile", "install:\n\ttrue\n");

  CHECK_THROWS_AS(detect(dir), formula_parse_error);
}

TEST_CASE("auto_builder reads anvil.lua") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "anvil.lua",
                   "return { build = { common = { 'make PREFIX={PREFIX}' } }, "
                   "binaries = { 'hello' } }\n");

  auto const plan{ detect(dir) };
  CHECK(plan.detector == "anvil.lua");
  CHECK(commands(plan) == std::vector<std::string>{ "make PREFIX={PREFIX}" });
  CHECK(plan.binaries == std::vector<std::string>{ "hello" });
}

TEST_CASE("auto_builder make tool fallback") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "Makefile", "all:\n\ttrue\ninstall:\n\ttrue\n");

  SUBCASE("gmake when make is missing") {
    auto const plan{ detect(dir, probe_of({ "gmake" })) };
    CHECK(commands(plan) ==
          std::vector<std::string>{ "gmake -j{JOBS}", "gmake install PREFIX=\"{PREFIX}\"" });
  }

  SUBCASE("nmake takes no jobs flag") {
    auto const plan{ detect(dir, probe_of({ "nmake" }), "windows") };
    CHECK(commands(plan) ==
          std::vector<std::string>{ "nmake", "nmake install PREFIX=\"{PREFIX}\"" });
  }

  SUBCASE("exhausted list") {
    try {
      detect(dir, probe_of({}));
      FAIL("expected tool_not_found_error");
    } catch (tool_not_found_error const &e) {
      CHECK(e.ecosystem() == "make");
      CHECK(e.candidates() ==
            std::vector<std::string>{ "make", "gmake", "mingw32-make", "nmake" });
    }
  }
}

TEST_CASE("auto_builder makefile without install target copies build outputs") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "Makefile", "all:\n\tcc -o hello hello.c\n");

  auto const plan{ detect(dir) };
  REQUIRE(plan.steps.size() == 2);
  CHECK(std::get<std::string>(plan.steps[0]) == "make -j{JOBS}");
  auto const *copy{ std::get_if<copy_artifacts_step>(&plan.steps[1]) };
  REQUIRE(copy);
  CHECK(copy->what == copy_artifacts_step::selection::EXECUTABLES);
  CHECK(copy->dest == "bin");
  CHECK(copy->recursive);
}

TEST_CASE("auto_builder library-only cargo crate") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "Cargo.toml", "[package]\nname = \"pkg\"\n[lib]\n");
  test::write_file(dir / "pkg" / "src" / "lib.rs", "pub fn f() {}\n");

  auto const plan{ detect(dir) };
  CHECK(plan.library_only);
  CHECK(plan.binaries.empty());
  REQUIRE(plan.steps.size() == 2);
  CHECK(std::get<std::string>(plan.steps[0]) == "cargo build --release");
  auto const &copy{ std::get<copy_artifacts_step>(plan.steps[1]) };
  CHECK(copy.what == copy_artifacts_step::selection::LIBRARIES);
  CHECK(copy.from == std::vector<std::string>{ "target/release" });
  CHECK(copy.dest == "lib");
}

TEST_CASE("auto_builder cargo [[bin]] and virtual workspace") {
  test::temp_dir dir{ "autobuild" };

  SUBCASE("explicit bin table") {
    test::write_file(dir / "pkg" / "Cargo.toml", "[package]\n[[bin]]\nname = \"x\"\n");
    CHECK_FALSE(detect(dir).library_only);
  }

  SUBCASE("virtual workspace copies both kinds") {
    test::write_file(dir / "pkg" / "Cargo.toml", "[workspace]\nmembers = [\"a\"]\n");
    auto const plan{ detect(dir) };
    CHECK_FALSE(plan.library_only);
    REQUIRE(plan.steps.size() == 3);
    CHECK(std::get<copy_artifacts_step>(plan.steps[1]).what ==
          copy_artifacts_step::selection::EXECUTABLES);
    CHECK(std::get<copy_artifacts_step>(plan.steps[2]).what ==
          copy_artifacts_step::selection::LIBRARIES);
  }
}

TEST_CASE("auto_builder python and node tool fallbacks") {
  test::temp_dir dir{ "autobuild" };

  SUBCASE("python") {
    test::write_file(dir / "pkg" / "pyproject.toml", "[project]\n");
    auto const plan{ detect(dir, probe_of({ "python" })) };
    CHECK(commands(plan) ==
          std::vector<std::string>{ "python -m pip install . --target \"{PREFIX}\" --upgrade" });
  }

  SUBCASE("node") {
    test::write_file(dir / "pkg" / "package.json",
                     R"({"name": "@acme/tool", "bin": "cli.js"})");
    auto const plan{ detect(dir, probe_of({ "yarn" })) };
    CHECK(plan.binaries == std::vector<std::string>{ "tool" });
    CHECK(commands(plan) ==
          std::vector<std::string>{ "yarn install",
                                    "yarn run build || true",
                                    "yarn global add \"file:$PWD\" --global-folder "
                                    "\"{PREFIX}/lib/yarn\" --prefix \"{PREFIX}\"" });
  }
}

TEST_CASE("auto_builder node bin map with pnpm") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "package.json",
                   R"({"name": "kit", "bin": {"kit-a": "a.js", "kit-b": "b.js"}})");
  auto const plan{ detect(dir, probe_of({ "pnpm" })) };
  CHECK(plan.binaries == std::vector<std::string>{ "kit-a", "kit-b" });
  CHECK_FALSE(plan.library_only);
  auto const cmds{ commands(plan) };
  REQUIRE(cmds.size() == 3);
  CHECK(cmds[0] == "pnpm install");
  CHECK(cmds[2].starts_with("pnpm add --global --global-dir \"{PREFIX}/lib/pnpm\""));
  CHECK(cmds[2].find("--global-bin-dir \"{PREFIX}/bin\"") != std::string::npos);
}

TEST_CASE("auto_builder node package without bin is not forgeable") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "package.json", R"({"name": "just-a-library"})");
  CHECK_THROWS_AS(detect(dir, probe_of({ "npm" })), detection_failure);
}

TEST_CASE("auto_builder gradle wrapper preferred when present") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "build.gradle", "");

  SUBCASE("wrapper") {
    test::write_script(dir / "pkg" / "gradlew", "exit 0");
    auto const plan{ detect(dir, auto_builder_path_probe(dir / "pkg")) };
    CHECK(commands(plan).front() == "./gradlew build");
  }

  SUBCASE("system gradle") {
    auto const plan{ detect(dir, probe_of({ "gradle" })) };
    CHECK(commands(plan).front() == "gradle build");
  }
}

TEST_CASE("auto_builder go module") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "go.mod", "module example.com/pkg\n");

  SUBCASE("root main package") {
    test::write_file(dir / "pkg" / "main.go", "package main\n");
    auto const plan{ detect(dir) };
    CHECK(commands(plan) == std::vector<std::string>{ "go build -o \"{PREFIX}/bin/{NAME}\" ." });
    CHECK(plan.binaries == std::vector<std::string>{ "pkg" });
  }

  SUBCASE("library module") {
    test::write_file(dir / "pkg" / "lib.go", "package pkg\n");
    CHECK_THROWS_AS(detect(dir), detection_failure);
  }
}

TEST_CASE("auto_builder cmake platform override") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "CMakeLists.txt", "project(x)\n");
  test::write_file(dir / "pkg" / "Makefile", "all:\n");

  auto const linux_plan{ detect(dir) };
  CHECK(linux_plan.detector == "cmake");
  CHECK(commands(linux_plan).front().find("CMAKE_MSVC_RUNTIME_LIBRARY") == std::string::npos);

  auto const windows_plan{ detect(dir, probe_all(), "windows") };
  CHECK(commands(windows_plan).front().find("-DCMAKE_MSVC_RUNTIME_LIBRARY=MultiThreadedDLL") !=
        std::string::npos);
}

TEST_CASE("auto_builder archives in suffix priority") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "b.zip", "zip");
  test::write_file(dir / "pkg" / "a.tar.gz", "tgz");

  auto const plan{ detect(dir) };
  CHECK(plan.detector == "archive");
  CHECK(commands(plan).back() == "tar -xf \"a.tar.gz\" -C \"{PREFIX}\"");
}

TEST_CASE("auto_builder no marker") {
  test::temp_dir dir{ "autobuild" };
  test::write_file(dir / "pkg" / "README.md", "hello");

  CHECK_THROWS_AS(detect(dir), detection_failure);
  CHECK_THROWS_AS(auto_builder_detect({ .source_dir = dir / "missing", .platform = "linux" }),
                  detection_failure);
}

TEST_CASE("plan_render_command substitutes every token") {
  auto const rendered{ plan_render_command(
      "install -d {PREFIX}/bin && make -j{JOBS} NAME={NAME} DEST={PREFIX}",
      { .prefix = "/r/opt/tool", .name = "tool", .jobs = 4 }) };
  CHECK(rendered == "install -d /r/opt/tool/bin && make -j4 NAME=tool DEST=/r/opt/tool");
}

TEST_CASE("auto_builder detector order starts with explicit formulas") {
  auto const names{ auto_builder_detector_names() };
  REQUIRE(names.size() > 3);
  CHECK(names[0] == "anvil.json");
  CHECK(names[1] == "anvil.lua");
  CHECK(names[2] == "cargo");
  CHECK(names.back() == "archive");
}

}  // namespace anvil

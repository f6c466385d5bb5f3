#include "shell.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<std::string> run_collect(std::string_view script,
                                     std::optional<std::filesystem::path> cwd = std::nullopt,
                                     anvil::shell_env_t env = anvil::shell_getenv()) {
  std::vector<std::string> lines;
  anvil::shell_run_cfg cfg{ .on_output_line =
                                [&](std::string_view line) { lines.emplace_back(line); },
                            .cwd = std::move(cwd),
                            .env = std::move(env) };
  auto const result{ anvil::shell_run(script, cfg) };
  REQUIRE(result.exit_code == 0);
  REQUIRE_FALSE(result.signal.has_value());
  return lines;
}

}  // namespace

TEST_CASE("shell_getenv captures PATH") {
  auto const env{ anvil::shell_getenv() };
  CHECK(env.contains("PATH"));
}

TEST_CASE("shell_run executes multiple lines") {
  auto const lines{ run_collect("echo first\nprintf 'second\\n'\n") };
  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "first");
  CHECK(lines[1] == "second");
}

TEST_CASE("shell_run merges stderr lines") {
  auto const lines{ run_collect("echo out; echo err 1>&2") };
  REQUIRE(lines.size() == 2);
  CHECK(std::ranges::find(lines, "out") != lines.end());
  CHECK(std::ranges::find(lines, "err") != lines.end());
}

TEST_CASE("shell_run exposes custom environment variables") {
  auto env{ anvil::shell_getenv() };
  env["ANVIL_SHELL_TEST"] = "ok";
  auto const lines{ run_collect("printf '%s\\n' \"$ANVIL_SHELL_TEST\"", std::nullopt, env) };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "ok");
}

TEST_CASE("shell_run honors cwd") {
  anvil::test::temp_dir dir{ "shell" };
  anvil::test::write_file(dir / "marker.txt", "here\n");
  auto const lines{ run_collect("cat marker.txt", dir.path()) };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "here");
}

TEST_CASE("shell_run surfaces non-zero exit codes") {
  anvil::shell_run_cfg cfg{ .env = anvil::shell_getenv() };
  auto const result{ anvil::shell_run("exit 7", cfg) };
  CHECK(result.exit_code == 7);
  CHECK_FALSE(result.signal.has_value());
  CHECK_FALSE(result.timed_out);
  CHECK_FALSE(result.cancelled);
}

TEST_CASE("shell_run delivers trailing partial lines") {
  auto const lines{ run_collect("printf 'without-newline'") };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "without-newline");
}

TEST_CASE("shell_run propagates callback exceptions") {
  anvil::shell_run_cfg cfg{
    .on_output_line = [](std::string_view) { throw std::runtime_error("test"); },
    .env = anvil::shell_getenv(),
  };
  CHECK_THROWS_AS(anvil::shell_run("echo hi", cfg), std::runtime_error);
}

TEST_CASE("shell_run reports signal termination") {
  anvil::shell_run_cfg cfg{ .env = anvil::shell_getenv() };
  auto const result{ anvil::shell_run("kill -TERM $$", cfg) };
  CHECK(result.exit_code == (128 + SIGTERM));
  CHECK(result.signal == SIGTERM);
}

TEST_CASE("shell_run invalid working directory exits 127") {
  anvil::shell_run_cfg cfg{ .cwd = "/nonexistent/directory/path",
                            .env = anvil::shell_getenv() };
  CHECK(anvil::shell_run("echo hi", cfg).exit_code == 127);
}

TEST_CASE("shell_run timeout kills the process group") {
  anvil::test::temp_dir dir{ "shell" };
  auto const marker{ dir / "survived" };

  anvil::shell_run_cfg cfg{ .env = anvil::shell_getenv(),
                            .timeout = std::chrono::milliseconds{ 300 },
                            .kill_grace = std::chrono::milliseconds{ 200 } };

  auto const start{ std::chrono::steady_clock::now() };
  auto const result{ anvil::shell_run(
      "(sleep 3; touch '" + marker.string() + "') &\nsleep 30\n", cfg) };
  auto const elapsed{ std::chrono::steady_clock::now() - start };

  CHECK(result.timed_out);
  CHECK_FALSE(result.cancelled);
  CHECK(result.exit_code != 0);
  CHECK(elapsed < std::chrono::seconds{ 10 });

  std::this_thread::sleep_for(std::chrono::milliseconds{ 3500 });
  CHECK_FALSE(std::filesystem::exists(marker));
}

TEST_CASE("shell_run ignores SIGTERM until SIGKILL escalation") {
  anvil::shell_run_cfg cfg{ .env = anvil::shell_getenv(),
                            .timeout = std::chrono::milliseconds{ 200 },
                            .kill_grace = std::chrono::milliseconds{ 300 } };
  auto const result{ anvil::shell_run("trap '' TERM\nwhile true; do sleep 1; done\n", cfg) };
  CHECK(result.timed_out);
  CHECK(result.signal == SIGKILL);
}

TEST_CASE("shell_run cancel flag stops the command") {
  std::atomic_bool cancel{ false };
  anvil::shell_run_cfg cfg{ .env = anvil::shell_getenv(), .cancel = &cancel };

  std::thread canceller{ [&] {
    std::this_thread::sleep_for(std::chrono::milliseconds{ 200 });
    cancel = true;
  } };
  auto const result{ anvil::shell_run("sleep 30", cfg) };
  canceller.join();

  CHECK(result.cancelled);
  CHECK_FALSE(result.timed_out);
  CHECK(result.exit_code != 0);
}

TEST_CASE("shell_run handles large output") {
  std::vector<std::string> lines;
  anvil::shell_run_cfg cfg{
    .on_output_line = [&](std::string_view line) { lines.emplace_back(line); },
    .env = anvil::shell_getenv(),
  };
  auto const result{ anvil::shell_run(
      "i=0; while [ $i -lt 1000 ]; do printf '%0100d\\n' $i; i=$((i+1)); done", cfg) };
  REQUIRE(result.exit_code == 0);
  CHECK(lines.size() == 1000);
  CHECK(lines[999].size() == 100);
}

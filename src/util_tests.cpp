#include "util.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>
#include <variant>

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto const visitor{ anvil::match{
      [](int x) { return x * 2; },
      [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, v1) == 84);
  CHECK(std::visit(visitor, v2) == 5);
}

TEST_CASE("util_random_hex produces requested length of hex digits") {
  auto const a{ anvil::util_random_hex(12) };
  auto const b{ anvil::util_random_hex(12) };
  CHECK(a.size() == 12);
  CHECK(a.find_first_not_of("0123456789abcdef") == std::string::npos);
  CHECK(a != b);
  CHECK(anvil::util_random_hex(40).size() == 40);
}

TEST_CASE("util_trim and case helpers") {
  CHECK(anvil::util_trim("  value\t\n") == "value");
  CHECK(anvil::util_trim("   ").empty());
  CHECK(anvil::util_to_lower("GitHub.COM") == "github.com");
  CHECK(anvil::util_istarts_with("HTTPS://x", "https://"));
  CHECK_FALSE(anvil::util_istarts_with("ht", "https://"));
  CHECK(anvil::util_iends_with("repo.GIT", ".git"));
}

TEST_CASE("util_replace_all substitutes every occurrence textually") {
  CHECK(anvil::util_replace_all("cp a {PREFIX}/bin && ls {PREFIX}", "{PREFIX}", "/opt/x") ==
        "cp a /opt/x/bin && ls /opt/x");
  CHECK(anvil::util_replace_all("{PREFIX}", "{PREFIX}", "{PREFIX}{PREFIX}") ==
        "{PREFIX}{PREFIX}");
  CHECK(anvil::util_replace_all("no tokens", "{PREFIX}", "x") == "no tokens");
}

TEST_CASE("util_write_file_atomic replaces content and leaves no temp files") {
  anvil::test::temp_dir dir{ "util" };
  auto const target{ dir / "receipt.json" };

  anvil::util_write_file_atomic(target, "first");
  anvil::util_write_file_atomic(target, "second");

  CHECK(anvil::util_load_text(target) == "second");

  int entries{ 0 };
  for ([[maybe_unused]] auto const &e : std::filesystem::directory_iterator(dir.path())) {
    ++entries;
  }
  CHECK(entries == 1);
}

TEST_CASE("util_load_text throws for missing file") {
  CHECK_THROWS_AS(anvil::util_load_text("/nonexistent/anvil/file.txt"), std::runtime_error);
}

TEST_CASE("util_path_is_within") {
  anvil::test::temp_dir dir{ "util" };
  std::filesystem::create_directories(dir / "opt" / "pkg" / "bin");

  CHECK(anvil::util_path_is_within(dir / "opt" / "pkg" / "bin" / "tool", dir / "opt" / "pkg"));
  CHECK(anvil::util_path_is_within(dir / "opt" / "pkg", dir / "opt" / "pkg"));
  CHECK_FALSE(anvil::util_path_is_within(dir / "opt" / "pkg2" / "tool", dir / "opt" / "pkg"));
  CHECK_FALSE(anvil::util_path_is_within(dir / "opt" / "pkg" / ".." / "other", dir / "opt" / "pkg"));
}

TEST_CASE("util_safe_remove_all refuses protected roots") {
  anvil::test::temp_dir dir{ "util" };
  auto const root{ dir / "root" };
  anvil::test::write_file(root / "build" / "ws" / "file.txt", "x");

  CHECK_FALSE(anvil::util_safe_remove_all(root, { root }));
  CHECK(std::filesystem::exists(root / "build" / "ws" / "file.txt"));

  CHECK(anvil::util_safe_remove_all(root / "build" / "ws", { root }));
  CHECK_FALSE(std::filesystem::exists(root / "build" / "ws"));

  CHECK(anvil::util_safe_remove_all(root / "missing", { root }));
}

TEST_CASE("scoped_path_cleanup removes path unless reset") {
  anvil::test::temp_dir dir{ "util" };
  auto const doomed{ dir / "doomed" };
  auto const kept{ dir / "kept" };
  anvil::test::write_file(doomed / "x", "1");
  anvil::test::write_file(kept / "x", "1");

  { anvil::scoped_path_cleanup c{ doomed }; }
  {
    anvil::scoped_path_cleanup c{ kept };
    c.reset();
  }

  CHECK_FALSE(std::filesystem::exists(doomed));
  CHECK(std::filesystem::exists(kept / "x"));
}

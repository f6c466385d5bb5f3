#include "libcurl_util.h"

#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <atomic>
#include <filesystem>

namespace anvil {

TEST_CASE("libcurl_escape percent-encodes query values") {
  CHECK(libcurl_escape("a b&c") == "a%20b%26c");
  CHECK(libcurl_escape("submissions/x.json") == "submissions%2Fx.json");
  CHECK(libcurl_escape("") == "");
}

TEST_CASE("libcurl_download fetches file URLs") {
  test::temp_dir dir{ "curl" };
  test::write_file(dir / "src" / "pkg.tar.gz", "payload");

  auto const url{ "file://" + (dir / "src" / "pkg.tar.gz").string() };
  auto const out{ libcurl_download(url, dir / "dl" / "pkg.tar.gz") };
  CHECK(out == (dir / "dl" / "pkg.tar.gz").lexically_normal());
  CHECK(util_load_text(out) == "payload");
}

TEST_CASE("libcurl_download removes partial output on failure") {
  test::temp_dir dir{ "curl" };
  auto const url{ "file://" + (dir / "missing.tar.gz").string() };

  CHECK_THROWS_AS(libcurl_download(url, dir / "dl" / "out"), std::runtime_error);
  CHECK_FALSE(std::filesystem::exists(dir / "dl" / "out"));
}

TEST_CASE("libcurl_download aborts when cancelled") {
  test::temp_dir dir{ "curl" };
  test::write_file(dir / "big", std::string(1 << 20, 'x'));
  std::atomic_bool cancel{ true };

  auto const url{ "file://" + (dir / "big").string() };
  CHECK_THROWS_AS(libcurl_download(url, dir / "out", &cancel), std::runtime_error);
  CHECK_FALSE(std::filesystem::exists(dir / "out"));
}

}  // namespace anvil

#include "anvil_home.h"

#include "errors.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>

namespace anvil {

TEST_CASE("anvil_home layout") {
  test::temp_dir dir{ "home" };
  anvil_config cfg{};
  cfg.root = dir.path();
  anvil_home const home{ cfg };

  home.ensure_layout();
  home.ensure_layout();

  CHECK(std::filesystem::is_directory(home.index_dir()));
  CHECK(std::filesystem::is_directory(home.hammers_dir()));
  CHECK(std::filesystem::is_directory(home.opt_dir()));
  CHECK(std::filesystem::is_directory(home.bin_dir()));
  CHECK(std::filesystem::is_directory(home.build_dir()));

  CHECK(home.index_db().filename() == "index.db");
  CHECK(home.receipt_path("zlib") == home.opt_dir() / "zlib" / "anvil-receipt.json");
  CHECK(home.package_lock("zlib") == home.opt_dir() / ".zlib.lock");
  CHECK(home.hammer_dir("tools") == home.hammers_dir() / "tools");
}

TEST_CASE("anvil_home rejects unsafe names") {
  anvil_config cfg{};
  cfg.root = "/tmp/anvil-home-names";
  anvil_home const home{ cfg };

  CHECK_THROWS_AS(home.package_dir(""), anvil_error);
  CHECK_THROWS_AS(home.package_dir(".."), anvil_error);
  CHECK_THROWS_AS(home.package_dir("a/b"), anvil_error);
  CHECK_THROWS_AS(home.package_dir(".hidden"), anvil_error);
  CHECK_NOTHROW(home.package_dir("libfoo-1.2"));
}

}  // namespace anvil

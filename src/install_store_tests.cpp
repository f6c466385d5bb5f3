#include "install_store.h"

#include "errors.h"
#include "platform.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>

namespace anvil {

namespace fs = std::filesystem;

namespace {

receipt sample_receipt(anvil_home const &home, std::string const &name) {
  return { .name = name,
           .version = "1.0",
           .install_path = home.package_dir(name),
           .source = "https://e.com/" + name,
           .detector = "make",
           .linked_binaries = { name },
           .library_artifacts = { { fs::path{ "lib" } / "libx.a", library_class::STATIC } } };
}

}  // namespace

TEST_CASE("receipt write and read") {
  test::temp_dir dir{ "store" };
  anvil_home const home{ test::offline_config(dir.path()) };
  home.ensure_layout();

  CHECK_FALSE(receipt_read(home, "tool").has_value());
  CHECK_FALSE(install_store_is_installed(home, "tool"));

  auto const r{ sample_receipt(home, "tool") };
  receipt_write(home, r);

  auto const back{ receipt_read(home, "tool") };
  REQUIRE(back.has_value());
  CHECK_FALSE(back->installed_at.empty());
  auto expected{ r };
  expected.installed_at = back->installed_at;
  CHECK(*back == expected);
  CHECK(install_store_is_installed(home, "tool"));
}

TEST_CASE("receipt_from_json rejects malformed documents") {
  CHECK_THROWS_AS(receipt_from_json(nlohmann::json::array(), "r"), anvil_error);
  CHECK_THROWS_AS(receipt_from_json({ { "name", "x" } }, "r"), anvil_error);
  CHECK_THROWS_AS(receipt_from_json({ { "name", "x" },
                                      { "install_path", "/p" },
                                      { "library_artifacts",
                                        { { { "path", "a" }, { "kind", "weird" } } } } },
                                    "r"),
                  anvil_error);
}

TEST_CASE("install_store_list skips directories without receipts") {
  test::temp_dir dir{ "store" };
  anvil_home const home{ test::offline_config(dir.path()) };
  home.ensure_layout();

  receipt_write(home, sample_receipt(home, "b"));
  receipt_write(home, sample_receipt(home, "a"));
  fs::create_directories(home.opt_dir() / "half-built");
  fs::create_directories(home.opt_dir() / ".a.previous-1234");
  test::write_file(home.receipt_path("broken"), "{");

  auto const installed{ install_store_list(home) };
  REQUIRE(installed.size() == 2);
  CHECK(installed[0].name == "a");
  CHECK(installed[1].name == "b");
}

TEST_CASE("install_store_uninstall removes links then package") {
  test::temp_dir dir{ "store" };
  anvil_home const home{ test::offline_config(dir.path()) };
  home.ensure_layout();

  test::write_script(home.package_dir("tool") / "bin" / "tool", "exit 0");
  test::write_script(home.package_dir("other") / "bin" / "other", "exit 0");
  artifacts_link_binaries({ home.package_dir("tool") / "bin" / "tool",
                            home.package_dir("other") / "bin" / "other" },
                          home.bin_dir(),
                          "linux");
  receipt_write(home, sample_receipt(home, "tool"));

  auto const result{ install_store_uninstall(home, "tool") };
  CHECK(result.removed_links == 1);
  CHECK(result.removed_package_dir);
  CHECK_FALSE(fs::exists(home.package_dir("tool")));
  CHECK_FALSE(fs::exists(fs::symlink_status(home.bin_dir() / "tool")));
  CHECK(fs::exists(home.bin_dir() / "other"));

  CHECK_THROWS_AS(install_store_uninstall(home, "tool"), anvil_error);
}

TEST_CASE("install_store_uninstall refuses a package being forged") {
  test::temp_dir dir{ "store" };
  anvil_home const home{ test::offline_config(dir.path()) };
  home.ensure_layout();
  receipt_write(home, sample_receipt(home, "busy"));

  platform::file_lock held{ home.package_lock("busy") };
  CHECK_THROWS_AS(install_store_uninstall(home, "busy"), anvil_error);
  CHECK(install_store_is_installed(home, "busy"));
}

}  // namespace anvil

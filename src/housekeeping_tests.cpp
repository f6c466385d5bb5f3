#include "housekeeping.h"

#include "artifacts.h"
#include "install_store.h"
#include "platform.h"
#include "test_support.h"
#include "workspace.h"

#include "doctest/doctest.h"

#include <atomic>
#include <filesystem>
#include <thread>

namespace anvil {
namespace {

namespace fs = std::filesystem;

struct housekeeping_fixture {
  test::temp_dir dir{ "housekeeping" };
  anvil_home home{ test::offline_config(dir.path()) };

  housekeeping_fixture() { home.ensure_layout(); }

  // Installed package with one executable at opt/<name>/bin/<name>.
  fs::path install(std::string const &name) {
    auto const binary{ home.package_dir(name) / "bin" / name };
    test::write_script(binary, "echo " + name);
    receipt_write(home, { .name = name, .install_path = home.package_dir(name) });
    return binary;
  }
};

}  // namespace

TEST_CASE("housekeeping removes free workspaces and stray build files") {
  housekeeping_fixture fx;
  fs::path abandoned;
  {
    build_workspace ws{ fx.home, "old" };
    abandoned = ws.dir();
  }
  build_workspace live{ fx.home, "live" };
  test::write_file(fx.home.build_dir() / "leftover.log", "x");

  auto const summary{ housekeeping_run(fx.home) };
  CHECK(summary.removed_workspaces == 1);
  CHECK(summary.busy_workspaces == 1);
  CHECK(summary.removed_stray_files == 1);
  CHECK_FALSE(fs::exists(abandoned));
  CHECK(fs::exists(live.dir()));
  CHECK_FALSE(fs::exists(fx.home.build_dir() / "leftover.log"));
  CHECK(fs::exists(fx.home.root()));
}

TEST_CASE("workspaces created during a concurrent sweep stay owned") {
  housekeeping_fixture fx;
  std::atomic_bool stop{ false };
  std::thread sweeper{ [&] {
    while (!stop.load()) { housekeeping_run(fx.home); }
  } };

  int unowned{ 0 };
  for (int i{ 0 }; i < 64; ++i) {
    build_workspace ws{ fx.home, "race" };
    platform::file_lock probe{ workspace_lock_path(ws.dir()), platform::lock_mode::try_once };
    if (!fs::is_directory(ws.dir()) || probe) { ++unowned; }
  }
  stop = true;
  sweeper.join();
  CHECK(unowned == 0);
}

TEST_CASE("housekeeping removes orphan links and shims") {
  housekeeping_fixture fx;
  auto const kept{ fx.install("kept") };
  artifacts_link_binaries({ kept }, fx.home.bin_dir(), "linux");

  fs::create_symlink(fx.home.package_dir("gone") / "bin" / "gone", fx.home.bin_dir() / "gone");
  test::write_file(fx.home.bin_dir() / "gone-shim.bat",
                   "@echo off\r\n\"" + (fx.home.package_dir("gone") / "gone.exe").string() +
                       "\" %*\r\n");
  fs::create_symlink(fx.dir / "elsewhere", fx.home.bin_dir() / "outside");
  test::write_file(fx.home.bin_dir() / "notes.txt", "not a link");

  auto const summary{ housekeeping_run(fx.home) };
  CHECK(summary.removed_orphan_binaries == 3);
  CHECK(fs::is_symlink(fx.home.bin_dir() / "kept"));
  CHECK_FALSE(fs::exists(fs::symlink_status(fx.home.bin_dir() / "gone")));
  CHECK_FALSE(fs::exists(fx.home.bin_dir() / "gone-shim.bat"));
  CHECK_FALSE(fs::exists(fs::symlink_status(fx.home.bin_dir() / "outside")));
  CHECK(fs::exists(fx.home.bin_dir() / "notes.txt"));
}

TEST_CASE("housekeeping removes dangling links into installed packages") {
  housekeeping_fixture fx;
  fx.install("pkg");
  fs::create_symlink(fx.home.package_dir("pkg") / "bin" / "removed-tool",
                     fx.home.bin_dir() / "removed-tool");

  CHECK(housekeeping_run(fx.home).removed_orphan_binaries == 1);
  CHECK_FALSE(fs::exists(fs::symlink_status(fx.home.bin_dir() / "removed-tool")));
}

TEST_CASE("housekeeping leaves packages being forged alone") {
  housekeeping_fixture fx;
  fs::create_symlink(fx.home.package_dir("busy") / "bin" / "busy", fx.home.bin_dir() / "busy");
  test::write_file(fx.home.opt_dir() / ".busy.previous-0a1b2c3d" / "bin" / "busy", "x");

  platform::file_lock forging{ fx.home.package_lock("busy") };
  auto const summary{ housekeeping_run(fx.home) };
  CHECK(summary.removed_orphan_binaries == 0);
  CHECK(summary.recovered_installs == 0);
  CHECK(fs::is_symlink(fx.home.bin_dir() / "busy"));
  CHECK(fs::exists(fx.home.opt_dir() / ".busy.previous-0a1b2c3d"));
}

TEST_CASE("housekeeping restores an interrupted re-forge") {
  housekeeping_fixture fx;
  auto const backup{ fx.home.opt_dir() / ".tool.previous-00ff00ff" };
  test::write_script(backup / "bin" / "tool", "echo tool");
  test::write_file(backup / kReceiptFilename,
                   receipt_to_json({ .name = "tool",
                                     .install_path = fx.home.package_dir("tool"),
                                     .linked_binaries = { "tool" } })
                       .dump());
  test::write_file(fx.home.package_dir("tool") / "partial", "x");

  auto const summary{ housekeeping_run(fx.home) };
  CHECK(summary.recovered_installs == 1);
  CHECK(summary.removed_orphan_binaries == 0);
  CHECK_FALSE(fs::exists(backup));
  CHECK(install_store_is_installed(fx.home, "tool"));
  CHECK_FALSE(fs::exists(fx.home.package_dir("tool") / "partial"));

  auto const link{ fx.home.bin_dir() / "tool" };
  REQUIRE(fs::is_symlink(link));
  CHECK(artifacts_link_target(link) == fx.home.package_dir("tool") / "bin" / "tool");
  CHECK(fs::exists(link));
}

TEST_CASE("housekeeping drops the backup of a completed re-forge") {
  housekeeping_fixture fx;
  fx.install("tool");
  auto const backup{ fx.home.opt_dir() / ".tool.previous-12345678" };
  test::write_file(backup / "old", "x");

  CHECK(housekeeping_run(fx.home).removed_backups == 1);
  CHECK_FALSE(fs::exists(backup));
  CHECK(install_store_is_installed(fx.home, "tool"));
}

}  // namespace anvil

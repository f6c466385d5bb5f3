#include "fetch.h"

#include "errors.h"
#include "test_support.h"
#include "util.h"
#include "workspace.h"

#include "doctest/doctest.h"

#include <cstdlib>
#include <filesystem>

namespace anvil {

namespace fs = std::filesystem;

TEST_CASE("fetch_classify_locator") {
  CHECK(fetch_classify_locator("https://github.com/a/b")->kind == source_kind::GIT);
  CHECK(fetch_classify_locator("git@github.com:a/b.git")->kind == source_kind::GIT);
  CHECK(fetch_classify_locator("https://e.com/b-1.0.tar.gz")->kind == source_kind::ARCHIVE);
  CHECK(fetch_classify_locator("./here")->kind == source_kind::LOCAL);
  CHECK_FALSE(fetch_classify_locator("ripgrep").has_value());
}

TEST_CASE("fetch_local_path expands file URLs and home") {
  CHECK(fetch_local_path("file:///opt/src") == fs::path{ "/opt/src" });
  CHECK(fetch_local_path("/a/b/../c") == fs::path{ "/a/c" });
  if (char const *home{ std::getenv("HOME") }) {
    CHECK(fetch_local_path("~/proj") == (fs::path{ home } / "proj").lexically_normal());
  }
}

TEST_CASE("fetch_source clones git sources into the workspace") {
  test::temp_dir dir{ "fetch" };
  test::write_file(dir / "upstream" / "Makefile", "all:\n");
  auto const url{ test::git_commit_all(dir / "upstream", "initial") };

  auto const got{ fetch_source({ source_kind::GIT, url }, dir / "ws", "tool") };
  CHECK(got.dir == dir / "ws" / "tool");
  CHECK(fs::exists(got.dir / "Makefile"));
  CHECK(got.remote == url);
  CHECK_FALSE(got.in_place);
}

TEST_CASE("fetch_source extracts local archives") {
  test::temp_dir dir{ "fetch" };
  test::write_tar_gz(dir / "tool-1.0.tar.gz", { { "tool-1.0/Makefile", "all:\n" } });

  auto const got{ fetch_source({ source_kind::ARCHIVE, (dir / "tool-1.0.tar.gz").string() },
                               dir / "ws",
                               "tool") };
  CHECK(got.dir == dir / "ws" / "source" / "tool-1.0");
  CHECK(fs::exists(got.dir / "Makefile"));
  CHECK_FALSE(got.remote.has_value());

  CHECK_THROWS_AS(fetch_source({ source_kind::ARCHIVE, (dir / "nope.tar.gz").string() },
                               dir / "ws2",
                               "tool"),
                  anvil_error);
}

TEST_CASE("fetch_source uses local directories in place") {
  test::temp_dir dir{ "fetch" };
  test::write_file(dir / "proj" / "Makefile", "all:\n");

  auto const got{ fetch_source({ source_kind::LOCAL, (dir / "proj").string() }, dir / "ws", "p") };
  CHECK(got.in_place);
  CHECK(got.dir == (dir / "proj").lexically_normal());
  CHECK_FALSE(got.remote.has_value());
  CHECK_FALSE(fs::exists(dir / "ws"));

  CHECK_THROWS_AS(fetch_source({ source_kind::LOCAL, (dir / "missing").string() }, dir / "ws", "p"),
                  anvil_error);
}

TEST_CASE("fetch_source reads the origin of a local clone") {
  test::temp_dir dir{ "fetch" };
  test::write_file(dir / "upstream" / "f", "x");
  auto const url{ test::git_commit_all(dir / "upstream", "initial") };
  auto const cloned{ fetch_source({ source_kind::GIT, url }, dir / "ws", "proj") };

  auto const got{ fetch_source({ source_kind::LOCAL, cloned.dir.string() }, dir / "ws2", "proj") };
  CHECK(got.remote == url);
}

TEST_CASE("fetch_source ignores the origin of an enclosing checkout") {
  test::temp_dir dir{ "fetch" };
  test::write_file(dir / "upstream" / "tools" / "foo" / "f", "x");
  auto const url{ test::git_commit_all(dir / "upstream", "initial") };
  auto const cloned{ fetch_source({ source_kind::GIT, url }, dir / "ws", "mono") };

  auto const got{ fetch_source(
      { source_kind::LOCAL, (cloned.dir / "tools" / "foo").string() }, dir / "ws2", "foo") };
  CHECK_FALSE(got.remote.has_value());
}

TEST_CASE("build_workspace lifecycle") {
  test::temp_dir dir{ "fetch" };
  anvil_home const home{ test::offline_config(dir.path()) };

  fs::path kept;
  {
    build_workspace ws{ home, "tool" };
    kept = ws.dir();
    CHECK(ws.dir().parent_path() == home.build_dir());
    CHECK(ws.dir().filename().string().starts_with("tool-"));
    CHECK(fs::exists(workspace_lock_path(ws.dir())));

    platform::file_lock probe{ workspace_lock_path(ws.dir()), platform::lock_mode::try_once };
    CHECK_FALSE(probe);
  }
  CHECK(fs::exists(kept));

  build_workspace done{ home, "tool" };
  auto const removed{ done.dir() };
  CHECK(done.commit(false));
  CHECK_FALSE(fs::exists(removed));

  CHECK_THROWS_AS(build_workspace(home, "../evil"), anvil_error);
}

}  // namespace anvil

#include "libgit2_util.h"

#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <atomic>
#include <filesystem>

namespace anvil {

namespace fs = std::filesystem;

TEST_CASE("libgit2_clone checks out the default branch") {
  test::temp_dir dir{ "git" };
  test::write_file(dir / "upstream" / "README.md", "v1\n");
  auto const url{ test::git_commit_all(dir / "upstream", "initial") };

  libgit2_clone(url, dir / "work" / "clone");
  CHECK(util_load_text(dir / "work" / "clone" / "README.md") == "v1\n");
  CHECK(libgit2_is_repository(dir / "work" / "clone"));
  CHECK(libgit2_origin_url(dir / "work" / "clone") == url);
}

TEST_CASE("libgit2_clone reports failures") {
  test::temp_dir dir{ "git" };
  CHECK_THROWS_AS(libgit2_clone((dir / "no-such-repo").string(), dir / "clone"),
                  std::runtime_error);
}

TEST_CASE("libgit2_clone honours a set cancel flag") {
  test::temp_dir dir{ "git" };
  test::write_file(dir / "upstream" / "a.txt", "a");
  auto const url{ test::git_commit_all(dir / "upstream", "initial") };

  std::atomic_bool cancel{ true };
  CHECK_THROWS_AS(libgit2_clone(url, dir / "clone", &cancel), std::runtime_error);
}

TEST_CASE("libgit2_pull_or_clone clones then fast-forwards") {
  test::temp_dir dir{ "git" };
  test::write_file(dir / "upstream" / "index.json", "[]");
  auto const url{ test::git_commit_all(dir / "upstream", "initial") };
  auto const checkout{ dir / "central" };

  libgit2_pull_or_clone(url, checkout);
  CHECK(util_load_text(checkout / "index.json") == "[]");

  test::write_file(dir / "upstream" / "index.json", "[1]");
  test::write_file(dir / "upstream" / "submissions" / "x.json", "{}");
  test::git_commit_all(dir / "upstream", "second");

  libgit2_pull_or_clone(url, checkout);
  CHECK(util_load_text(checkout / "index.json") == "[1]");
  CHECK(fs::exists(checkout / "submissions" / "x.json"));
}

TEST_CASE("libgit2_origin_url on plain directories") {
  test::temp_dir dir{ "git" };
  CHECK_FALSE(libgit2_origin_url(dir.path()).has_value());
  CHECK_FALSE(libgit2_is_repository(dir.path()));

  test::write_file(dir / "repo" / "f", "x");
  test::git_commit_all(dir / "repo", "initial");
  CHECK(libgit2_is_repository(dir / "repo"));
  CHECK_FALSE(libgit2_origin_url(dir / "repo").has_value());
}

}  // namespace anvil

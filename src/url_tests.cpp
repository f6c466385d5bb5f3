#include "url.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <string>
#include <vector>

TEST_CASE("url_normalize equivalent forms") {
  std::string const expected{ "https://github.com/User/Repo" };

  CHECK(anvil::url_normalize("git@github.com:User/Repo.git") == expected);
  CHECK(anvil::url_normalize("https://GitHub.com/User/Repo/") == expected);
  CHECK(anvil::url_normalize("https://github.com/User/Repo.git") == expected);
  CHECK(anvil::url_normalize("ssh://git@github.com/User/Repo.git") == expected);
  CHECK(anvil::url_normalize("ssh://git@GITHUB.com:2222/User/Repo") == expected);
  CHECK(anvil::url_normalize("  https://github.com/User/Repo  ") == expected);
}

TEST_CASE("url_normalize keeps path case and userinfo") {
  CHECK(anvil::url_normalize("https://Example.ORG/Some/Path") ==
        "https://example.org/Some/Path");
  CHECK(anvil::url_normalize("https://Bob@Example.org/x") == "https://Bob@example.org/x");
}

TEST_CASE("url_normalize is idempotent") {
  std::vector<std::string> const inputs{
    "git@github.com:a/b.git",
    "https://HOST/x.git/",
    "https://host/x.git.git//",
    "ssh://user@host:22/p/q/",
    "/local/path/",
    "https://host",
    "",
  };

  for (auto const &in : inputs) {
    CAPTURE(in);
    auto const once{ anvil::url_normalize(in) };
    CHECK(anvil::url_normalize(once) == once);
  }
}

TEST_CASE("url_repo_name") {
  CHECK(anvil::url_repo_name("https://github.com/madler/zlib.git") == "zlib");
  CHECK(anvil::url_repo_name("git@github.com:madler/zlib.git") == "zlib");
  CHECK(anvil::url_repo_name("https://github.com/madler/zlib/") == "zlib");
  CHECK(anvil::url_repo_name("/home/me/src/tool") == "tool");
  CHECK(anvil::url_repo_name("https://github.com").empty());
}

TEST_CASE("url_classify") {
  using anvil::locator_kind;
  CHECK(anvil::url_classify("https://github.com/madler/zlib") == locator_kind::GIT);
  CHECK(anvil::url_classify("git://example.org/x") == locator_kind::GIT);
  CHECK(anvil::url_classify("https://example.org/x-1.0.tar.gz") == locator_kind::ARCHIVE);
  CHECK(anvil::url_classify("https://example.org/x.ZIP?dl=1") == locator_kind::ARCHIVE);
  CHECK(anvil::url_classify("git@github.com:a/b.git") == locator_kind::SSH);
  CHECK(anvil::url_classify("ssh://host/a/b") == locator_kind::SSH);
  CHECK(anvil::url_classify("./some/dir") == locator_kind::LOCAL_PATH);
  CHECK(anvil::url_classify("/opt/archive.tgz") == locator_kind::ARCHIVE);
  CHECK(anvil::url_classify("zlib") == locator_kind::UNKNOWN);
  CHECK(anvil::url_classify("") == locator_kind::UNKNOWN);
  CHECK(anvil::url_classify("s3://bucket/key") == locator_kind::UNKNOWN);

  anvil::test::temp_dir dir{ "url" };
  CHECK(anvil::url_classify(dir.path().string()) == locator_kind::LOCAL_PATH);
}

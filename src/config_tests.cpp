#include "config.h"

#include "doctest/doctest.h"

#include <map>
#include <stdexcept>
#include <string>

namespace {

anvil::env_lookup_t fake_env(std::map<std::string, std::string> values) {
  return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
    auto const it{ values.find(std::string{ name }) };
    if (it == values.end()) { return std::nullopt; }
    return it->second;
  };
}

}  // namespace

TEST_CASE("config_resolve defaults") {
  auto const cfg{ anvil::config_resolve(fake_env({ { "HOME", "/home/smith" } })) };
  CHECK(cfg.root == std::filesystem::path{ "/home/smith/.anvil" });
  CHECK(cfg.auto_submit);
  CHECK_FALSE(cfg.log_level.has_value());
  CHECK_FALSE(cfg.build_timeout.has_value());
  CHECK_FALSE(cfg.jobs.has_value());
  CHECK(cfg.index_url == anvil::kDefaultIndexUrl);
  CHECK_FALSE(cfg.msvc_runtime.has_value());
  CHECK_FALSE(cfg.force_pic);
}

TEST_CASE("config_resolve root precedence") {
  auto env{ fake_env({ { "HOME", "/home/smith" }, { "ANVIL_ROOT", "/opt/anvil" } }) };

  CHECK(anvil::config_resolve(env).root == std::filesystem::path{ "/opt/anvil" });

  anvil::config_overrides o{};
  o.root = "/cli/root";
  CHECK(anvil::config_resolve(env, o).root == std::filesystem::path{ "/cli/root" });

  CHECK_THROWS_AS(anvil::config_resolve(fake_env({})), std::runtime_error);
}

TEST_CASE("config_resolve auto submit toggle") {
  for (char const *off : { "0", "false", "no", "off", "FALSE", " No " }) {
    CAPTURE(off);
    auto const cfg{ anvil::config_resolve(
        fake_env({ { "HOME", "/h" }, { "ANVIL_AUTO_SUBMIT", off } })) };
    CHECK_FALSE(cfg.auto_submit);
  }

  for (char const *on : { "1", "true", "yes", "anything" }) {
    CAPTURE(on);
    auto const cfg{ anvil::config_resolve(
        fake_env({ { "HOME", "/h" }, { "ANVIL_AUTO_SUBMIT", on } })) };
    CHECK(cfg.auto_submit);
  }

  anvil::config_overrides o{};
  o.no_submit = true;
  CHECK_FALSE(anvil::config_resolve(fake_env({ { "HOME", "/h" } }), o).auto_submit);
}

TEST_CASE("config_resolve numeric settings") {
  auto const cfg{ anvil::config_resolve(fake_env({ { "HOME", "/h" },
                                                   { "ANVIL_BUILD_TIMEOUT", "90" },
                                                   { "ANVIL_JOBS", "3" } })) };
  REQUIRE(cfg.build_timeout.has_value());
  CHECK(cfg.build_timeout->count() == 90);
  CHECK(cfg.jobs == 3u);

  anvil::config_overrides o{};
  o.timeout_seconds = 5;
  o.jobs = 8;
  auto const overridden{ anvil::config_resolve(
      fake_env({ { "HOME", "/h" }, { "ANVIL_BUILD_TIMEOUT", "90" } }), o) };
  CHECK(overridden.build_timeout->count() == 5);
  CHECK(overridden.jobs == 8u);

  CHECK_THROWS_AS(anvil::config_resolve(
                      fake_env({ { "HOME", "/h" }, { "ANVIL_BUILD_TIMEOUT", "soon" } })),
                  std::runtime_error);
  CHECK_THROWS_AS(
      anvil::config_resolve(fake_env({ { "HOME", "/h" }, { "ANVIL_JOBS", "0" } })),
      std::runtime_error);
}

TEST_CASE("config_resolve build environment settings") {
  auto const cfg{ anvil::config_resolve(fake_env({ { "HOME", "/h" },
                                                   { "ANVIL_MSVC_RUNTIME", "mt" },
                                                   { "ANVIL_FORCE_PIC", "true" },
                                                   { "ANVIL_LOG_LEVEL", "warn" } })) };
  CHECK(cfg.msvc_runtime == "MT");
  CHECK(cfg.force_pic);
  CHECK(cfg.log_level == anvil::tui::level::TUI_WARN);

  CHECK_THROWS_AS(anvil::config_resolve(
                      fake_env({ { "HOME", "/h" }, { "ANVIL_MSVC_RUNTIME", "MDd" } })),
                  std::runtime_error);
  CHECK_THROWS_AS(
      anvil::config_resolve(fake_env({ { "HOME", "/h" }, { "ANVIL_LOG_LEVEL", "loud" } })),
      std::runtime_error);
}

TEST_CASE("config_parse_bool") {
  CHECK(anvil::config_parse_bool("on") == true);
  CHECK(anvil::config_parse_bool("Off") == false);
  CHECK_FALSE(anvil::config_parse_bool("maybe").has_value());
}

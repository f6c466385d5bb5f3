#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "CLI/CLI.hpp"
#include "archive.h"
#include "git2.h"
#include "nlohmann/json.hpp"
#include "sol/sol.hpp"
#include "tbb/version.h"

#include <curl/curl.h>
#include <sqlite3.h>

#include <memory>

#ifndef ANVIL_VERSION_STR
#error "ANVIL_VERSION_STR must be defined by the build system"
#endif

namespace anvil {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, anvil_config const & /*settings*/)
    : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::print_stdout("anvil %s (%.*s)\n",
                    ANVIL_VERSION_STR,
                    static_cast<int>(platform::platform_key().size()),
                    platform::platform_key().data());

  tui::info("Third-party component versions:");

  int git_major{ 0 };
  int git_minor{ 0 };
  int git_revision{ 0 };
  git_libgit2_version(&git_major, &git_minor, &git_revision);
  tui::info("  libgit2: %d.%d.%d", git_major, git_minor, git_revision);

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  tui::info("  libcurl: %s", curl_info->version);
  tui::info("  libarchive: %s", archive_version_details());
  tui::info("  SQLite: %s", sqlite3_libversion());
  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  nlohmann/json: %d.%d.%d",
            NLOHMANN_JSON_VERSION_MAJOR,
            NLOHMANN_JSON_VERSION_MINOR,
            NLOHMANN_JSON_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace anvil

#include <git2.h>
#include <curl/curl.h>
#include <archive.h>
#include <archive_entry.h>
#include <sqlite3.h>
#include <tbb/flow_graph.h>
#include <tbb/global_control.h>

#include <atomic>
#include <string>
#include <string_view>

#include "CLI/CLI.hpp"
#include "lua.hpp"
#include "nlohmann/json.hpp"
#include "sol/sol.hpp"

int main() {
    if (git_libgit2_init() < 0) {
        return 1;
    }
    const auto features = git_libgit2_features();
    git_libgit2_shutdown();
    if ((features & GIT_FEATURE_HTTPS) == 0) {
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        return 1;
    }
    const curl_version_info_data *info = curl_version_info(CURLVERSION_NOW);
    if (!info || (info->features & CURL_VERSION_SSL) == 0U) {
        curl_global_cleanup();
        return 1;
    }
    curl_global_cleanup();

    archive *reader = archive_read_new();
    if (!reader) {
        return 1;
    }
    if (archive_read_support_filter_gzip(reader) != ARCHIVE_OK ||
        archive_read_support_format_tar(reader) != ARCHIVE_OK ||
        archive_read_support_format_zip(reader) != ARCHIVE_OK) {
        archive_read_free(reader);
        return 1;
    }
    archive_read_free(reader);

    sqlite3 *db = nullptr;
    if (sqlite3_open(":memory:", &db) != SQLITE_OK) {
        sqlite3_close(db);
        return 1;
    }
    const int exec_rc = sqlite3_exec(
        db, "CREATE TABLE packages (name TEXT PRIMARY KEY, url TEXT NOT NULL)",
        nullptr, nullptr, nullptr);
    sqlite3_close(db);
    if (exec_rc != SQLITE_OK) {
        return 1;
    }

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string);
    const int answer = lua.script("return 6 * 7");
    if (answer != 42) {
        return 1;
    }

    tbb::global_control control(tbb::global_control::max_allowed_parallelism, 2);
    std::atomic<int> visited{0};
    tbb::flow::graph g;
    tbb::flow::continue_node<tbb::flow::continue_msg> a(
        g, [&](tbb::flow::continue_msg const &) { ++visited; });
    tbb::flow::continue_node<tbb::flow::continue_msg> b(
        g, [&](tbb::flow::continue_msg const &) { ++visited; });
    tbb::flow::make_edge(a, b);
    a.try_put(tbb::flow::continue_msg{});
    g.wait_for_all();
    if (visited != 2) {
        return 1;
    }

    const auto doc = nlohmann::json::parse(R"({"name":"anvil","build":{"common":["make"]}})");
    if (doc.at("build").at("common").at(0).get<std::string>() != "make") {
        return 1;
    }

    CLI::App app{"smoke"};
    std::string locator;
    app.add_option("locator", locator);
    const char *argv[] = {"smoke", "ripgrep"};
    app.parse(2, argv);
    if (std::string_view{locator} != "ripgrep") {
        return 1;
    }

    return 0;
}

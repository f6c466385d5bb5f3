#include "fetch.h"

#include "errors.h"
#include "extract.h"
#include "libcurl_util.h"
#include "libgit2_util.h"
#include "tui.h"
#include "url.h"
#include "util.h"

#include <cstdlib>
#include <system_error>

namespace anvil {
namespace {

namespace fs = std::filesystem;

bool is_remote_url(std::string_view locator) {
  return util_istarts_with(locator, "http://") || util_istarts_with(locator, "https://") ||
         util_istarts_with(locator, "ftp://");
}

std::string download_filename(std::string_view url) {
  auto path{ url.substr(0, url.find_first_of("?#")) };
  auto const slash{ path.find_last_of('/') };
  auto const name{ slash == std::string_view::npos ? path : path.substr(slash + 1) };
  return name.empty() ? std::string{ "download.tar.gz" } : std::string{ name };
}

acquired_source fetch_git(std::string const &url,
                          fs::path const &workspace,
                          std::string const &name,
                          std::atomic_bool const *cancel) {
  auto const dest{ workspace / name };
  tui::info("Cloning %s", url.c_str());
  libgit2_clone(url, dest, cancel);
  return { .dir = dest, .remote = url };
}

acquired_source fetch_archive(std::string const &locator,
                              fs::path const &workspace,
                              std::atomic_bool const *cancel) {
  fs::path archive;
  std::optional<std::string> remote;
  if (is_remote_url(locator)) {
    tui::info("Downloading %s", locator.c_str());
    archive = libcurl_download(locator, workspace / "download" / download_filename(locator), cancel);
    remote = locator;
  } else {
    archive = fetch_local_path(locator);
    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
      throw anvil_error{ "Archive not found: " + archive.string() };
    }
  }

  auto const extract_dir{ workspace / "source" };
  fs::create_directories(extract_dir);
  auto const files{ extract(archive, extract_dir) };
  tui::debug("Extracted %llu files from %s",
             static_cast<unsigned long long>(files),
             archive.filename().string().c_str());
  return { .dir = extract_source_root(extract_dir), .remote = remote };
}

acquired_source fetch_local(std::string const &locator) {
  auto const dir{ fetch_local_path(locator) };
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw anvil_error{ "Local source is not a directory: " + dir.string() };
  }
  acquired_source result{ .dir = dir, .in_place = true };
  result.remote = libgit2_origin_url(dir);
  if (result.remote) { tui::debug("Local source remote: %s", result.remote->c_str()); }
  return result;
}

}  // namespace

fs::path fetch_local_path(std::string const &locator) {
  std::string_view value{ locator };
  if (util_istarts_with(value, "file://")) { value.remove_prefix(7); }

  fs::path path;
  if (value == "~" || value.starts_with("~/")) {
    char const *home{ std::getenv("HOME") };
    if (!home) { throw anvil_error{ "Cannot expand '~' without HOME" }; }
    path = fs::path{ home } / std::string{ value.substr(value.size() > 1 ? 2 : 1) };
  } else {
    path = fs::path{ std::string{ value } };
  }
  return fs::absolute(path).lexically_normal();
}

std::optional<formula_source> fetch_classify_locator(std::string const &locator) {
  switch (url_classify(locator)) {
    case locator_kind::GIT:
    case locator_kind::SSH: return formula_source{ source_kind::GIT, locator };
    case locator_kind::ARCHIVE: return formula_source{ source_kind::ARCHIVE, locator };
    case locator_kind::LOCAL_PATH: return formula_source{ source_kind::LOCAL, locator };
    case locator_kind::UNKNOWN: return std::nullopt;
  }
  return std::nullopt;
}

acquired_source fetch_source(formula_source const &src,
                             fs::path const &workspace,
                             std::string const &name,
                             std::atomic_bool const *cancel) {
  switch (src.kind) {
    case source_kind::GIT: return fetch_git(src.locator, workspace, name, cancel);
    case source_kind::ARCHIVE: return fetch_archive(src.locator, workspace, cancel);
    case source_kind::LOCAL: return fetch_local(src.locator);
  }
  throw anvil_error{ "Unsupported source kind for " + src.locator };
}

}  // namespace anvil

#include "url.h"

#include "extract.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace anvil {
namespace {

std::string_view strip_query_and_fragment(std::string_view uri) {
  auto const pos{ uri.find_first_of("?#") };
  return pos == std::string_view::npos ? uri : uri.substr(0, pos);
}

bool looks_like_scp_uri(std::string_view uri) {
  if (uri.find("://") != std::string_view::npos) { return false; }

  auto const colon{ uri.find(':') };
  if (colon == std::string_view::npos || colon + 1 >= uri.size()) { return false; }

  auto const user_host{ uri.substr(0, colon) };
  auto const at{ user_host.find('@') };

  return at != std::string_view::npos && at > 0 &&
         user_host.find('/') == std::string_view::npos;
}

bool has_ssh_scheme(std::string_view uri) {
  return util_istarts_with(uri, "ssh://") || util_istarts_with(uri, "git+ssh://");
}

std::string scp_to_https(std::string_view uri) {
  auto const colon{ uri.find(':') };
  auto const at{ uri.find('@') };
  auto const host{ uri.substr(at + 1, colon - at - 1) };
  auto path{ uri.substr(colon + 1) };
  while (!path.empty() && path.front() == '/') { path.remove_prefix(1); }
  return std::string{ "https://" }.append(host).append("/").append(path);
}

std::string ssh_to_https(std::string_view uri) {
  auto rest{ uri.substr(uri.find("://") + 3) };
  auto const slash{ rest.find('/') };
  auto authority{ rest.substr(0, slash) };
  auto const path{ slash == std::string_view::npos ? std::string_view{}
                                                   : rest.substr(slash) };

  if (auto const at{ authority.rfind('@') }; at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }
  if (auto const port{ authority.find(':') }; port != std::string_view::npos) {
    authority = authority.substr(0, port);
  }
  return std::string{ "https://" }.append(authority).append(path);
}

void lowercase_host(std::string &url) {
  auto const scheme_end{ url.find("://") };
  if (scheme_end == std::string::npos) { return; }

  auto const authority_begin{ scheme_end + 3 };
  auto const authority_end{ std::min(url.find('/', authority_begin), url.size()) };

  auto host_begin{ authority_begin };
  if (auto const at{ url.rfind('@', authority_end) };
      at != std::string::npos && at >= authority_begin && at < authority_end) {
    host_begin = at + 1;
  }

  for (auto i{ host_begin }; i < authority_end; ++i) {
    url[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(url[i])));
  }
}

void strip_git_suffix_and_slashes(std::string &url) {
  bool changed{ true };
  while (changed) {
    changed = false;
    while (!url.empty() && url.back() == '/' && !url.ends_with("://")) {
      url.pop_back();
      changed = true;
    }
    if (util_iends_with(url, ".git") && url.size() > 4) {
      url.resize(url.size() - 4);
      changed = true;
    }
  }
}

bool looks_like_local_path(std::string_view locator) {
  if (locator.starts_with('/') || locator.starts_with("./") || locator.starts_with("../") ||
      locator.starts_with("~/") || locator == "." || locator == "..") {
    return true;
  }
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::path{ locator }, ec);
}

}  // namespace

std::string url_normalize(std::string_view url) {
  auto const trimmed{ util_trim(url) };

  std::string out;
  if (looks_like_scp_uri(trimmed)) {
    out = scp_to_https(trimmed);
  } else if (has_ssh_scheme(trimmed)) {
    out = ssh_to_https(trimmed);
  } else {
    out = std::string{ trimmed };
  }

  strip_git_suffix_and_slashes(out);
  lowercase_host(out);
  return out;
}

std::string url_repo_name(std::string_view url) {
  auto normalized{ url_normalize(strip_query_and_fragment(url)) };
  auto const scheme_end{ normalized.find("://") };
  std::string_view view{ normalized };
  if (scheme_end != std::string::npos) {
    view.remove_prefix(scheme_end + 3);
    auto const slash{ view.find('/') };
    if (slash == std::string_view::npos) { return {}; }  // host only
    view.remove_prefix(slash);
  }

  auto const last_sep{ view.find_last_of("/\\") };
  auto const name{ last_sep == std::string_view::npos ? view : view.substr(last_sep + 1) };
  return std::string{ name };
}

locator_kind url_classify(std::string_view locator) {
  auto const value{ util_trim(locator) };
  if (value.empty()) { return locator_kind::UNKNOWN; }

  if (looks_like_scp_uri(value) || has_ssh_scheme(value)) { return locator_kind::SSH; }

  auto const path_segment{ strip_query_and_fragment(value) };
  bool const is_archive{ extract_is_archive_extension(
      std::filesystem::path{ util_to_lower(path_segment) }) };

  if (util_istarts_with(value, "file://")) {
    return is_archive ? locator_kind::ARCHIVE : locator_kind::LOCAL_PATH;
  }

  if (util_istarts_with(value, "http://") || util_istarts_with(value, "https://") ||
      util_istarts_with(value, "ftp://")) {
    return is_archive ? locator_kind::ARCHIVE : locator_kind::GIT;
  }

  if (util_istarts_with(value, "git://")) { return locator_kind::GIT; }
  if (value.find("://") != std::string_view::npos) { return locator_kind::UNKNOWN; }

  if (looks_like_local_path(value)) {
    return is_archive ? locator_kind::ARCHIVE : locator_kind::LOCAL_PATH;
  }

  return locator_kind::UNKNOWN;
}

char const *locator_kind_name(locator_kind kind) {
  switch (kind) {
    case locator_kind::GIT: return "git";
    case locator_kind::ARCHIVE: return "archive";
    case locator_kind::SSH: return "ssh";
    case locator_kind::LOCAL_PATH: return "local";
    case locator_kind::UNKNOWN: return "unknown";
  }
  return "unknown";
}

}  // namespace anvil

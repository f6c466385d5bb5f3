#pragma once

#include <string>
#include <string_view>

namespace anvil {

enum class locator_kind { GIT, ARCHIVE, SSH, LOCAL_PATH, UNKNOWN };

// Canonical form used as the index key. In order: scp-style `user@host:path` and
// `ssh://[user@]host[:port]/path` become `https://host/path`; a trailing `.git` is
// dropped; the host is lowercased (path case is kept); trailing slashes are dropped.
// normalize(normalize(x)) == normalize(x).
std::string url_normalize(std::string_view url);

// Last path segment without `.git`; "" if there is none.
std::string url_repo_name(std::string_view url);

// Syntactic classification. Bare words (possible index names) are UNKNOWN.
locator_kind url_classify(std::string_view locator);

char const *locator_kind_name(locator_kind kind);

}  // namespace anvil

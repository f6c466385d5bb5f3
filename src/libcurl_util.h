#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>

namespace anvil {

// Download `url` to `destination`, following redirects. A partial file is removed on
// failure. A set `cancel` flag aborts the transfer. Throws std::runtime_error.
std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       std::atomic_bool const *cancel = nullptr);

// Percent-encode `value` for use in a query string.
std::string libcurl_escape(std::string_view value);

}  // namespace anvil

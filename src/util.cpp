#include "util.h"

#include "tui.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <random>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace anvil {
namespace {

constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

}  // namespace

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

std::string util_random_hex(std::size_t length) {
  thread_local std::mt19937_64 rng{ std::random_device{}() };

  std::string result;
  result.reserve(length + 16);
  while (result.size() < length) {
    std::uint64_t const value{ rng() };
    result += util_bytes_to_hex(&value, sizeof value);
  }
  result.resize(length);
  return result;
}

std::string_view util_trim(std::string_view value) {
  auto const first{ value.find_first_not_of(" \t\n\r\f\v") };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(" \t\n\r\f\v") };
  return value.substr(first, last - first + 1);
}

std::string util_to_lower(std::string_view value) {
  std::string result{ value };
  std::ranges::transform(result, result.begin(), to_lower);
  return result;
}

bool util_istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return std::ranges::equal(prefix,
                            value | std::views::take(prefix.size()),
                            {},
                            to_lower,
                            to_lower);
}

bool util_iends_with(std::string_view value, std::string_view suffix) {
  if (suffix.size() > value.size()) { return false; }
  return std::ranges::equal(suffix,
                            value | std::views::drop(value.size() - suffix.size()),
                            {},
                            to_lower,
                            to_lower);
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_text(std::filesystem::path const &path) {
  std::ifstream in{ path, std::ios::binary };
  if (!in) { throw std::runtime_error("util_load_text: failed to open file: " + path.string()); }

  std::ostringstream oss;
  oss << in.rdbuf();
  if (in.bad()) {
    throw std::runtime_error("util_load_text: failed to read file: " + path.string());
  }
  return oss.str();
}

void util_write_file_atomic(std::filesystem::path const &path, std::string_view content) {
  auto const tmp{ path.parent_path() /
                  ("." + path.filename().string() + ".tmp-" + util_random_hex(8)) };
  scoped_path_cleanup cleanup{ tmp };

  {
    std::ofstream out{ tmp, std::ios::binary | std::ios::trunc };
    if (!out) {
      throw std::runtime_error("util_write_file_atomic: failed to open " + tmp.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      throw std::runtime_error("util_write_file_atomic: failed to write " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    throw std::runtime_error("util_write_file_atomic: failed to rename " + tmp.string() +
                             " to " + path.string() + ": " + ec.message());
  }
  cleanup.reset();
}

std::string util_replace_all(std::string_view text,
                             std::string_view token,
                             std::string_view value) {
  if (token.empty()) { return std::string{ text }; }

  std::string result;
  result.reserve(text.size());

  std::size_t pos{ 0 };
  while (true) {
    auto const hit{ text.find(token, pos) };
    if (hit == std::string_view::npos) {
      result.append(text.substr(pos));
      break;
    }
    result.append(text.substr(pos, hit - pos));
    result.append(value);
    pos = hit + token.size();
  }
  return result;
}

bool util_path_is_within(std::filesystem::path const &path,
                         std::filesystem::path const &root) {
  std::error_code ec;
  auto const p{ std::filesystem::weakly_canonical(path, ec) };
  if (ec) { return false; }
  auto const r{ std::filesystem::weakly_canonical(root, ec) };
  if (ec) { return false; }

  auto const rel{ p.lexically_relative(r) };
  if (rel.empty()) { return false; }
  auto const first{ *rel.begin() };
  return first != "..";
}

bool util_safe_remove_all(std::filesystem::path const &target,
                          std::vector<std::filesystem::path> const &protected_roots) {
  std::error_code ec;
  if (!std::filesystem::exists(std::filesystem::symlink_status(target, ec))) { return true; }

  auto const resolved{ std::filesystem::weakly_canonical(target, ec) };
  if (ec) {
    tui::error("Refusing to remove %s: cannot resolve (%s)",
               target.string().c_str(),
               ec.message().c_str());
    return false;
  }

  std::vector<std::filesystem::path> guarded{ protected_roots };
  guarded.emplace_back(resolved.root_path());
  if (char const *home{ std::getenv("HOME") }) { guarded.emplace_back(home); }

  for (auto const &g : guarded) {
    std::error_code gec;
    auto const canon{ std::filesystem::weakly_canonical(g, gec) };
    if (!gec && canon == resolved) {
      tui::error("Refusing to remove critical path: %s", target.string().c_str());
      return false;
    }
  }

  std::filesystem::remove_all(target, ec);
  if (ec) {
    tui::error("Failed to remove %s: %s", target.string().c_str(), ec.message().c_str());
    return false;
  }
  return true;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace anvil

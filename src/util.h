#pragma once

#include <concepts>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace anvil {

template <typename T, typename... Types>
concept one_of = (std::same_as<T, Types> || ...);

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Random lowercase hex token of `length` characters, used for unique directory names.
std::string util_random_hex(std::size_t length);

std::string_view util_trim(std::string_view value);
std::string util_to_lower(std::string_view value);
bool util_istarts_with(std::string_view value, std::string_view prefix);
bool util_iends_with(std::string_view value, std::string_view suffix);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file as text.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_text(std::filesystem::path const &path);

// Write `content` to a sibling temp file, then rename over `path`.
void util_write_file_atomic(std::filesystem::path const &path, std::string_view content);

// Replace every occurrence of `token` in `text`. Purely textual, no re-scanning of
// inserted values.
std::string util_replace_all(std::string_view text,
                             std::string_view token,
                             std::string_view value);

// Remove a directory tree, logging (not throwing) on failure. Refuses `/`, $HOME and
// any path listed in `protected_roots`. Returns true if the path is gone afterwards.
bool util_safe_remove_all(std::filesystem::path const &target,
                          std::vector<std::filesystem::path> const &protected_roots = {});

// true if `path` is `root` or lies beneath it (lexical, after weakly_canonical).
bool util_path_is_within(std::filesystem::path const &path,
                         std::filesystem::path const &root);

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace anvil

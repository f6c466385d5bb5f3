#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace anvil::platform {

enum class lock_mode { blocking, try_once };

// Exclusive advisory lock on `path` (created if missing, kept on release). Also
// serializes threads of this process on the same path. In try_once mode a held lock
// leaves the object empty (operator bool is false) instead of waiting.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path,
                     lock_mode mode = lock_mode::blocking);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
void touch_file(std::filesystem::path const &path);

// Build-plan platform key of the running host: "linux", "darwin" or "windows".
std::string_view platform_key();

// Search PATH for an executable named `name`. Names containing '/' are checked as-is.
std::optional<std::filesystem::path> find_on_path(std::string_view name);
bool is_executable(std::filesystem::path const &path);

void env_var_set(char const *name, char const *value);
void env_var_unset(char const *name);

unsigned hardware_jobs();

bool is_tty();

}  // namespace anvil::platform

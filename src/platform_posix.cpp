#include "platform.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace anvil::platform {

struct file_lock::impl {
  int fd;
  std::mutex *path_mutex;  // owned by the s_lock_mutexes map

  // POSIX file locks are per-process, not per-thread: multiple threads in the same process
  // can bypass the file lock and acquire it simultaneously. To ensure thread-level mutual
  // exclusion for file locks within a process, we use an in-process mutex per path.
  static std::mutex s_lock_map_mutex;
  static std::unordered_map<std::string, std::unique_ptr<std::mutex> > s_lock_mutexes;
};

std::mutex file_lock::impl::s_lock_map_mutex;
std::unordered_map<std::string, std::unique_ptr<std::mutex> >
    file_lock::impl::s_lock_mutexes;

file_lock::~file_lock() {
  // The lock file stays on disk: unlinking it would let a waiter lock an orphaned inode
  // while a newcomer locks a fresh file at the same path.
  if (impl_) {
    ::close(impl_->fd);
    if (impl_->path_mutex) { impl_->path_mutex->unlock(); }
  }
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

file_lock::file_lock(std::filesystem::path const &path, lock_mode mode) {
  // Canonicalize path to ensure different representations of same path use same mutex
  std::string const canonical_key{
    std::filesystem::absolute(path).lexically_normal().string()
  };

  std::mutex *path_mutex{ [&] {
    std::lock_guard<std::mutex> lock(impl::s_lock_map_mutex);
    auto &mutex_ptr{ impl::s_lock_mutexes[canonical_key] };
    if (!mutex_ptr) { mutex_ptr = std::make_unique<std::mutex>(); }
    return mutex_ptr.get();
  }() };

  std::unique_lock<std::mutex> path_lock{ *path_mutex, std::defer_lock };
  if (mode == lock_mode::blocking) {
    path_lock.lock();
  } else if (!path_lock.try_lock()) {
    return;
  }

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  struct flock fl{ .l_type = F_WRLCK,
                   .l_whence = SEEK_SET,
                   .l_start = 0,
                   .l_len = 0,
                   .l_pid = 0 };

  int const cmd{ mode == lock_mode::blocking ? F_SETLKW : F_SETLK };
  while (::fcntl(fd, cmd, &fl) == -1) {
    int const err{ errno };
    if (err == EINTR && mode == lock_mode::blocking) { continue; }
    ::close(fd);
    if (mode == lock_mode::try_once && (err == EACCES || err == EAGAIN)) { return; }
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  }

  impl_ = std::make_unique<impl>();
  impl_->fd = fd;
  impl_->path_mutex = path_lock.release();  // Transfer ownership, mutex stays locked
}

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void touch_file(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to touch file: " + path.string());
  }
  ::close(fd);
}

std::string_view platform_key() {
#if defined(__APPLE__) && defined(__MACH__)
  return "darwin";
#elif defined(__ANDROID__)
  return "android";
#elif defined(__linux__)
  return "linux";
#else
#error "unsupported POSIX OS"
#endif
}

bool is_executable(std::filesystem::path const &path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) { return false; }
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> find_on_path(std::string_view name) {
  if (name.empty()) { return std::nullopt; }

  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path const candidate{ name };
    if (is_executable(candidate)) { return candidate; }
    return std::nullopt;
  }

  char const *path_env{ std::getenv("PATH") };
  if (!path_env) { return std::nullopt; }

  std::string_view remaining{ path_env };
  while (!remaining.empty()) {
    auto const sep{ remaining.find(':') };
    auto const dir{ remaining.substr(0, sep) };
    remaining = (sep == std::string_view::npos) ? std::string_view{}
                                                : remaining.substr(sep + 1);
    if (dir.empty()) { continue; }

    auto const candidate{ std::filesystem::path{ dir } / name };
    if (is_executable(candidate)) { return candidate; }
  }

  return std::nullopt;
}

void env_var_set(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("env_var_set: null name or value");
  }

  if (::setenv(name, value, 1) != 0) {
    throw std::runtime_error(std::string("env_var_set: failed to set ") + name);
  }
}

void env_var_unset(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_unset: null name"); }
  ::unsetenv(name);
}

unsigned hardware_jobs() {
  unsigned const n{ std::thread::hardware_concurrency() };
  return n == 0 ? 1 : n;
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace anvil::platform

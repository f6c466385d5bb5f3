#include "shell.h"

#include "util.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace anvil {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr std::chrono::milliseconds kPollSlice{ 100 };
constexpr std::chrono::milliseconds kAbandonAfterKill{ 1000 };

using steady = std::chrono::steady_clock;

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ == -1) { return; }
    close_with_retry();
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }

  fd_cleanup &operator=(fd_cleanup &&other) noexcept {
    if (this == &other) { return *this; }
    if (fd_ != -1) { close_with_retry(); }
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
  }

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

// Close-on-exec pipe, so builds forked from other threads do not inherit our ends.
void make_pipe(int (&fds)[2]) {
#if defined(__APPLE__)
  if (::pipe(fds) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  for (int const fd : fds) { ::fcntl(fd, F_SETFD, FD_CLOEXEC); }
#else
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
#endif
}

void write_all(int fd, char const *data, size_t size) {
  ssize_t remaining{ static_cast<ssize_t>(size) };
  while (remaining > 0) {
    ssize_t const written{ ::write(fd, data, remaining) };
    if (written == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "write failed");
    }
    remaining -= written;
    data += written;
  }
}

std::string create_temp_script(std::string_view script) {
  auto tmp_dir{ std::filesystem::temp_directory_path() };
  std::string pattern{ (tmp_dir / "anvil-shell-XXXXXX").string() };

  std::vector<char> path_buffer{ pattern.begin(), pattern.end() };
  path_buffer.push_back('\0');

  int const fd{ ::mkstemp(path_buffer.data()) };
  if (fd == -1) {
    throw std::system_error(errno, std::generic_category(), "mkstemp failed");
  }
  fd_cleanup fd_guard{ fd };

  std::string content{ script };
  if (!content.empty() && content.back() != '\n') { content.push_back('\n'); }

  write_all(fd_guard.get(), content.data(), content.size());

  if (::fchmod(fd_guard.get(), S_IRUSR | S_IWUSR | S_IXUSR) == -1) {
    throw std::system_error(errno, std::generic_category(), "fchmod failed");
  }

  return std::string{ path_buffer.data() };
}

enum class stop_reason { NONE, TIMEOUT, CANCEL };

// Tracks the escalation from SIGTERM to SIGKILL for the child's process group.
class group_terminator {
 public:
  group_terminator(pid_t pgid, shell_run_cfg const &cfg)
      : pgid_{ pgid },
        cfg_{ cfg },
        deadline_{ cfg.timeout ? std::optional{ steady::now() + *cfg.timeout }
                               : std::nullopt } {}

  // Returns false once the group has been killed long enough ago that remaining pipe
  // holders (detached grandchildren) should be abandoned.
  bool check() {
    auto const now{ steady::now() };

    if (reason_ == stop_reason::NONE) {
      if (cfg_.cancel && cfg_.cancel->load()) {
        reason_ = stop_reason::CANCEL;
      } else if (deadline_ && now >= *deadline_) {
        reason_ = stop_reason::TIMEOUT;
      }
      if (reason_ != stop_reason::NONE) {
        ::killpg(pgid_, SIGTERM);
        term_sent_ = now;
      }
      return true;
    }

    if (!kill_sent_ && now - *term_sent_ >= cfg_.kill_grace) {
      ::killpg(pgid_, SIGKILL);
      kill_sent_ = now;
    }

    return !kill_sent_ || now - *kill_sent_ < kAbandonAfterKill;
  }

  stop_reason reason() const { return reason_; }

 private:
  pid_t pgid_;
  shell_run_cfg const &cfg_;
  std::optional<steady::time_point> deadline_;
  stop_reason reason_{ stop_reason::NONE };
  std::optional<steady::time_point> term_sent_;
  std::optional<steady::time_point> kill_sent_;
};

struct pipe_state {
  fd_cleanup read_fd;
  std::string pending;
  bool closed;
};

void emit_line(shell_run_cfg const &cfg, std::string_view line) {
  if (!line.empty() && line.back() == '\r') { line.remove_suffix(1); }
  if (cfg.on_output_line) { cfg.on_output_line(line); }
}

void stream_pipes(std::array<pipe_state, 2> &pipes,
                  shell_run_cfg const &cfg,
                  group_terminator &terminator) {
  std::array<pollfd, 2> poll_fds{};
  std::string chunk(4096, '\0');
  size_t closed_count{ 0 };

  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    poll_fds[i].fd = pipes[i].read_fd.get();
    poll_fds[i].events = POLLIN;
  }

  while (closed_count < pipes.size()) {
    if (!terminator.check()) { return; }

    int const poll_result{ ::poll(poll_fds.data(),
                                  poll_fds.size(),
                                  static_cast<int>(kPollSlice.count())) };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }
    if (poll_result == 0) { continue; }

    for (size_t i{ 0 }; i < pipes.size(); ++i) {
      if (pipes[i].closed) { continue; }

      short const revents{ poll_fds[i].revents };
      if (revents == 0) { continue; }
      if (revents & (POLLERR | POLLNVAL)) {
        throw std::runtime_error("poll failed on child pipe");
      }

      ssize_t const read_bytes{
        ::read(pipes[i].read_fd.get(), chunk.data(), chunk.size())
      };

      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }

      if (read_bytes == 0) {
        if (!pipes[i].pending.empty()) {
          emit_line(cfg, pipes[i].pending);
          pipes[i].pending.clear();
        }

        pipes[i].closed = true;
        ++closed_count;

        poll_fds[i].fd = -1;
        poll_fds[i].events = 0;
        poll_fds[i].revents = 0;
        continue;
      }

      pipes[i].pending.append(chunk.data(), static_cast<size_t>(read_bytes));

      size_t newline{ 0 };
      while ((newline = pipes[i].pending.find('\n')) != std::string::npos) {
        emit_line(cfg, std::string_view{ pipes[i].pending }.substr(0, newline));
        pipes[i].pending.erase(0, newline + 1);
      }
    }
  }
}

shell_result decode_status(int status) {
  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt };
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

shell_result wait_for_child(pid_t child, group_terminator *terminator) {
  int status{ 0 };
  while (true) {
    pid_t const result{ ::waitpid(child, &status, terminator ? WNOHANG : 0) };
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    if (result == child) { break; }

    terminator->check();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return decode_status(status);
}

[[noreturn]] void exec_child_process(fd_cleanup &stdout_read,
                                     fd_cleanup &stdout_write,
                                     fd_cleanup &stderr_read,
                                     fd_cleanup &stderr_write,
                                     std::optional<std::filesystem::path> const &cwd,
                                     std::vector<std::string> const &argv_strings,
                                     std::vector<char *> const &envp) {
  ::setpgid(0, 0);

  // Restore default dispositions so the build reacts normally to SIGTERM/SIGINT.
  ::signal(SIGINT, SIG_DFL);
  ::signal(SIGTERM, SIG_DFL);

  stdout_read.release();
  stderr_read.release();

  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1) {
    std::perror("open /dev/null");
    _exit(kChildErrorExit);
  }

  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ null_fd, STDIN_FILENO },
    std::pair{ stdout_write.get(), STDOUT_FILENO },
    std::pair{ stderr_write.get(), STDERR_FILENO },
  };

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) {
      std::perror("dup2");
      _exit(kChildErrorExit);
    }
  }

  if (null_fd != STDIN_FILENO) { ::close(null_fd); }
  stdout_write.release();
  stderr_write.release();

  if (cwd) {
    if (::chdir(cwd->c_str()) == -1) {
      std::perror("chdir");
      _exit(kChildErrorExit);
    }
  }

  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto const &arg : argv_strings) { argv.push_back(const_cast<char *>(arg.c_str())); }
  argv.push_back(nullptr);

  ::execve(argv_strings[0].c_str(), argv.data(), const_cast<char **>(envp.data()));
  std::perror("execve");
  _exit(kChildErrorExit);
}

}  // namespace

shell_env_t shell_getenv() {
  shell_env_t env;
  if (!environ) { return env; }

  for (char **entry{ environ }; *entry != nullptr; ++entry) {
    std::string_view kv{ *entry };
    size_t const sep{ kv.find('=') };
    if (sep == std::string_view::npos) { continue; }
    std::string key{ kv.substr(0, sep) };
    std::string value{ kv.substr(sep + 1) };
    env[std::move(key)] = std::move(value);
  }

  return env;
}

shell_result shell_run(std::string_view script, shell_run_cfg const &cfg) {
  std::filesystem::path const script_path{ create_temp_script(script) };
  scoped_path_cleanup cleanup{ script_path };

  std::vector<std::string> const argv_strings{ "/bin/sh", script_path.string() };

  auto const [env_strings, envp]{ [&cfg] {
    std::vector<std::string> strings;
    std::vector<char *> pointers;
    strings.reserve(cfg.env.size());
    pointers.reserve(cfg.env.size() + 1);
    for (auto const &[key, value] : cfg.env) { strings.push_back(key + "=" + value); }
    for (auto &entry : strings) { pointers.push_back(entry.data()); }
    pointers.push_back(nullptr);
    return std::pair{ std::move(strings), std::move(pointers) };
  }() };

  int stdout_pipefd[2];
  make_pipe(stdout_pipefd);
  fd_cleanup stdout_read_end{ stdout_pipefd[0] };
  fd_cleanup stdout_write_end{ stdout_pipefd[1] };

  int stderr_pipefd[2];
  make_pipe(stderr_pipefd);
  fd_cleanup stderr_read_end{ stderr_pipefd[0] };
  fd_cleanup stderr_write_end{ stderr_pipefd[1] };

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {  // child process exits in exec_child_process
    exec_child_process(stdout_read_end,
                       stdout_write_end,
                       stderr_read_end,
                       stderr_write_end,
                       cfg.cwd,
                       argv_strings,
                       envp);
  }

  // Also set from the parent so killpg works even before the child runs setpgid.
  ::setpgid(child, child);

  stdout_write_end.release();  // Parent: close write ends and stream output
  stderr_write_end.release();

  group_terminator terminator{ child, cfg };
  shell_result result;
  try {
    std::array<pipe_state, 2> pipes{
      pipe_state{ std::move(stdout_read_end), {}, false },
      pipe_state{ std::move(stderr_read_end), {}, false },
    };

    stream_pipes(pipes, cfg, terminator);
    result = wait_for_child(child, &terminator);
  } catch (std::exception const &) {
    ::killpg(child, SIGKILL);
    wait_for_child(child, nullptr);
    throw;
  }

  result.timed_out = terminator.reason() == stop_reason::TIMEOUT;
  result.cancelled = terminator.reason() == stop_reason::CANCEL;
  return result;
}

}  // namespace anvil

#if defined(_WIN32)
#error "shell_posix.cpp should not be compiled on Windows builds"
#else

#include "shell.h"

#include "cancellation.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hoist {
namespace {

using steady = std::chrono::steady_clock;

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr std::chrono::milliseconds kPollTick{ 100 };
constexpr std::chrono::milliseconds kAbandonAfterKill{ 1000 };

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

struct pipe_pair {
  fd_cleanup read_end;
  fd_cleanup write_end;
};

pipe_pair make_pipe() {
  int fds[2];
  if (::pipe(fds) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  return { fd_cleanup{ fds[0] }, fd_cleanup{ fds[1] } };
}

// A child that exits without draining stdin must not take us down with it
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] {
    struct sigaction sa{};
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGPIPE, &sa, nullptr);
  });
}

struct output_state {
  fd_cleanup read_fd;
  shell_stream stream;
  std::string pending;
  bool closed;
};

void deliver_line(shell_run_cfg const &cfg, shell_stream stream, std::string_view line) {
  if (!line.empty() && line.back() == '\r') { line.remove_suffix(1); }
  if (stream == shell_stream::std_out) {
    if (cfg.on_stdout_line) { cfg.on_stdout_line(line); }
  } else {
    if (cfg.on_stderr_line) { cfg.on_stderr_line(line); }
  }
}

// Tracks deadline and cancellation for one child: SIGTERM first, SIGKILL after
// the grace period, then stop waiting on pipes a grandchild may still hold.
class child_reaper {
 public:
  child_reaper(pid_t child, shell_run_cfg const &cfg) : child_{ child }, cfg_{ cfg } {}

  void poll_limits() {
    auto const now{ steady::now() };

    if (!term_sent_) {
      if (cfg_.cancel && cfg_.cancel->requested()) {
        cancelled_ = true;
      } else if (cfg_.deadline && now >= *cfg_.deadline) {
        timed_out_ = true;
      } else {
        return;
      }
      ::kill(-child_, SIGTERM);
      term_sent_ = true;
      kill_at_ = now + cfg_.kill_grace;
      return;
    }

    if (!kill_sent_ && now >= kill_at_) {
      ::kill(-child_, SIGKILL);
      kill_sent_ = true;
      abandon_at_ = now + kAbandonAfterKill;
    }
  }

  bool abandoned() const { return kill_sent_ && steady::now() >= abandon_at_; }

  int poll_timeout_ms() const {
    auto wait{ kPollTick };
    if (!term_sent_ && cfg_.deadline) {
      auto const remaining{ std::chrono::duration_cast<std::chrono::milliseconds>(
          *cfg_.deadline - steady::now()) };
      wait = std::clamp(remaining, std::chrono::milliseconds{ 0 }, kPollTick);
    }
    return static_cast<int>(wait.count());
  }

  bool timed_out() const { return timed_out_; }
  bool cancelled() const { return cancelled_; }

 private:
  pid_t child_;
  shell_run_cfg const &cfg_;
  bool term_sent_{ false };
  bool kill_sent_{ false };
  bool timed_out_{ false };
  bool cancelled_{ false };
  steady::time_point kill_at_{};
  steady::time_point abandon_at_{};
};

void stream_pipes(std::array<output_state, 2> &outputs,
                  fd_cleanup &stdin_fd,
                  std::string_view stdin_remaining,
                  child_reaper &reaper,
                  shell_run_cfg const &cfg) {
  std::array<pollfd, 3> poll_fds{};
  std::string chunk(4096, '\0');

  auto const open_outputs{ [&] {
    return std::ranges::count_if(outputs, [](auto const &o) { return !o.closed; });
  } };

  if (stdin_fd.get() != -1 && stdin_remaining.empty()) { stdin_fd.release(); }

  while (open_outputs() > 0) {
    reaper.poll_limits();
    if (reaper.abandoned()) { break; }

    for (size_t i{ 0 }; i < outputs.size(); ++i) {
      poll_fds[i].fd = outputs[i].closed ? -1 : outputs[i].read_fd.get();
      poll_fds[i].events = POLLIN;
      poll_fds[i].revents = 0;
    }
    poll_fds[2].fd = stdin_fd.get();
    poll_fds[2].events = POLLOUT;
    poll_fds[2].revents = 0;

    int const poll_result{ ::poll(poll_fds.data(), poll_fds.size(), reaper.poll_timeout_ms()) };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }
    if (poll_result == 0) { continue; }

    if (stdin_fd.get() != -1 && poll_fds[2].revents != 0) {
      if (poll_fds[2].revents & (POLLERR | POLLHUP | POLLNVAL)) {
        stdin_fd.release();
      } else {
        ssize_t const written{
          ::write(stdin_fd.get(), stdin_remaining.data(), stdin_remaining.size())
        };
        if (written == -1) {
          if (errno == EPIPE) {
            stdin_fd.release();
          } else if (errno != EINTR && errno != EAGAIN) {
            throw std::system_error(errno, std::generic_category(), "write failed");
          }
        } else {
          stdin_remaining.remove_prefix(static_cast<size_t>(written));
          if (stdin_remaining.empty()) { stdin_fd.release(); }
        }
      }
    }

    for (size_t i{ 0 }; i < outputs.size(); ++i) {
      auto &out{ outputs[i] };
      if (out.closed) { continue; }

      short const revents{ poll_fds[i].revents };
      if (revents == 0) { continue; }
      if (revents & POLLNVAL) { throw std::runtime_error("poll failed on child pipe"); }

      ssize_t const read_bytes{ ::read(out.read_fd.get(), chunk.data(), chunk.size()) };
      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }

      if (read_bytes == 0) {
        if (!out.pending.empty()) {
          deliver_line(cfg, out.stream, out.pending);
          out.pending.clear();
        }
        out.closed = true;
        out.read_fd.release();
        continue;
      }

      out.pending.append(chunk.data(), static_cast<size_t>(read_bytes));

      size_t newline{ 0 };
      while ((newline = out.pending.find('\n')) != std::string::npos) {
        deliver_line(cfg, out.stream, std::string_view{ out.pending }.substr(0, newline));
        out.pending.erase(0, newline + 1);
      }
    }
  }
}

// Waits without blocking forever: keeps applying the deadline and cancel
// policy while the child has closed its pipes but not yet exited.
shell_result wait_for_child(pid_t child, child_reaper *reaper) {
  int status{ 0 };
  while (true) {
    pid_t const result{ ::waitpid(child, &status, reaper ? WNOHANG : 0) };
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    if (result == 0) {
      reaper->poll_limits();
      ::poll(nullptr, 0, reaper->poll_timeout_ms());
      continue;
    }
    break;
  }

  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt };
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

[[noreturn]] void exec_child_process(int stdin_src,
                                     int stdout_dst,
                                     int stderr_dst,
                                     std::optional<std::filesystem::path> const &cwd,
                                     std::vector<std::string> const &argv_strings) {
  ::setpgid(0, 0);

  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ stdin_src, STDIN_FILENO },
    std::pair{ stdout_dst, STDOUT_FILENO },
    std::pair{ stderr_dst, STDERR_FILENO },
  };

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) {
      std::perror("dup2");
      _exit(kChildErrorExit);
    }
  }

  // Everything else (pipe ends included) is closed before exec
  for (int fd{ STDERR_FILENO + 1 }, max_fd{ static_cast<int>(::sysconf(_SC_OPEN_MAX)) };
       fd < max_fd && fd < 4096;
       ++fd) {
    ::close(fd);
  }

  if (cwd && ::chdir(cwd->c_str()) == -1) {
    std::perror("chdir");
    _exit(kChildErrorExit);
  }

  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto const &arg : argv_strings) { argv.push_back(const_cast<char *>(arg.c_str())); }
  argv.push_back(nullptr);

  ::signal(SIGPIPE, SIG_DFL);
  ::execvp(argv[0], argv.data());
  std::perror("execvp");
  _exit(kChildErrorExit);
}

}  // namespace

std::string shell_format_argv(std::vector<std::string> const &argv) {
  constexpr std::string_view kSafe{
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_./:=,@%+"
  };

  std::string out;
  for (auto const &arg : argv) {
    if (!out.empty()) { out.push_back(' '); }
    if (!arg.empty() && arg.find_first_not_of(kSafe) == std::string::npos) {
      out.append(arg);
      continue;
    }
    out.push_back('\'');
    for (char const c : arg) {
      if (c == '\'') {
        out.append("'\\''");
      } else {
        out.push_back(c);
      }
    }
    out.push_back('\'');
  }
  return out;
}

shell_result shell_run(std::vector<std::string> const &argv, shell_run_cfg const &cfg) {
  if (argv.empty() || argv[0].empty()) {
    throw std::invalid_argument("shell_run: argv must be non-empty");
  }

  ignore_sigpipe();

  if (cfg.cancel && cfg.cancel->requested()) {
    return { .exit_code = kSignalExitBase + SIGTERM,
             .signal = std::nullopt,
             .timed_out = false,
             .cancelled = true };
  }

  std::optional<pipe_pair> stdin_pipe;
  fd_cleanup null_fd{ -1 };
  if (cfg.stdin_data) {
    stdin_pipe = make_pipe();
  } else {
    null_fd = fd_cleanup{ ::open("/dev/null", O_RDONLY | O_CLOEXEC) };
    if (null_fd.get() == -1) {
      throw std::system_error(errno, std::generic_category(), "open /dev/null failed");
    }
  }

  auto stdout_pipe{ make_pipe() };
  auto stderr_pipe{ make_pipe() };

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {  // child process exits in exec_child_process
    exec_child_process(stdin_pipe ? stdin_pipe->read_end.get() : null_fd.get(),
                       stdout_pipe.write_end.get(),
                       stderr_pipe.write_end.get(),
                       cfg.cwd,
                       argv);
  }

  ::setpgid(child, child);  // also done in the child; whichever runs first wins

  stdout_pipe.write_end.release();  // Parent: close the child's ends and stream output
  stderr_pipe.write_end.release();
  null_fd.release();

  fd_cleanup stdin_write{ -1 };
  if (stdin_pipe) {
    stdin_pipe->read_end.release();
    stdin_write = std::move(stdin_pipe->write_end);
    if (::fcntl(stdin_write.get(), F_SETFL, O_NONBLOCK) == -1) {
      ::kill(-child, SIGKILL);
      wait_for_child(child, nullptr);
      throw std::system_error(errno, std::generic_category(), "fcntl failed");
    }
  }

  child_reaper reaper{ child, cfg };
  shell_result result;
  try {
    std::array<output_state, 2> outputs{
      output_state{ std::move(stdout_pipe.read_end), shell_stream::std_out, {}, false },
      output_state{ std::move(stderr_pipe.read_end), shell_stream::std_err, {}, false },
    };

    stream_pipes(outputs,
                 stdin_write,
                 cfg.stdin_data.value_or(std::string_view{}),
                 reaper,
                 cfg);
    stdin_write.release();
    result = wait_for_child(child, &reaper);
  } catch (...) {
    ::kill(-child, SIGKILL);
    wait_for_child(child, nullptr);
    throw;
  }

  result.timed_out = reaper.timed_out();
  result.cancelled = reaper.cancelled();
  return result;
}

}  // namespace hoist

#endif  // POSIX implementation

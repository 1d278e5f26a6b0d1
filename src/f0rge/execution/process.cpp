#include "process.hpp"
#include <redlog.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace f0rge::execution {

namespace {

constexpr int poll_interval_ms = 50;
constexpr size_t read_chunk = 64 * 1024;

// owns one file descriptor
class fd_handle {
public:
  fd_handle() = default;
  explicit fd_handle(int fd) : fd_(fd) {}
  ~fd_handle() { reset(); }

  fd_handle(const fd_handle&) = delete;
  fd_handle& operator=(const fd_handle&) = delete;

  int get() const noexcept { return fd_; }
  bool open() const noexcept { return fd_ >= 0; }

  void reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

bool make_pipe(fd_handle& read_end, fd_handle& write_end) {
  int fds[2];
  if (::pipe(fds) != 0) {
    return false;
  }
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

void set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

[[noreturn]] void child_fail(int report_fd) {
  int error = errno;
  ssize_t ignored = ::write(report_fd, &error, sizeof(error));
  (void) ignored;
  ::_exit(127);
}

// reads everything currently available; closes the handle on eof
void drain(fd_handle& fd, std::string& sink) {
  if (!fd.open()) {
    return;
  }
  char buffer[read_chunk];
  for (;;) {
    ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
    if (n > 0) {
      sink.append(buffer, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) {
      fd.reset();
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      fd.reset();
    }
    return;
  }
}

std::string describe_command(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += arg;
  }
  return out;
}

} // namespace

result<execution_result> run_process(const process_spec& spec) {
  auto log = redlog::get_logger("f0rge.process");

  if (spec.argv.empty()) {
    return error_result<execution_result>(error_code::invalid_argument, "empty command");
  }
  ignore_sigpipe();

  fd_handle in_read, in_write, out_read, out_write, err_read, err_write, report_read, report_write;
  if (!make_pipe(in_read, in_write) || !make_pipe(out_read, out_write) || !make_pipe(err_read, err_write) ||
      !make_pipe(report_read, report_write)) {
    log.err("pipe creation failed", redlog::field("errno", errno));
    return error_result<execution_result>(
        error_code::infrastructure_error, std::string("cannot create pipes: ") + std::strerror(errno)
    );
  }

  // everything the child touches is prepared before fork
  std::vector<char*> argv;
  argv.reserve(spec.argv.size() + 1);
  for (const auto& arg : spec.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  const std::string working_dir = spec.working_dir.string();

  log.dbg(
      "spawning process", redlog::field("command", describe_command(spec.argv)),
      redlog::field("working_dir", working_dir)
  );
  auto started = std::chrono::steady_clock::now();

  pid_t child_pid = ::fork();
  if (child_pid < 0) {
    log.err("fork failed", redlog::field("errno", errno));
    return error_result<execution_result>(
        error_code::infrastructure_error, std::string("fork failed: ") + std::strerror(errno)
    );
  }

  if (child_pid == 0) {
    // child process: own process group so timeouts can kill the whole tree
    ::setpgid(0, 0);
    if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
      child_fail(report_write.get());
    }
    if (::dup2(in_read.get(), STDIN_FILENO) < 0 || ::dup2(out_write.get(), STDOUT_FILENO) < 0 ||
        ::dup2(err_write.get(), STDERR_FILENO) < 0) {
      child_fail(report_write.get());
    }
    ::execvp(argv[0], argv.data());
    child_fail(report_write.get());
  }

  ::setpgid(child_pid, child_pid);
  in_read.reset();
  out_write.reset();
  err_write.reset();
  report_write.reset();

  int spawn_errno = 0;
  ssize_t reported = 0;
  do {
    reported = ::read(report_read.get(), &spawn_errno, sizeof(spawn_errno));
  } while (reported < 0 && errno == EINTR);
  report_read.reset();

  if (reported == static_cast<ssize_t>(sizeof(spawn_errno))) {
    int status = 0;
    ::waitpid(child_pid, &status, 0);
    log.err(
        "process could not be spawned", redlog::field("command", spec.argv.front()),
        redlog::field("error", std::strerror(spawn_errno))
    );
    return error_result<execution_result>(make_status(
        error_code::infrastructure_error,
        "cannot spawn '" + spec.argv.front() + "': " + std::strerror(spawn_errno), spec.argv.front()
    ));
  }

  set_nonblocking(out_read.get());
  set_nonblocking(err_read.get());
  size_t stdin_written = 0;
  if (spec.stdin_text.empty()) {
    in_write.reset();
  } else {
    set_nonblocking(in_write.get());
  }

  execution_result out;
  bool reaped = false;
  bool killed = false;
  int wait_status = 0;
  const bool has_deadline = spec.timeout.count() > 0;
  const auto deadline = started + spec.timeout;

  while (!reaped) {
    if (!killed && spec.cancel && spec.cancel->requested()) {
      log.wrn("cancelling child process", redlog::field("pid", child_pid));
      ::kill(-child_pid, SIGKILL);
      out.how = termination::cancelled;
      killed = true;
    }
    if (!killed && has_deadline && std::chrono::steady_clock::now() >= deadline) {
      log.wrn(
          "child process timed out", redlog::field("pid", child_pid),
          redlog::field("timeout_ms", static_cast<int64_t>(spec.timeout.count()))
      );
      ::kill(-child_pid, SIGKILL);
      out.how = termination::timed_out;
      killed = true;
    }

    pollfd fds[3];
    nfds_t count = 0;
    if (out_read.open()) {
      fds[count++] = pollfd{out_read.get(), POLLIN, 0};
    }
    if (err_read.open()) {
      fds[count++] = pollfd{err_read.get(), POLLIN, 0};
    }
    if (in_write.open()) {
      fds[count++] = pollfd{in_write.get(), POLLOUT, 0};
    }

    int ready = ::poll(count > 0 ? fds : nullptr, count, poll_interval_ms);
    if (ready < 0 && errno != EINTR) {
      log.err("poll failed", redlog::field("errno", errno));
      ::kill(-child_pid, SIGKILL);
      ::waitpid(child_pid, &wait_status, 0);
      return error_result<execution_result>(
          error_code::internal_error, std::string("poll failed: ") + std::strerror(errno)
      );
    }

    drain(out_read, out.stdout_text);
    drain(err_read, out.stderr_text);

    if (in_write.open()) {
      while (stdin_written < spec.stdin_text.size()) {
        ssize_t n = ::write(
            in_write.get(), spec.stdin_text.data() + stdin_written, spec.stdin_text.size() - stdin_written
        );
        if (n > 0) {
          stdin_written += static_cast<size_t>(n);
          continue;
        }
        if (n < 0 && errno == EINTR) {
          continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
          break;
        }
        // EPIPE: child stopped reading
        stdin_written = spec.stdin_text.size();
      }
      if (stdin_written >= spec.stdin_text.size()) {
        in_write.reset();
      }
    }

    pid_t waited = ::waitpid(child_pid, &wait_status, killed ? 0 : WNOHANG);
    if (waited == child_pid) {
      reaped = true;
    } else if (waited < 0 && errno != EINTR) {
      log.err("waitpid failed", redlog::field("pid", child_pid), redlog::field("errno", errno));
      return error_result<execution_result>(
          error_code::internal_error, std::string("waitpid failed: ") + std::strerror(errno)
      );
    }
  }

  // output the child wrote before exiting is still buffered in the pipes
  drain(out_read, out.stdout_text);
  drain(err_read, out.stderr_text);

  auto elapsed = std::chrono::steady_clock::now() - started;
  out.duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();

  if (killed) {
    out.exit_code = -1;
    out.signal = SIGKILL;
  } else if (WIFEXITED(wait_status)) {
    out.exit_code = WEXITSTATUS(wait_status);
    out.how = termination::exited;
  } else if (WIFSIGNALED(wait_status)) {
    out.signal = WTERMSIG(wait_status);
    out.exit_code = 128 + out.signal;
    out.how = termination::signaled;
  }

  log.dbg(
      "child process finished", redlog::field("pid", child_pid), redlog::field("exit_code", out.exit_code),
      redlog::field("termination", std::string(termination_name(out.how))),
      redlog::field("duration_ms", out.duration_ms)
  );
  return ok_result(std::move(out));
}

} // namespace f0rge::execution

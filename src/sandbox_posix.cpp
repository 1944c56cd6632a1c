#include "sandcell/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sched.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

namespace sandcell {

namespace {

// argv/envp are built before fork(); the child only makes async-signal-safe
// calls.
struct ExecArgs {
  std::vector<std::string> strings;
  std::vector<char*> argv;
  std::vector<std::string> env_strings;
  std::vector<char*> envp;
  bool inherit_env{true};
};

ExecArgs prepare_exec(const ProcessSpec& spec) {
  ExecArgs ex;
  ex.strings.push_back(spec.command);
  ex.strings.insert(ex.strings.end(), spec.argv.begin(), spec.argv.end());
  for (auto& s : ex.strings) ex.argv.push_back(s.data());
  ex.argv.push_back(nullptr);

  ex.inherit_env = spec.env.empty();
  for (const auto& [k, v] : spec.env) ex.env_strings.push_back(k + "=" + v);
  for (auto& e : ex.env_strings) ex.envp.push_back(e.data());
  ex.envp.push_back(nullptr);
  return ex;
}

void ignore_sigpipe_once() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// forkpty() has no close-on-exec variant; serialize it so no concurrent
// fork() inherits a master descriptor before FD_CLOEXEC is set.
std::mutex g_pty_spawn_mu;

void status_write(int fd, const char* s) {
  ssize_t r = ::write(fd, s, std::strlen(s));
  (void)r;
}

void status_write_errno(int fd, const char* what, int err) {
  char buf[64];
  size_t n = 0;
  const char* prefix = "X ";
  while (*prefix && n < sizeof(buf) - 1) buf[n++] = *prefix++;
  while (*what && n < sizeof(buf) - 16) buf[n++] = *what++;
  buf[n++] = ' ';
  char digits[12];
  int d = 0;
  unsigned v = static_cast<unsigned>(err);
  do {
    digits[d++] = static_cast<char>('0' + v % 10);
    v /= 10;
  } while (v && d < 11);
  while (d > 0) buf[n++] = digits[--d];
  buf[n++] = '\n';
  ssize_t r = ::write(fd, buf, n);
  (void)r;
}

void child_limit(int fd, int resource, std::uint64_t value, const char* name) {
  if (value == 0) return;
  struct rlimit rl;
  rl.rlim_cur = value;
  rl.rlim_max = value;
  status_write(fd, ::setrlimit(resource, &rl) == 0 ? "E " : "F ");
  status_write(fd, name);
  status_write(fd, "\n");
}

[[noreturn]] void exec_in_child(const ProcessSpec& spec, ExecArgs& ex, int status_fd) {
  // SIG_IGN survives exec; the program gets default dispositions back.
  ::signal(SIGPIPE, SIG_DFL);
  sigset_t none;
  sigemptyset(&none);
  ::sigprocmask(SIG_SETMASK, &none, nullptr);

  if (spec.enforce_network_isolation) {
    // Needs CAP_SYS_ADMIN (or a user namespace) on most distros.
    status_write(status_fd, ::unshare(CLONE_NEWNET) == 0 ? "E " : "F ");
    status_write(status_fd, "network_isolation\n");
  }
  child_limit(status_fd, RLIMIT_AS, spec.max_memory_bytes, "memory_limit");
  child_limit(status_fd, RLIMIT_NPROC, spec.max_processes, "pids_limit");
  child_limit(status_fd, RLIMIT_NOFILE, spec.max_file_descriptors, "fd_limit");

  if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
    status_write_errno(status_fd, "chdir", errno);
    _exit(127);
  }
  if (ex.inherit_env) {
    ::execvp(spec.command.c_str(), ex.argv.data());
  } else {
    ::execvpe(spec.command.c_str(), ex.argv.data(), ex.envp.data());
  }
  status_write_errno(status_fd, "exec", errno);
  _exit(127);
}

// Reads the status pipe until the child execs (EOF). Returns the setup
// failure text, empty when exec succeeded.
std::string collect_status(int fd, std::vector<std::string>& enforced, std::vector<std::string>& failed) {
  std::string text;
  char buf[256];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      text.append(buf, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  ::close(fd);

  std::string error;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string::npos) nl = text.size();
    const std::string line = text.substr(pos, nl - pos);
    pos = nl + 1;
    if (line.size() < 3) continue;
    const std::string body = line.substr(2);
    if (line[0] == 'E') {
      enforced.push_back(body);
    } else if (line[0] == 'F') {
      failed.push_back(body);
    } else if (line[0] == 'X') {
      const auto sp = body.rfind(' ');
      const int err = sp == std::string::npos ? 0 : std::atoi(body.c_str() + sp + 1);
      error = body.substr(0, sp) + ": " + std::strerror(err);
    }
  }
  return error;
}

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit, bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

}  // namespace

// ---------------------------------------------------------------------------
// run_process
// ---------------------------------------------------------------------------

ProcessResult run_process(const ProcessSpec& spec) {
  ignore_sigpipe_once();
  ProcessResult result;
  int out_pipe[2];
  int err_pipe[2];
  int status_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    result.error_message = "spawn_failed: pipe";
    return result;
  }
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    result.error_message = "spawn_failed: pipe";
    return result;
  }
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
    result.error_message = "spawn_failed: pipe";
    return result;
  }

  ExecArgs ex = prepare_exec(spec);
  pid_t pid = ::fork();
  if (pid < 0) {
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], status_pipe[0], status_pipe[1]}) ::close(fd);
    result.error_message = "spawn_failed: fork";
    return result;
  }

  if (pid == 0) {
    ::setsid();
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    exec_in_child(spec, ex, status_pipe[1]);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ::close(status_pipe[1]);
  const std::string setup_error =
      collect_status(status_pipe[0], result.enforced_capabilities, result.failed_capabilities);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  int status = 0;
  bool out_open = true;
  bool err_open = true;
  while (out_open || err_open) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      result.timed_out = true;
      break;
    }
    const int wait_ms = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()) + 1;
    struct pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
    if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};
    const int pr = ::poll(fds, nfds, wait_ms);
    if (pr < 0 && errno != EINTR) break;
    for (nfds_t i = 0; pr > 0 && i < nfds; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      const bool is_out = fds[i].fd == out_pipe[0];
      ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) {
        if (is_out) append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
        else append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        (is_out ? out_open : err_open) = false;
      }
    }
  }
  ::close(out_pipe[0]);
  ::close(err_pipe[0]);

  // Both streams closed (or killed). The child may still be running with its
  // output redirected elsewhere, so the deadline keeps applying to the reap.
  while (true) {
    pid_t w = ::waitpid(pid, &status, result.timed_out ? 0 : WNOHANG);
    if (w == pid) break;
    if (w < 0 && errno != EINTR) break;
    if (!result.timed_out && std::chrono::steady_clock::now() >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      result.timed_out = true;
      continue;
    }
    if (w == 0) std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  if (result.stdout_truncated) result.stdout_text += "(truncated)";
  if (result.stderr_truncated) result.stderr_text += "(truncated)";

  if (!setup_error.empty()) {
    result.error_message = "spawn_failed: " + setup_error;
    result.exit_code = 127;
  } else if (result.timed_out) {
    result.exit_code = 124;
  } else {
    result.exit_code = decode_status(status);
  }
  return result;
}

// ---------------------------------------------------------------------------
// ChildProcess
// ---------------------------------------------------------------------------

std::unique_ptr<ChildProcess> ChildProcess::spawn(const ProcessSpec& spec, std::string* error) {
  ignore_sigpipe_once();
  auto fail = [&](const std::string& msg) -> std::unique_ptr<ChildProcess> {
    if (error) *error = msg;
    return nullptr;
  };

  int status_pipe[2];
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) return fail("spawn_failed: pipe");

  std::unique_ptr<ChildProcess> child(new ChildProcess());
  child->pty_ = spec.use_pty;
  ExecArgs ex = prepare_exec(spec);

  if (spec.use_pty) {
    struct winsize ws {};
    ws.ws_col = spec.pty_cols;
    ws.ws_row = spec.pty_rows;
    int master = -1;
    pid_t pid;
    {
      std::lock_guard<std::mutex> lk(g_pty_spawn_mu);
      pid = ::forkpty(&master, nullptr, nullptr, &ws);
      if (pid == 0) exec_in_child(spec, ex, status_pipe[1]);
      if (pid > 0) ::fcntl(master, F_SETFD, FD_CLOEXEC);
    }
    if (pid < 0) {
      ::close(status_pipe[0]);
      ::close(status_pipe[1]);
      return fail("spawn_failed: forkpty: " + std::string(std::strerror(errno)));
    }
    ::fcntl(master, F_SETFL, ::fcntl(master, F_GETFL) | O_NONBLOCK);
    child->pid_ = pid;
    child->in_fd_ = master;
    child->out_fd_ = master;
  } else {
    int in_pipe[2];
    int out_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
      ::close(status_pipe[0]);
      ::close(status_pipe[1]);
      return fail("spawn_failed: pipe");
    }
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
      for (int fd : {in_pipe[0], in_pipe[1], status_pipe[0], status_pipe[1]}) ::close(fd);
      return fail("spawn_failed: pipe");
    }
    pid_t pid = ::fork();
    if (pid < 0) {
      for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], status_pipe[0], status_pipe[1]}) ::close(fd);
      return fail("spawn_failed: fork: " + std::string(std::strerror(errno)));
    }
    if (pid == 0) {
      ::setsid();
      ::dup2(in_pipe[0], STDIN_FILENO);
      ::dup2(out_pipe[1], STDOUT_FILENO);
      ::dup2(out_pipe[1], STDERR_FILENO);
      exec_in_child(spec, ex, status_pipe[1]);
    }
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::fcntl(in_pipe[1], F_SETFL, ::fcntl(in_pipe[1], F_GETFL) | O_NONBLOCK);
    child->pid_ = pid;
    child->in_fd_ = in_pipe[1];
    child->out_fd_ = out_pipe[0];
  }

  ::close(status_pipe[1]);
  const std::string setup_error = collect_status(status_pipe[0], child->enforced_, child->failed_);
  if (!setup_error.empty()) {
    child->wait();
    return fail("spawn_failed: " + setup_error);
  }
  return child;
}

ChildProcess::~ChildProcess() {
  if (pid_ > 0) {
    kill_group(SIGKILL);
    wait();
  }
  if (in_fd_ >= 0) ::close(in_fd_);
  if (out_fd_ >= 0 && out_fd_ != in_fd_) ::close(out_fd_);
}

std::optional<std::size_t> ChildProcess::write_some(std::string_view data) {
  if (in_fd_ < 0 || input_closed_) return std::nullopt;
  if (data.empty()) return 0;
  while (true) {
    ssize_t n = ::write(in_fd_, data.data(), data.size());
    if (n >= 0) return static_cast<std::size_t>(n);
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
    return std::nullopt;
  }
}

bool ChildProcess::write_all(std::string_view data, std::uint64_t timeout_ms) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!data.empty()) {
    auto n = write_some(data);
    if (!n) return false;
    data.remove_prefix(*n);
    if (data.empty()) break;
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;
    struct pollfd p = {in_fd_, POLLOUT, 0};
    ::poll(&p, 1, static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()) + 1);
  }
  return true;
}

void ChildProcess::close_input() {
  if (input_closed_) return;
  if (pty_) {
    const char eot = 0x04;
    ssize_t r = ::write(in_fd_, &eot, 1);
    (void)r;
    return;
  }
  input_closed_ = true;
  if (in_fd_ >= 0) {
    ::close(in_fd_);
    in_fd_ = -1;
  }
}

bool ChildProcess::read_output(std::string& out, int wait_ms) {
  if (out_fd_ < 0 || output_eof_) return false;
  struct pollfd p = {out_fd_, POLLIN, 0};
  const int pr = ::poll(&p, 1, wait_ms);
  if (pr == 0) return true;
  if (pr < 0) return errno == EINTR;

  char buf[4096];
  ssize_t n = ::read(out_fd_, buf, sizeof(buf));
  if (n > 0) {
    out.append(buf, static_cast<std::size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;

  // EOF on a pipe, EIO on a pty master once the slave side is gone. The
  // descriptor stays open until destruction: on a pty it is also the input
  // side, which another thread may be writing to.
  output_eof_ = true;
  return false;
}

bool ChildProcess::resize(std::uint16_t cols, std::uint16_t rows) {
  if (!pty_ || out_fd_ < 0) return false;
  struct winsize ws {};
  ws.ws_col = cols;
  ws.ws_row = rows;
  return ::ioctl(out_fd_, TIOCSWINSZ, &ws) == 0;
}

std::optional<int> ChildProcess::try_wait() {
  std::lock_guard<std::mutex> lk(wait_mu_);
  if (exit_code_) return exit_code_;
  if (pid_ <= 0) return std::nullopt;
  int status = 0;
  pid_t w = ::waitpid(pid_, &status, WNOHANG);
  if (w == pid_) exit_code_ = decode_status(status);
  return exit_code_;
}

int ChildProcess::wait() {
  std::lock_guard<std::mutex> lk(wait_mu_);
  if (exit_code_) return *exit_code_;
  int status = 0;
  pid_t w;
  do {
    w = ::waitpid(pid_, &status, 0);
  } while (w < 0 && errno == EINTR);
  exit_code_ = w == pid_ ? decode_status(status) : -1;
  return *exit_code_;
}

void ChildProcess::kill_group(int sig) {
  std::lock_guard<std::mutex> lk(wait_mu_);
  if (pid_ <= 0) return;
  // After the reap only the group is signalled: stragglers still hold the
  // pgid, the leader's pid may already be recycled.
  ::kill(-pid_, sig);
  if (!exit_code_) ::kill(pid_, sig);
}

}  // namespace sandcell

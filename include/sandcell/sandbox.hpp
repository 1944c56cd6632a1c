#pragma once

// sandcell/sandbox.hpp - Child processes: one-shot runs and long-lived channels.
//
// Two entry points share one fork/exec path:
//   run_process()          one-shot command with a deadline. Separate stdout
//                          and stderr capture. Used for backend CLI calls
//                          (docker version/pull/create/stop/rm).
//   ChildProcess::spawn()  long-lived child with a writable stdin and a
//                          readable output stream (stderr merged), over pipes
//                          or a pseudo-terminal. Used for the environment's
//                          attached process in batch and terminal mode.
//
// CHILD SETUP (in order, in the forked child):
//   1. new session (setsid, or forkpty's controlling terminal)
//   2. unshare(CLONE_NEWNET) when enforce_network_isolation (best effort)
//   3. RLIMIT_AS / RLIMIT_NPROC / RLIMIT_NOFILE when non-zero
//   4. chdir(cwd), then execvp/execvpe (PATH lookup)
//   Setup failures are reported back over a close-on-exec status pipe:
//   capability misses land in failed_capabilities, exec failure fails spawn.
//
// INVARIANTS:
//   - Every descriptor created here is close-on-exec, so concurrent spawns
//     never leak one child's stdin into another child and EOF stays reliable.
//   - kill_group() signals the whole process group, so grandchildren started
//     by `sh -c` die with the child.
//   - A ChildProcess destructor kills the group and reaps. No zombies survive it.
//
// THREADING:
//   One reader (read_output) and one writer (write_*, resize) may run
//   concurrently. try_wait/kill_group are safe from any thread.

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandcell {

struct ProcessSpec {
  std::string command;             // PATH lookup when not absolute
  std::vector<std::string> argv;   // Arguments after argv[0]
  std::map<std::string, std::string> env;  // Empty = inherit the parent's
  std::string cwd;
  std::uint64_t timeout_ms{5000};  // run_process() only
  std::size_t max_output_bytes{64 * 1024};  // run_process() only, per stream

  bool use_pty{false};             // ChildProcess only
  std::uint16_t pty_cols{80};
  std::uint16_t pty_rows{24};

  bool enforce_network_isolation{false};
  std::uint64_t max_memory_bytes{0};      // 0 = unlimited
  std::uint64_t max_processes{0};         // 0 = unlimited
  std::uint64_t max_file_descriptors{0};  // 0 = unlimited
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // Non-empty when the process never ran
  std::vector<std::string> enforced_capabilities;
  std::vector<std::string> failed_capabilities;
};

// Runs to completion or kills the process group at the deadline
// (exit_code 124, timed_out). stdin is /dev/null.
ProcessResult run_process(const ProcessSpec& spec);

class ChildProcess {
 public:
  static std::unique_ptr<ChildProcess> spawn(const ProcessSpec& spec, std::string* error);

  ~ChildProcess();
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t pid() const { return pid_; }
  bool is_pty() const { return pty_; }
  const std::vector<std::string>& enforced_capabilities() const { return enforced_; }
  const std::vector<std::string>& failed_capabilities() const { return failed_; }

  // Non-blocking. Bytes accepted (0 when the pipe is full), nullopt when the
  // child's input is gone.
  std::optional<std::size_t> write_some(std::string_view data);

  // Blocks until everything is written or timeout_ms passes.
  bool write_all(std::string_view data, std::uint64_t timeout_ms);

  // Signals EOF on stdin. On a pty this sends the EOF character instead.
  void close_input();

  // Appends whatever output arrives within wait_ms. false once the output
  // stream reached EOF.
  bool read_output(std::string& out, int wait_ms);

  bool resize(std::uint16_t cols, std::uint16_t rows);

  // Exit code once the child has exited (128 + signal when killed).
  std::optional<int> try_wait();
  int wait();

  void kill_group(int sig);

 private:
  ChildProcess() = default;

  pid_t pid_{-1};
  bool pty_{false};
  int in_fd_{-1};
  int out_fd_{-1};  // Same descriptor as in_fd_ for a pty
  bool input_closed_{false};
  std::atomic<bool> output_eof_{false};

  std::mutex wait_mu_;  // waitpid() and exit_code_
  std::optional<int> exit_code_;
  std::vector<std::string> enforced_;
  std::vector<std::string> failed_;
};

}  // namespace sandcell

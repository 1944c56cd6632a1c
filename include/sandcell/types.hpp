#pragma once

// sandcell/types.hpp - Core data structures for the sandcell execution manager.
//
// OWNERSHIP:
//   - ExecutionRequest/ExecutionResult are value types. No shared state per
//     execution; the controller returns results by value and never touches
//     them again.
//   - Error is a small value carried through out-parameters, the same way the
//     process layer reports ProcessResult::error_message. Nothing in the core
//     throws for an expected failure.
//
// ERROR TAXONOMY:
//   Platform failures (the caller's code never ran, or ran incompletely
//   because the platform failed):
//     workspace_io_error, image_unavailable, environment_start_error,
//     infrastructure_error, capacity_exceeded
//   User-visible outcomes (the code ran and this is what happened):
//     execution_timeout, execution_cancelled, and a plain non-zero exit code
//   Protocol/request errors:
//     unsupported_language, invalid_request, session_not_found,
//     input_after_close, config_invalid
//   Degraded mode:
//     simulated_execution
//
// EXTENSION_POINT: error_detail_structuring
//   Current: detail is free-form text for operators and callers.
//   Upgrade: attach the failing backend command and its exit status as fields
//   so dashboards can group EnvironmentStartError causes.

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sandcell {

enum class ErrorCode {
  none,
  unsupported_language,
  workspace_io_error,
  image_unavailable,
  environment_start_error,
  execution_timeout,
  execution_cancelled,
  infrastructure_error,
  session_not_found,
  input_after_close,
  capacity_exceeded,
  simulated_execution,
  invalid_request,
  config_invalid,
};

// Wire name of an error kind ("ExecutionTimeout", ...). Empty for none.
std::string to_string(ErrorCode code);

// Inverse of to_string(). Unknown names map to nullopt.
std::optional<ErrorCode> error_code_from_string(const std::string& name);

// True for failures of the platform rather than of the submitted program.
bool is_platform_failure(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::none};
  std::string detail;

  bool ok() const { return code == ErrorCode::none; }
};

// Assign to an optional out-parameter. Accepts nullptr.
inline void set_error(Error* out, ErrorCode code, std::string detail) {
  if (out) {
    out->code = code;
    out->detail = std::move(detail);
  }
}

// Shared cancellation flag. Copies observe the same flag; a default-constructed
// token can be cancelled like any other.
class CancelToken {
 public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true, std::memory_order_release); }
  bool cancelled() const { return flag_->load(std::memory_order_acquire); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

enum class ExecutionStatus { success, error };

std::string to_string(ExecutionStatus status);

struct ExecutionRequest {
  std::string id;          // Generated by the controller when empty
  std::string language;    // Registry id, e.g. "python"
  std::string source_code;
  std::string stdin_text;  // Empty = no stdin file, EOF on first read
};

// Result of one batch execution. Immutable once produced.
//
// exit_code semantics:
//   - measured exit code of the program when the environment exited on its own;
//   - 128 + signal when the program was killed by a signal inside the
//     environment;
//   - -1 when nothing was measured (platform failure, timeout, simulation).
struct ExecutionResult {
  std::string execution_id;
  ExecutionStatus status{ExecutionStatus::error};
  std::string output;  // Combined stdout+stderr in arrival order
  int32_t exit_code{-1};
  ErrorCode error_kind{ErrorCode::none};
  std::string error_detail;
  bool simulated{false};
  bool output_truncated{false};
  std::string output_digest;  // BLAKE3 "out:" domain digest of output
  uint64_t duration_ms{0};
  // Isolation the environment asked for but the backend did not apply,
  // e.g. "readonly_filesystem" on the host backend.
  std::vector<std::string> unenforced;
};

// ---------------------------------------------------------------------------
// Environment model
// ---------------------------------------------------------------------------

enum class NetworkPolicy { none, bridge };
enum class FilesystemPolicy { readonly, readwrite };
enum class EnvironmentMode { batch, interactive };

enum class EnvironmentState { created, started, attached, exited, removed };

std::string to_string(NetworkPolicy policy);
std::string to_string(FilesystemPolicy policy);
std::string to_string(EnvironmentMode mode);
std::string to_string(EnvironmentState state);

struct ResourceLimits {
  uint64_t memory_bytes{512ull * 1024 * 1024};
  double cpu_quota_fraction{0.5};
  uint32_t pids_limit{50};
};

struct BindMount {
  std::string host_path;
  std::string container_path;
  bool read_only{false};
};

// Creation parameters handed to an isolation backend.
struct EnvironmentSpec {
  std::string name;  // Unique per execution/session, e.g. "sandcell-exec-..."
  std::string image;
  std::vector<std::string> argv;
  std::string working_dir;
  std::vector<BindMount> bind_mounts;
  ResourceLimits limits;
  NetworkPolicy network_policy{NetworkPolicy::none};
  FilesystemPolicy filesystem_policy{FilesystemPolicy::readonly};
  bool auto_remove{true};
  bool tty{false};
  bool open_stdin{true};
  std::vector<std::pair<std::string, std::string>> labels;
};

}  // namespace sandcell

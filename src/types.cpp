#include "sandcell/types.hpp"

namespace sandcell {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::unsupported_language: return "UnsupportedLanguage";
    case ErrorCode::workspace_io_error: return "WorkspaceIOError";
    case ErrorCode::image_unavailable: return "ImageUnavailable";
    case ErrorCode::environment_start_error: return "EnvironmentStartError";
    case ErrorCode::execution_timeout: return "ExecutionTimeout";
    case ErrorCode::execution_cancelled: return "ExecutionCancelled";
    case ErrorCode::infrastructure_error: return "InfrastructureError";
    case ErrorCode::session_not_found: return "SessionNotFound";
    case ErrorCode::input_after_close: return "InputAfterClose";
    case ErrorCode::capacity_exceeded: return "CapacityExceeded";
    case ErrorCode::simulated_execution: return "SimulatedExecution";
    case ErrorCode::invalid_request: return "InvalidRequest";
    case ErrorCode::config_invalid: return "ConfigInvalid";
  }
  return "";
}

std::optional<ErrorCode> error_code_from_string(const std::string& name) {
  static const ErrorCode kAll[] = {
      ErrorCode::unsupported_language, ErrorCode::workspace_io_error,
      ErrorCode::image_unavailable,    ErrorCode::environment_start_error,
      ErrorCode::execution_timeout,    ErrorCode::execution_cancelled,
      ErrorCode::infrastructure_error, ErrorCode::session_not_found,
      ErrorCode::input_after_close,    ErrorCode::capacity_exceeded,
      ErrorCode::simulated_execution,  ErrorCode::invalid_request,
      ErrorCode::config_invalid,
  };
  if (name.empty()) return ErrorCode::none;
  for (ErrorCode c : kAll) {
    if (to_string(c) == name) return c;
  }
  return std::nullopt;
}

bool is_platform_failure(ErrorCode code) {
  switch (code) {
    case ErrorCode::workspace_io_error:
    case ErrorCode::image_unavailable:
    case ErrorCode::environment_start_error:
    case ErrorCode::infrastructure_error:
    case ErrorCode::capacity_exceeded:
      return true;
    default:
      return false;
  }
}

std::string to_string(ExecutionStatus status) {
  return status == ExecutionStatus::success ? "success" : "error";
}

std::string to_string(NetworkPolicy policy) {
  return policy == NetworkPolicy::none ? "none" : "bridge";
}

std::string to_string(FilesystemPolicy policy) {
  return policy == FilesystemPolicy::readonly ? "readonly" : "readwrite";
}

std::string to_string(EnvironmentMode mode) {
  return mode == EnvironmentMode::batch ? "batch" : "interactive";
}

std::string to_string(EnvironmentState state) {
  switch (state) {
    case EnvironmentState::created: return "created";
    case EnvironmentState::started: return "started";
    case EnvironmentState::attached: return "attached";
    case EnvironmentState::exited: return "exited";
    case EnvironmentState::removed: return "removed";
  }
  return "";
}

}  // namespace sandcell

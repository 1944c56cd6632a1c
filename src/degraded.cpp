#include "sandcell/degraded.hpp"

#include "sandcell/hash.hpp"

namespace sandcell {

ExecutionResult DegradedExecutor::run(const ExecutionRequest& request, std::uint64_t, const CancelToken*) {
  const auto started = std::chrono::steady_clock::now();
  const std::string id = request.id.empty() ? new_opaque_id("exec") : request.id;

  ExecutionEvent ev;
  ev.language = request.language;
  ev.backend = mode();
  ev.bytes_source = request.source_code.size();
  ev.bytes_stdin = request.stdin_text.size();

  Error err;
  const LanguageProfile* profile = registry_.lookup(request.language, &err);
  if (!profile) {
    ExecutionResult result = platform_failure(id, err.code, err.detail);
    finish_execution(result, ev, started);
    return result;
  }
  ev.language = to_string(profile->id);

  const std::string file = resolve_source_file_name(*profile, request.source_code);
  const bool file_stdin = config_.stdin_mode == StdinMode::file && !request.stdin_text.empty();
  const std::string command =
      expand_command(file_stdin ? profile->input_command : profile->run_command, config_.container_mount_path, file);

  ExecutionResult result;
  result.execution_id = id;
  result.status = ExecutionStatus::error;
  result.exit_code = -1;
  result.error_kind = ErrorCode::simulated_execution;
  result.error_detail = reason_;
  result.simulated = true;
  result.output = "Isolated execution is unavailable";
  if (!reason_.empty()) result.output += " (" + reason_ + ")";
  result.output += ". Nothing was run.\n";
  result.output += "image:   " + profile->image + "\n";
  result.output += "file:    " + config_.container_mount_path + "/" + file + "\n";
  result.output += "command: sh -c '" + command + "'\n";

  finish_execution(result, ev, started);
  return result;
}

}  // namespace sandcell

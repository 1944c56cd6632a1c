#include "sandcell/executor.hpp"

#include <algorithm>
#include <exception>
#include <string_view>
#include <thread>

#include "sandcell/degraded.hpp"
#include "sandcell/hash.hpp"
#include "sandcell/jsonlite.hpp"
#include "sandcell/log.hpp"

namespace sandcell {

namespace {

using Clock = std::chrono::steady_clock;

// Output of a finished process may still be in flight; drain at most this long.
constexpr auto kDrainAfterExit = std::chrono::milliseconds(200);

void append_capped(ExecutionResult& result, const std::string& chunk, std::size_t limit) {
  if (chunk.empty() || result.output_truncated) return;
  const std::size_t avail = result.output.size() < limit ? limit - result.output.size() : 0;
  if (chunk.size() > avail) {
    result.output.append(chunk, 0, avail);
    // Never keep half a character at the cut.
    result.output.resize(jsonlite::utf8_complete_prefix(result.output));
    result.output_truncated = true;
  } else {
    result.output += chunk;
  }
}

std::string join_names(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& n : names) out += (out.empty() ? "" : ",") + n;
  return out;
}

uint64_t elapsed_ns(Clock::time_point since) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - since).count());
}

}  // namespace

ExecutionResult platform_failure(const std::string& execution_id, ErrorCode code, const std::string& detail) {
  ExecutionResult r;
  r.execution_id = execution_id;
  r.status = ExecutionStatus::error;
  r.exit_code = -1;
  r.error_kind = code;
  r.error_detail = detail;
  r.output = detail;
  return r;
}

void finish_execution(ExecutionResult& result, ExecutionEvent& ev, Clock::time_point started) {
  if (result.output_truncated) result.output += "(truncated)";
  result.output_digest = output_digest(result.output);
  ev.duration_ns = elapsed_ns(started);
  result.duration_ms = ev.duration_ns / 1000000u;

  ev.execution_id = result.execution_id;
  ev.ok = result.status == ExecutionStatus::success;
  ev.error_kind = to_string(result.error_kind);
  ev.exit_code = result.exit_code;
  ev.timed_out = result.error_kind == ErrorCode::execution_timeout;
  ev.simulated = result.simulated;
  ev.bytes_output = result.output.size();
  ev.output_digest = result.output_digest;
  emit_execution_event(ev);
}

ExecutionResult BatchExecutionController::run(const ExecutionRequest& request, std::uint64_t timeout_ms,
                                              const CancelToken* cancel) {
  const auto started = Clock::now();
  const std::string id = request.id.empty() ? new_opaque_id("exec") : request.id;

  ExecutionEvent ev;
  ev.language = request.language;
  ev.backend = mode();
  ev.bytes_source = request.source_code.size();
  ev.bytes_stdin = request.stdin_text.size();

  ExecutionResult result;
  if (!is_safe_workspace_id(id)) {
    result = platform_failure(id, ErrorCode::invalid_request, "execution id must match [A-Za-z0-9_-]{1,128}");
  } else {
    try {
      result = run_pipeline(request, id, timeout_ms, cancel, ev);
    } catch (const std::exception& e) {
      // Scoped owners inside run_pipeline have already torn everything down.
      log_error("batch", id + ": " + e.what());
      result = platform_failure(id, ErrorCode::infrastructure_error, e.what());
    }
  }
  finish_execution(result, ev, started);
  log_info("batch", id + " " + to_string(result.status) + " exit=" + std::to_string(result.exit_code) +
                        (result.error_kind == ErrorCode::none ? "" : " " + to_string(result.error_kind)));
  return result;
}

ExecutionResult BatchExecutionController::run_pipeline(const ExecutionRequest& request,
                                                       const std::string& execution_id,
                                                       std::uint64_t timeout_ms, const CancelToken* cancel,
                                                       ExecutionEvent& ev) {
  const EngineConfig& config = engine_.config();
  Error err;

  // 1. Profile. No allocation happens before this succeeds.
  const LanguageProfile* profile = engine_.registry().lookup(request.language, &err);
  if (!profile) return platform_failure(execution_id, err.code, err.detail);
  ev.language = to_string(profile->id);

  // 2. Admission. Destroyed last.
  AdmissionTicket ticket;
  {
    ScopeTimer t(ev.admission_ns);
    ticket = engine_.admission().acquire(cancel, &err);
  }
  if (!ticket.valid()) return platform_failure(execution_id, err.code, err.detail);

  // 3. Workspace.
  auto ws = engine_.workspaces().acquire(execution_id, *profile, request.source_code, request.stdin_text, &err);
  if (!ws) return platform_failure(execution_id, err.code, err.detail);
  ScopedWorkspace workspace(engine_.workspaces(), std::move(*ws));

  // 4. Image.
  {
    ScopeTimer t(ev.image_ns);
    const auto deadline = Clock::now() + std::chrono::milliseconds(config.pull_timeout_ms);
    if (!engine_.images().ensure_available(profile->image, deadline, cancel, &err)) {
      return platform_failure(execution_id, err.code, err.detail);
    }
  }

  // 5. Provision + start.
  // The channel is declared after env so the attached process is reaped
  // before the environment is removed.
  std::optional<IsolatedEnvironment> created;
  std::optional<ScopedEnvironment> env;
  std::unique_ptr<IEnvironmentChannel> channel;
  std::vector<std::string> unenforced;
  {
    ScopeTimer t(ev.provision_ns);
    created = engine_.provisioner().provision(*profile, workspace.get(), EnvironmentMode::batch, &err);
    if (!created) return platform_failure(execution_id, err.code, err.detail);
    env.emplace(engine_.provisioner(), std::move(*created));

    unenforced = env->get().capabilities.unsupported;
    if (!unenforced.empty() && config.strict_isolation) {
      return platform_failure(execution_id, ErrorCode::environment_start_error,
                              "isolation not enforced: " + join_names(unenforced));
    }
    channel = engine_.provisioner().start(env->get(), &err);
    if (!channel) return platform_failure(execution_id, err.code, err.detail);
    for (auto& c : channel->unenforced()) {
      if (std::find(unenforced.begin(), unenforced.end(), c) == unenforced.end()) {
        unenforced.push_back(std::move(c));
      }
    }
    if (!unenforced.empty() && config.strict_isolation) {
      channel->kill();
      return platform_failure(execution_id, ErrorCode::environment_start_error,
                              "isolation not enforced: " + join_names(unenforced));
    }
  }
  if (!unenforced.empty()) log_warn("batch", execution_id + ": not enforced: " + join_names(unenforced));

  // 6. Run. The clock starts now.
  const auto run_started = Clock::now();
  const auto deadline = run_started + std::chrono::milliseconds(config.effective_timeout_ms(timeout_ms));
  ScopeTimer run_timer(ev.run_ns);

  ExecutionResult result;
  result.execution_id = execution_id;
  result.unenforced = std::move(unenforced);

  const bool stream_stdin = !(config.stdin_mode == StdinMode::file && workspace->stdin_file.has_value());
  std::string_view pending = stream_stdin ? std::string_view(request.stdin_text) : std::string_view();
  if (pending.empty()) channel->close_input();

  std::optional<int> exit_code;
  bool timed_out = false;
  bool cancelled = false;
  bool output_open = true;
  std::string chunk;
  while (true) {
    if (!pending.empty()) {
      auto n = channel->write_some(pending);
      if (!n) {
        // Program closed stdin without reading everything.
        pending = {};
      } else {
        pending.remove_prefix(*n);
      }
      if (pending.empty()) channel->close_input();
    }

    chunk.clear();
    if (output_open) output_open = channel->read_output(chunk, pending.empty() ? 20 : 2);
    append_capped(result, chunk, config.max_output_bytes);

    if (!exit_code) exit_code = channel->try_wait();
    if (exit_code && !output_open) break;
    if (exit_code) {
      // Exited; collect what is still buffered.
      const auto drain_until = Clock::now() + kDrainAfterExit;
      while (output_open && Clock::now() < drain_until) {
        chunk.clear();
        output_open = channel->read_output(chunk, 10);
        append_capped(result, chunk, config.max_output_bytes);
      }
      break;
    }
    if (!output_open) {
      // Output closed but the process lives on; avoid a busy loop.
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (cancel && cancel->cancelled()) {
      cancelled = true;
      break;
    }
    if (Clock::now() >= deadline) {
      timed_out = true;
      break;
    }
  }

  // Stragglers in the process group die with the run in every case.
  channel->kill();

  if (timed_out || cancelled) {
    Error stop_err;
    if (!engine_.provisioner().stop(env->get(), &stop_err)) {
      log_warn("batch", execution_id + ": stop failed: " + stop_err.detail);
    }
    result.status = ExecutionStatus::error;
    result.exit_code = -1;
    result.error_kind = timed_out ? ErrorCode::execution_timeout : ErrorCode::execution_cancelled;
    result.error_detail = timed_out
                              ? "no exit within " + std::to_string(config.effective_timeout_ms(timeout_ms)) + " ms"
                              : "cancelled by caller";
    return result;
  }

  env->get().state = EnvironmentState::exited;
  result.exit_code = *exit_code;
  result.status = *exit_code == 0 ? ExecutionStatus::success : ExecutionStatus::error;
  return result;
}

std::unique_ptr<IExecutor> make_executor(Engine& engine, Error* error) {
  Error ping_err;
  bool reachable = false;
  try {
    reachable = engine.backend().ping(&ping_err);
  } catch (const std::exception& e) {
    set_error(&ping_err, ErrorCode::infrastructure_error, e.what());
  }
  if (reachable) return std::make_unique<BatchExecutionController>(engine);

  if (engine.config().allow_degraded_mode) {
    log_warn("executor", "backend " + engine.backend().backend_id() + " unreachable (" + ping_err.detail +
                             "), running in degraded mode");
    return std::make_unique<DegradedExecutor>(engine.registry(), engine.config(), ping_err.detail);
  }
  set_error(error, ErrorCode::infrastructure_error,
            "backend " + engine.backend().backend_id() + " unreachable: " + ping_err.detail);
  return nullptr;
}

}  // namespace sandcell

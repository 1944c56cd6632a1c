#include "sandcell/docker_backend.hpp"

#include <cstdio>

#include "sandcell/log.hpp"

namespace sandcell {

namespace {

std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\n')) ++i;
  return s.substr(i);
}

bool mentions(const std::string& text, const char* needle) {
  return text.find(needle) != std::string::npos;
}

bool daemon_unreachable(const ProcessResult& r) {
  return mentions(r.stderr_text, "Cannot connect to the Docker daemon") ||
         mentions(r.stderr_text, "Is the docker daemon running") ||
         mentions(r.stderr_text, "error during connect");
}

bool no_such_container(const ProcessResult& r) {
  return mentions(r.stderr_text, "No such container") || mentions(r.stderr_text, "is already in progress");
}

// Failure text for *error: stderr when there is one, else the spawn error.
std::string failure_detail(const std::string& what, const ProcessResult& r) {
  if (!r.error_message.empty()) return what + ": " + r.error_message;
  if (r.timed_out) return what + ": timed out";
  const std::string err = trim(r.stderr_text);
  return what + ": exit " + std::to_string(r.exit_code) + (err.empty() ? "" : ": " + err);
}

std::string format_cpus(double fraction) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3g", fraction);
  return buf;
}

}  // namespace

ProcessResult DockerBackend::docker(std::vector<std::string> args, std::uint64_t timeout_ms) const {
  ProcessSpec spec;
  spec.command = docker_;
  spec.argv = std::move(args);
  spec.timeout_ms = timeout_ms;
  spec.max_output_bytes = 64 * 1024;
  return run_process(spec);
}

CapabilityReport DockerBackend::capabilities() const {
  CapabilityReport r;
  r.enforced = {"memory_limit", "cpu_quota", "pids_limit", "network_isolation", "readonly_filesystem",
                "auto_remove", "tty"};
  return r;
}

bool DockerBackend::ping(Error* error) {
  auto r = docker({"version", "--format", "{{.Server.Version}}"}, call_timeout_ms_);
  if (r.error_message.empty() && !r.timed_out && r.exit_code == 0) return true;
  set_error(error, ErrorCode::infrastructure_error, failure_detail("docker version", r));
  return false;
}

std::optional<bool> DockerBackend::image_present(const std::string& image, Error* error) {
  auto r = docker({"image", "inspect", "--format", "{{.Id}}", image}, call_timeout_ms_);
  if (!r.error_message.empty() || r.timed_out || daemon_unreachable(r)) {
    set_error(error, ErrorCode::infrastructure_error, failure_detail("docker image inspect", r));
    return std::nullopt;
  }
  return r.exit_code == 0;
}

bool DockerBackend::pull_image(const std::string& image, std::uint64_t timeout_ms, Error* error) {
  log_info("docker", "pulling " + image);
  auto r = docker({"pull", "--quiet", image}, timeout_ms);
  if (r.error_message.empty() && !r.timed_out && r.exit_code == 0) return true;
  const ErrorCode code = (!r.error_message.empty() || daemon_unreachable(r)) ? ErrorCode::infrastructure_error
                                                                             : ErrorCode::image_unavailable;
  set_error(error, code, failure_detail("docker pull " + image, r));
  return false;
}

std::vector<std::string> DockerBackend::create_args(const EnvironmentSpec& spec) {
  std::vector<std::string> a = {"create"};
  if (!spec.name.empty()) {
    a.push_back("--name");
    a.push_back(spec.name);
  }
  for (const auto& [k, v] : spec.labels) {
    a.push_back("--label");
    a.push_back(k + "=" + v);
  }
  if (spec.limits.memory_bytes > 0) {
    // Equal memory and memory-swap disables swap.
    a.push_back("--memory");
    a.push_back(std::to_string(spec.limits.memory_bytes));
    a.push_back("--memory-swap");
    a.push_back(std::to_string(spec.limits.memory_bytes));
  }
  if (spec.limits.cpu_quota_fraction > 0.0) {
    a.push_back("--cpus");
    a.push_back(format_cpus(spec.limits.cpu_quota_fraction));
  }
  if (spec.limits.pids_limit > 0) {
    a.push_back("--pids-limit");
    a.push_back(std::to_string(spec.limits.pids_limit));
  }
  a.push_back("--network");
  a.push_back(spec.network_policy == NetworkPolicy::none ? "none" : "bridge");
  if (spec.filesystem_policy == FilesystemPolicy::readonly) {
    a.push_back("--read-only");
    a.push_back("--tmpfs");
    a.push_back("/tmp:rw,size=64m");
  }
  for (const auto& m : spec.bind_mounts) {
    a.push_back("-v");
    a.push_back(m.host_path + ":" + m.container_path + (m.read_only ? ":ro" : ""));
  }
  if (!spec.working_dir.empty()) {
    a.push_back("-w");
    a.push_back(spec.working_dir);
  }
  if (spec.auto_remove) a.push_back("--rm");
  if (spec.open_stdin) a.push_back("-i");
  if (spec.tty) a.push_back("-t");
  a.push_back(spec.image);
  a.insert(a.end(), spec.argv.begin(), spec.argv.end());
  return a;
}

std::optional<std::string> DockerBackend::create(const EnvironmentSpec& spec, CapabilityReport* report,
                                                 Error* error) {
  auto r = docker(create_args(spec), call_timeout_ms_);
  if (!r.error_message.empty() || r.timed_out || daemon_unreachable(r)) {
    set_error(error, ErrorCode::infrastructure_error, failure_detail("docker create", r));
    return std::nullopt;
  }
  if (r.exit_code != 0) {
    const ErrorCode code =
        mentions(r.stderr_text, "No such image") ? ErrorCode::image_unavailable : ErrorCode::environment_start_error;
    set_error(error, code, failure_detail("docker create", r));
    return std::nullopt;
  }
  std::string id = trim(r.stdout_text);
  if (id.empty()) {
    set_error(error, ErrorCode::environment_start_error, "docker create: no container id");
    return std::nullopt;
  }
  if (report) {
    report->enforced = {"memory_limit", "cpu_quota", "pids_limit", "network_isolation"};
    if (spec.filesystem_policy == FilesystemPolicy::readonly) report->enforced.push_back("readonly_filesystem");
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    attach_[id] = Attach{spec.tty, spec.open_stdin};
  }
  return id;
}

std::unique_ptr<IEnvironmentChannel> DockerBackend::start(const std::string& env_id, Error* error) {
  Attach attach;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = attach_.find(env_id);
    if (it == attach_.end()) {
      set_error(error, ErrorCode::environment_start_error, "unknown environment " + env_id);
      return nullptr;
    }
    attach = it->second;
  }

  ProcessSpec spec;
  spec.command = docker_;
  spec.argv = {"start", "-a"};
  if (attach.open_stdin) spec.argv.push_back("-i");
  spec.argv.push_back(env_id);
  spec.use_pty = attach.tty;

  std::string spawn_error;
  std::shared_ptr<ChildProcess> child = ChildProcess::spawn(spec, &spawn_error);
  if (!child) {
    set_error(error, ErrorCode::infrastructure_error, "docker start: " + spawn_error);
    return nullptr;
  }
  return std::make_unique<ProcessChannel>(std::move(child));
}

bool DockerBackend::stop(const std::string& env_id, Error* error) {
  auto r = docker({"stop", "-t", "1", env_id}, call_timeout_ms_);
  if (r.error_message.empty() && !r.timed_out && (r.exit_code == 0 || no_such_container(r))) return true;
  set_error(error, ErrorCode::infrastructure_error, failure_detail("docker stop", r));
  return false;
}

bool DockerBackend::remove(const std::string& env_id, Error* error) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    attach_.erase(env_id);
  }
  auto r = docker({"rm", "-f", env_id}, call_timeout_ms_);
  if (r.error_message.empty() && !r.timed_out && (r.exit_code == 0 || no_such_container(r))) return true;
  set_error(error, ErrorCode::infrastructure_error, failure_detail("docker rm", r));
  return false;
}

}  // namespace sandcell

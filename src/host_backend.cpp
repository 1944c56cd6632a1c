#include "sandcell/host_backend.hpp"

#include <signal.h>
#include <unistd.h>

#include <filesystem>

#include "sandcell/log.hpp"

namespace sandcell {

namespace {

std::string rewrite_paths(std::string s, const std::vector<BindMount>& mounts) {
  for (const auto& m : mounts) {
    if (m.container_path.empty()) continue;
    size_t pos = 0;
    while ((pos = s.find(m.container_path, pos)) != std::string::npos) {
      s.replace(pos, m.container_path.size(), m.host_path);
      pos += m.host_path.size();
    }
  }
  return s;
}

std::string join(const std::vector<std::string>& v) {
  std::string out;
  for (const auto& s : v) {
    if (!out.empty()) out += ',';
    out += s;
  }
  return out;
}

}  // namespace

CapabilityReport HostBackend::capabilities() const {
  CapabilityReport r;
  r.enforced = {"memory_limit", "pids_limit", "tty"};
  if (::geteuid() == 0) r.enforced.push_back("network_isolation");
  else r.unsupported.push_back("network_isolation");
  r.unsupported.push_back("cpu_quota");
  r.unsupported.push_back("readonly_filesystem");
  r.unsupported.push_back("image_isolation");
  return r;
}

bool HostBackend::ping(Error* error) {
  if (::access("/bin/sh", X_OK) == 0) return true;
  set_error(error, ErrorCode::infrastructure_error, "host backend: /bin/sh not executable");
  return false;
}

std::optional<bool> HostBackend::image_present(const std::string&, Error*) { return true; }

bool HostBackend::pull_image(const std::string&, std::uint64_t, Error*) { return true; }

std::optional<std::string> HostBackend::create(const EnvironmentSpec& spec, CapabilityReport* report,
                                               Error* error) {
  if (spec.argv.empty()) {
    set_error(error, ErrorCode::environment_start_error, "empty argv");
    return std::nullopt;
  }
  for (const auto& m : spec.bind_mounts) {
    std::error_code ec;
    if (!std::filesystem::is_directory(m.host_path, ec)) {
      set_error(error, ErrorCode::environment_start_error, "bind source missing: " + m.host_path);
      return std::nullopt;
    }
  }

  HostEnvironment env;
  env.process.command = rewrite_paths(spec.argv[0], spec.bind_mounts);
  for (size_t i = 1; i < spec.argv.size(); ++i) {
    env.process.argv.push_back(rewrite_paths(spec.argv[i], spec.bind_mounts));
  }
  env.process.cwd = rewrite_paths(spec.working_dir, spec.bind_mounts);
  env.process.use_pty = spec.tty;
  env.process.enforce_network_isolation = spec.network_policy == NetworkPolicy::none;
  env.process.max_memory_bytes = spec.limits.memory_bytes;
  env.process.max_processes = spec.limits.pids_limit;

  if (report) {
    report->enforced = {"memory_limit", "pids_limit"};
    if (spec.network_policy == NetworkPolicy::none) {
      (::geteuid() == 0 ? report->enforced : report->unsupported).push_back("network_isolation");
    }
    if (spec.limits.cpu_quota_fraction > 0.0) report->unsupported.push_back("cpu_quota");
    if (spec.filesystem_policy == FilesystemPolicy::readonly) report->unsupported.push_back("readonly_filesystem");
    report->unsupported.push_back("image_isolation");
  }

  std::lock_guard<std::mutex> lk(mu_);
  std::string id = spec.name.empty() ? "host-" + std::to_string(++next_id_) : spec.name;
  if (envs_.contains(id)) {
    set_error(error, ErrorCode::environment_start_error, "environment exists: " + id);
    return std::nullopt;
  }
  envs_.emplace(id, std::move(env));
  return id;
}

std::unique_ptr<IEnvironmentChannel> HostBackend::start(const std::string& env_id, Error* error) {
  ProcessSpec process;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = envs_.find(env_id);
    if (it == envs_.end()) {
      set_error(error, ErrorCode::environment_start_error, "unknown environment " + env_id);
      return nullptr;
    }
    process = it->second.process;
  }

  std::string spawn_error;
  std::shared_ptr<ChildProcess> child = ChildProcess::spawn(process, &spawn_error);
  if (!child) {
    set_error(error, ErrorCode::environment_start_error, spawn_error);
    return nullptr;
  }
  if (!child->failed_capabilities().empty()) {
    log_warn("host", env_id + ": not enforced: " + join(child->failed_capabilities()));
  }

  std::lock_guard<std::mutex> lk(mu_);
  auto it = envs_.find(env_id);
  if (it == envs_.end()) {
    // Removed while starting.
    set_error(error, ErrorCode::environment_start_error, "environment removed during start: " + env_id);
    return nullptr;
  }
  it->second.pid = child->pid();
  it->second.child = child;
  return std::make_unique<ProcessChannel>(std::move(child));
}

bool HostBackend::stop(const std::string& env_id, Error*) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = envs_.find(env_id);
  if (it == envs_.end()) return true;
  // Signal the group only while its ChildProcess is alive (not yet
  // destroyed), so a recycled pid is never hit.
  if (!it->second.child.expired() && it->second.pid > 0) ::kill(-it->second.pid, SIGKILL);
  return true;
}

bool HostBackend::remove(const std::string& env_id, Error* error) {
  stop(env_id, error);
  std::lock_guard<std::mutex> lk(mu_);
  envs_.erase(env_id);
  return true;
}

std::size_t HostBackend::live_environments() const {
  std::lock_guard<std::mutex> lk(mu_);
  return envs_.size();
}

}  // namespace sandcell

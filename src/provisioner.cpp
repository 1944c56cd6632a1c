#include "sandcell/provisioner.hpp"

#include <exception>

#include "sandcell/log.hpp"
#include "sandcell/observability.hpp"

namespace sandcell {

EnvironmentSpec Provisioner::build_spec(const LanguageProfile& profile, const Workspace& ws,
                                        EnvironmentMode mode) const {
  const std::string& mount = config_.container_mount_path;

  EnvironmentSpec spec;
  spec.name = "sandcell-" + ws.id;
  spec.image = profile.image;
  spec.working_dir = mount;
  spec.labels = {{"sandcell.owner", ws.id},
                 {"sandcell.mode", to_string(mode)},
                 {"sandcell.language", to_string(profile.id)}};

  if (mode == EnvironmentMode::batch) {
    const bool file_stdin = config_.stdin_mode == StdinMode::file && ws.stdin_file.has_value();
    const std::string& tmpl = file_stdin ? profile.input_command : profile.run_command;
    spec.argv = {"sh", "-c", expand_command(tmpl, mount, ws.source_file)};
    spec.limits = config_.batch_limits;
    spec.network_policy = NetworkPolicy::none;
    spec.filesystem_policy =
        profile.needs_writable_workspace ? FilesystemPolicy::readwrite : FilesystemPolicy::readonly;
    spec.bind_mounts = {{ws.root_path, mount, !profile.needs_writable_workspace}};
    spec.auto_remove = true;
    spec.tty = false;
    spec.open_stdin = !file_stdin;
  } else {
    spec.argv = {profile.interactive_command};
    spec.limits = config_.interactive_limits;
    spec.network_policy = NetworkPolicy::bridge;
    spec.filesystem_policy = FilesystemPolicy::readwrite;
    spec.bind_mounts = {{ws.root_path, mount, false}};
    spec.auto_remove = false;
    spec.tty = true;
    spec.open_stdin = true;
  }
  return spec;
}

std::optional<IsolatedEnvironment> Provisioner::provision(const LanguageProfile& profile, const Workspace& ws,
                                                          EnvironmentMode mode, Error* error) {
  const EnvironmentSpec spec = build_spec(profile, ws, mode);

  IsolatedEnvironment env;
  env.name = spec.name;
  env.image = spec.image;
  env.workspace_id = ws.id;
  env.mode = mode;
  env.limits = spec.limits;
  env.network_policy = spec.network_policy;
  env.filesystem_policy = spec.filesystem_policy;

  Error err;
  std::optional<std::string> id;
  try {
    id = backend_.create(spec, &env.capabilities, &err);
  } catch (const std::exception& e) {
    set_error(&err, ErrorCode::infrastructure_error, std::string("create threw: ") + e.what());
  }
  if (!id) {
    set_error(error, err.ok() ? ErrorCode::environment_start_error : err.code, err.detail);
    return std::nullopt;
  }
  env.id = *id;
  env.state = EnvironmentState::created;
  log_debug("provisioner", "created " + env.name + " (" + env.image + ", " + to_string(mode) + ")");
  return env;
}

std::unique_ptr<IEnvironmentChannel> Provisioner::start(IsolatedEnvironment& env, Error* error) {
  Error err;
  std::unique_ptr<IEnvironmentChannel> channel;
  try {
    channel = backend_.start(env.id, &err);
  } catch (const std::exception& e) {
    set_error(&err, ErrorCode::infrastructure_error, std::string("start threw: ") + e.what());
  }
  if (!channel) {
    set_error(error, err.ok() ? ErrorCode::environment_start_error : err.code, err.detail);
    return nullptr;
  }
  env.state = EnvironmentState::attached;
  return channel;
}

bool Provisioner::stop(IsolatedEnvironment& env, Error* error) {
  if (env.state == EnvironmentState::removed || env.state == EnvironmentState::exited) return true;
  bool ok = false;
  try {
    ok = backend_.stop(env.id, error);
  } catch (const std::exception& e) {
    set_error(error, ErrorCode::infrastructure_error, std::string("stop threw: ") + e.what());
  }
  if (ok) env.state = EnvironmentState::exited;
  return ok;
}

bool Provisioner::remove(IsolatedEnvironment& env, Error* error) {
  if (env.state == EnvironmentState::removed) return true;
  bool ok = false;
  try {
    ok = backend_.remove(env.id, error);
  } catch (const std::exception& e) {
    set_error(error, ErrorCode::infrastructure_error, std::string("remove threw: ") + e.what());
  }
  if (ok) env.state = EnvironmentState::removed;
  return ok;
}

bool ScopedEnvironment::release() {
  if (released_) return true;
  released_ = true;
  Error err;
  if (!provisioner_->remove(env_, &err)) {
    global_engine_stats().cleanup_failures.fetch_add(1, std::memory_order_relaxed);
    log_warn("provisioner", "remove " + env_.name + " failed: " + err.detail);
    return false;
  }
  return true;
}

}  // namespace sandcell

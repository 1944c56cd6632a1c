#pragma once

// sandcell/provisioner.hpp - Environment specs and lifecycle.
//
// build_spec() is pure: profile + workspace + mode + config -> EnvironmentSpec.
//
//   batch        network none, filesystem readonly (readwrite when the
//                profile compiles next to its source), auto-remove, no tty,
//                stdin open, workspace bound read-only unless writable
//   interactive  network bridge, filesystem readwrite, removed explicitly
//                when the session closes, tty, workspace bound read-write
//
// Limits always come from EngineConfig::batch_limits / interactive_limits.
//
// STATE MACHINE (IsolatedEnvironment::state):
//   created -> attached (start) -> exited (stop) -> removed
//   Every environment reaches removed through ScopedEnvironment.

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "sandcell/backend.hpp"
#include "sandcell/config.hpp"
#include "sandcell/language.hpp"
#include "sandcell/workspace.hpp"

namespace sandcell {

struct IsolatedEnvironment {
  std::string id;  // Backend id
  std::string name;
  std::string image;
  std::string workspace_id;
  EnvironmentMode mode{EnvironmentMode::batch};
  ResourceLimits limits;
  NetworkPolicy network_policy{NetworkPolicy::none};
  FilesystemPolicy filesystem_policy{FilesystemPolicy::readonly};
  EnvironmentState state{EnvironmentState::created};
  CapabilityReport capabilities;
};

class Provisioner {
 public:
  Provisioner(const EngineConfig& config, IIsolationBackend& backend) : config_(config), backend_(backend) {}

  EnvironmentSpec build_spec(const LanguageProfile& profile, const Workspace& ws, EnvironmentMode mode) const;

  std::optional<IsolatedEnvironment> provision(const LanguageProfile& profile, const Workspace& ws,
                                               EnvironmentMode mode, Error* error);

  std::unique_ptr<IEnvironmentChannel> start(IsolatedEnvironment& env, Error* error);

  bool stop(IsolatedEnvironment& env, Error* error);

  // Force removal. Idempotent.
  bool remove(IsolatedEnvironment& env, Error* error);

  IIsolationBackend& backend() { return backend_; }
  const EngineConfig& config() const { return config_; }

 private:
  const EngineConfig& config_;
  IIsolationBackend& backend_;
};

// RAII owner: removes the environment on destruction. Removal failures are
// logged and counted, never thrown.
class ScopedEnvironment {
 public:
  ScopedEnvironment(Provisioner& provisioner, IsolatedEnvironment env)
      : provisioner_(&provisioner), env_(std::move(env)) {}
  ~ScopedEnvironment() { release(); }

  ScopedEnvironment(const ScopedEnvironment&) = delete;
  ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

  IsolatedEnvironment& get() { return env_; }
  IsolatedEnvironment* operator->() { return &env_; }

  bool release();

 private:
  Provisioner* provisioner_;
  IsolatedEnvironment env_;
  bool released_{false};
};

}  // namespace sandcell

#include "sandcell/engine.hpp"

namespace sandcell {

Engine::Engine(EngineConfig config, std::unique_ptr<IIsolationBackend> backend)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      registry_(config_.image_overrides),
      workspaces_(config_.resolved_workspace_root()),
      images_(*backend_, config_.pull_timeout_ms),
      provisioner_(config_, *backend_),
      admission_(config_.max_concurrent_environments, config_.admission_wait_ms) {}

}  // namespace sandcell

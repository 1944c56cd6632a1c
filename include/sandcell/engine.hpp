#pragma once

// sandcell/engine.hpp - Composition root.
//
// Owns the process-wide components that batch executions and terminal
// sessions share: configuration, the isolation backend, the language
// registry, the workspace manager, the image cache, the provisioner and the
// admission gate. Constructed once and passed by reference; there are no
// global instances.
//
// Member order is construction order: the image cache and provisioner hold
// references to the backend and config declared before them.

#include <memory>

#include "sandcell/admission.hpp"
#include "sandcell/backend.hpp"
#include "sandcell/config.hpp"
#include "sandcell/image_cache.hpp"
#include "sandcell/language.hpp"
#include "sandcell/provisioner.hpp"
#include "sandcell/workspace.hpp"

namespace sandcell {

class Engine {
 public:
  Engine(EngineConfig config, std::unique_ptr<IIsolationBackend> backend);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  const EngineConfig& config() const { return config_; }
  IIsolationBackend& backend() { return *backend_; }
  const LanguageRegistry& registry() const { return registry_; }
  const WorkspaceManager& workspaces() const { return workspaces_; }
  ImageCache& images() { return images_; }
  Provisioner& provisioner() { return provisioner_; }
  AdmissionGate& admission() { return admission_; }

 private:
  const EngineConfig config_;
  std::unique_ptr<IIsolationBackend> backend_;
  const LanguageRegistry registry_;
  const WorkspaceManager workspaces_;
  ImageCache images_;
  Provisioner provisioner_;
  AdmissionGate admission_;
};

}  // namespace sandcell

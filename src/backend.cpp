#include "sandcell/backend.hpp"

#include "sandcell/docker_backend.hpp"
#include "sandcell/host_backend.hpp"

namespace sandcell {

std::unique_ptr<IIsolationBackend> make_backend(const EngineConfig& config, Error* error) {
  if (config.backend == "docker") {
    return std::make_unique<DockerBackend>(config.docker_binary, config.backend_call_timeout_ms);
  }
  if (config.backend == "host") {
    return std::make_unique<HostBackend>();
  }
  set_error(error, ErrorCode::config_invalid, "unknown backend: " + config.backend);
  return nullptr;
}

}  // namespace sandcell

#pragma once

// sandcell/docker_backend.hpp - Isolation through the Docker CLI.
//
// COMMAND MAPPING:
//   ping           docker version --format {{.Server.Version}}
//   image_present  docker image inspect --format {{.Id}} IMAGE
//   pull_image     docker pull IMAGE
//   create         docker create --name N --label K=V --memory M --memory-swap M
//                    --cpus F --pids-limit P --network none|bridge
//                    [--read-only --tmpfs /tmp] -v HOST:CONT[:ro] -w DIR
//                    [--rm] [-i] [-t] IMAGE ARGV...
//   start          docker start -a [-i] ID   (attached child; under a local
//                    pseudo-terminal when the spec asked for a tty, so the
//                    client forwards window size changes)
//   stop           docker stop -t 1 ID
//   remove         docker rm -f ID
//
// Short CLI calls go through run_process() with backend_call_timeout_ms.
// "No such container" from stop/remove counts as success: --rm environments
// remove themselves when the attached process exits.

#include <map>
#include <mutex>

#include "sandcell/backend.hpp"

namespace sandcell {

class DockerBackend final : public IIsolationBackend {
 public:
  DockerBackend(std::string docker_binary, std::uint64_t call_timeout_ms)
      : docker_(std::move(docker_binary)), call_timeout_ms_(call_timeout_ms) {}

  std::string backend_id() const override { return "docker"; }
  CapabilityReport capabilities() const override;
  bool ping(Error* error) override;
  std::optional<bool> image_present(const std::string& image, Error* error) override;
  bool pull_image(const std::string& image, std::uint64_t timeout_ms, Error* error) override;
  std::optional<std::string> create(const EnvironmentSpec& spec, CapabilityReport* report,
                                    Error* error) override;
  std::unique_ptr<IEnvironmentChannel> start(const std::string& env_id, Error* error) override;
  bool stop(const std::string& env_id, Error* error) override;
  bool remove(const std::string& env_id, Error* error) override;

  // `docker create` arguments for spec (without the binary).
  static std::vector<std::string> create_args(const EnvironmentSpec& spec);

 private:
  struct Attach {
    bool tty{false};
    bool open_stdin{true};
  };

  ProcessResult docker(std::vector<std::string> args, std::uint64_t timeout_ms) const;

  std::string docker_;
  std::uint64_t call_timeout_ms_;

  std::mutex mu_;
  std::map<std::string, Attach> attach_;  // env id -> how to attach on start
};

}  // namespace sandcell

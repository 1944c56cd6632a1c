#pragma once

// sandcell/host_backend.hpp - rlimit jail on the local kernel.
//
// Runs the environment's argv directly on the host, inside the workspace
// directory. Bind mount container paths appearing in argv and working_dir are
// rewritten to their host paths, so profile commands written for /code work
// unchanged.
//
// ENFORCED:     memory_limit (RLIMIT_AS), pids_limit (RLIMIT_NPROC, per uid),
//               network_isolation (unshare(CLONE_NEWNET), best effort)
// UNSUPPORTED:  cpu_quota, readonly_filesystem, image isolation. Images are
//               always reported present; the host's own toolchain runs.
//
// For development machines and tests without a container runtime. Not a
// security boundary.

#include <map>
#include <mutex>

#include "sandcell/backend.hpp"

namespace sandcell {

class HostBackend final : public IIsolationBackend {
 public:
  HostBackend() = default;

  std::string backend_id() const override { return "host"; }
  CapabilityReport capabilities() const override;
  bool ping(Error* error) override;
  std::optional<bool> image_present(const std::string& image, Error* error) override;
  bool pull_image(const std::string& image, std::uint64_t timeout_ms, Error* error) override;
  std::optional<std::string> create(const EnvironmentSpec& spec, CapabilityReport* report,
                                    Error* error) override;
  std::unique_ptr<IEnvironmentChannel> start(const std::string& env_id, Error* error) override;
  bool stop(const std::string& env_id, Error* error) override;
  bool remove(const std::string& env_id, Error* error) override;

  // Number of environments created and not yet removed.
  std::size_t live_environments() const;

 private:
  struct HostEnvironment {
    ProcessSpec process;
    pid_t pid{-1};
    std::weak_ptr<ChildProcess> child;
  };

  mutable std::mutex mu_;
  std::map<std::string, HostEnvironment> envs_;
  std::uint64_t next_id_{0};
};

}  // namespace sandcell

#pragma once

// sandcell/backend.hpp - Isolation backend interface.
//
// DESIGN:
//   Everything above this interface (image cache, provisioner, batch
//   controller, terminal manager) is backend-agnostic. A backend turns an
//   EnvironmentSpec into a running, attached process and tears it down again.
//
//   Calls return false / nullopt / nullptr and fill *error on failure:
//     InfrastructureError      the backend itself is unreachable or broken
//     ImageUnavailable         the image cannot be found or pulled
//     EnvironmentStartError    create/start rejected for this environment
//
// EXTENSION_POINT: native_runtime_backend
//   Current: Docker CLI (docker_backend.hpp) and a host rlimit jail
//   (host_backend.hpp).
//   Upgrade: talk to the runtime's API socket directly, or drive runc/crun
//   with a generated OCI bundle. Nothing outside the backend changes.

#include <csignal>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sandcell/config.hpp"
#include "sandcell/sandbox.hpp"
#include "sandcell/types.hpp"

namespace sandcell {

// Attached stdin/output of a started environment.
class IEnvironmentChannel {
 public:
  virtual ~IEnvironmentChannel() = default;

  // Non-blocking. Bytes accepted, nullopt once input is gone.
  virtual std::optional<std::size_t> write_some(std::string_view data) = 0;
  virtual bool write_all(std::string_view data, std::uint64_t timeout_ms) = 0;
  virtual void close_input() = 0;

  // Appends output arriving within wait_ms. false at end of output.
  virtual bool read_output(std::string& out, int wait_ms) = 0;

  virtual bool resize(std::uint16_t cols, std::uint16_t rows) = 0;

  // Exit code of the attached process once it has exited.
  virtual std::optional<int> try_wait() = 0;
  virtual void kill() = 0;

  // Limits the attached process was meant to get but did not, as found at
  // start (the create-time report cannot see these).
  virtual std::vector<std::string> unenforced() const { return {}; }
};

// Channel over a local child process (the attached docker client, or the
// program itself for the host backend).
class ProcessChannel final : public IEnvironmentChannel {
 public:
  explicit ProcessChannel(std::shared_ptr<ChildProcess> child) : child_(std::move(child)) {}

  std::optional<std::size_t> write_some(std::string_view data) override { return child_->write_some(data); }
  bool write_all(std::string_view data, std::uint64_t timeout_ms) override {
    return child_->write_all(data, timeout_ms);
  }
  void close_input() override { child_->close_input(); }
  bool read_output(std::string& out, int wait_ms) override { return child_->read_output(out, wait_ms); }
  bool resize(std::uint16_t cols, std::uint16_t rows) override { return child_->resize(cols, rows); }
  std::optional<int> try_wait() override { return child_->try_wait(); }
  void kill() override { child_->kill_group(SIGKILL); }
  std::vector<std::string> unenforced() const override { return child_->failed_capabilities(); }

 private:
  std::shared_ptr<ChildProcess> child_;
};

struct CapabilityReport {
  std::vector<std::string> enforced;
  std::vector<std::string> unsupported;
};

class IIsolationBackend {
 public:
  virtual ~IIsolationBackend() = default;

  virtual std::string backend_id() const = 0;

  // What this backend can enforce, independent of any environment.
  virtual CapabilityReport capabilities() const = 0;

  virtual bool ping(Error* error) = 0;

  // true/false when known, nullopt (with *error) when the backend failed.
  virtual std::optional<bool> image_present(const std::string& image, Error* error) = 0;
  virtual bool pull_image(const std::string& image, std::uint64_t timeout_ms, Error* error) = 0;

  // Returns the backend's environment id. *report lists what this spec gets
  // enforced and what it asked for that this backend cannot do.
  virtual std::optional<std::string> create(const EnvironmentSpec& spec, CapabilityReport* report,
                                            Error* error) = 0;
  virtual std::unique_ptr<IEnvironmentChannel> start(const std::string& env_id, Error* error) = 0;

  // Both tolerate environments that are already gone.
  virtual bool stop(const std::string& env_id, Error* error) = 0;
  virtual bool remove(const std::string& env_id, Error* error) = 0;
};

// "docker" or "host". ConfigInvalid for anything else.
std::unique_ptr<IIsolationBackend> make_backend(const EngineConfig& config, Error* error);

}  // namespace sandcell

#pragma once

// sandcell/workspace.hpp - Ephemeral per-execution directories.
//
// LAYOUT:
//   <root>/<id>/               mode 0700, one per execution or terminal session
//   <root>/<id>/<source file>  name from the language profile's file name rule
//   <root>/<id>/input.txt      only when stdin is non-empty
//
// INVARIANTS:
//   - ids are restricted to [A-Za-z0-9_-]; anything else is rejected before
//     touching the filesystem, so <root>/<id> never escapes <root>.
//   - acquire() either returns a complete workspace or leaves nothing behind.
//   - A ScopedWorkspace releases its directory exactly once.

#include <optional>
#include <string>
#include <utility>

#include "sandcell/language.hpp"
#include "sandcell/types.hpp"

namespace sandcell {

struct Workspace {
  std::string id;
  std::string root_path;
  std::string source_file;                // File name only. Empty for terminals.
  std::optional<std::string> stdin_file;  // File name only ("input.txt").
};

inline constexpr const char* kStdinFileName = "input.txt";

bool is_safe_workspace_id(const std::string& id);

class WorkspaceManager {
 public:
  explicit WorkspaceManager(std::string root) : root_(std::move(root)) {}

  const std::string& root() const { return root_; }

  std::optional<Workspace> acquire(const std::string& id, const LanguageProfile& profile,
                                   const std::string& source_code, const std::string& stdin_text,
                                   Error* error) const;

  // Empty workspace for an interactive session.
  std::optional<Workspace> acquire_empty(const std::string& id, Error* error) const;

  // Recursive removal. Missing directories count as released.
  bool release(const Workspace& ws, Error* error) const;

 private:
  std::optional<Workspace> create_dir(const std::string& id, Error* error) const;

  std::string root_;
};

// RAII owner: releases on destruction, logging and counting failures.
class ScopedWorkspace {
 public:
  ScopedWorkspace(const WorkspaceManager& manager, Workspace ws)
      : manager_(&manager), ws_(std::move(ws)) {}
  ~ScopedWorkspace() { release(); }

  ScopedWorkspace(const ScopedWorkspace&) = delete;
  ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

  const Workspace& get() const { return ws_; }
  const Workspace* operator->() const { return &ws_; }

  // Idempotent. Returns false when the removal failed.
  bool release();

 private:
  const WorkspaceManager* manager_;
  Workspace ws_;
  bool released_{false};
};

}  // namespace sandcell

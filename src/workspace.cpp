#include "sandcell/workspace.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <filesystem>
#include <fstream>

#include "sandcell/log.hpp"
#include "sandcell/observability.hpp"

namespace fs = std::filesystem;

namespace sandcell {

namespace {

bool write_file(const fs::path& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  ofs.close();
  return static_cast<bool>(ofs);
}

}  // namespace

bool is_safe_workspace_id(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '-' || c == '_';
    if (!ok) return false;
  }
  return true;
}

std::optional<Workspace> WorkspaceManager::create_dir(const std::string& id, Error* error) const {
  if (!is_safe_workspace_id(id)) {
    set_error(error, ErrorCode::workspace_io_error, "invalid workspace id: " + id);
    return std::nullopt;
  }
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    set_error(error, ErrorCode::workspace_io_error, "create root " + root_ + ": " + ec.message());
    return std::nullopt;
  }
  const fs::path dir = fs::path(root_) / id;
  // mkdir fails on an existing directory, so a reused id never shares state.
  if (::mkdir(dir.c_str(), 0700) != 0) {
    set_error(error, ErrorCode::workspace_io_error,
              "create " + dir.string() + ": " + std::error_code(errno, std::generic_category()).message());
    return std::nullopt;
  }
  Workspace ws;
  ws.id = id;
  ws.root_path = dir.string();
  return ws;
}

std::optional<Workspace> WorkspaceManager::acquire(const std::string& id, const LanguageProfile& profile,
                                                   const std::string& source_code,
                                                   const std::string& stdin_text, Error* error) const {
  auto ws = create_dir(id, error);
  if (!ws) return std::nullopt;

  ws->source_file = resolve_source_file_name(profile, source_code);
  bool ok = write_file(fs::path(ws->root_path) / ws->source_file, source_code);
  std::string failed = ws->source_file;
  if (ok && !stdin_text.empty()) {
    ws->stdin_file = kStdinFileName;
    ok = write_file(fs::path(ws->root_path) / kStdinFileName, stdin_text);
    failed = kStdinFileName;
  }
  if (!ok) {
    Error cleanup;
    release(*ws, &cleanup);
    set_error(error, ErrorCode::workspace_io_error, "write " + failed + " in " + ws->root_path);
    return std::nullopt;
  }
  log_debug("workspace", "acquired " + ws->root_path);
  return ws;
}

std::optional<Workspace> WorkspaceManager::acquire_empty(const std::string& id, Error* error) const {
  auto ws = create_dir(id, error);
  if (ws) log_debug("workspace", "acquired " + ws->root_path);
  return ws;
}

bool WorkspaceManager::release(const Workspace& ws, Error* error) const {
  if (ws.root_path.empty()) return true;
  std::error_code ec;
  fs::remove_all(ws.root_path, ec);
  if (ec) {
    set_error(error, ErrorCode::workspace_io_error, "remove " + ws.root_path + ": " + ec.message());
    return false;
  }
  return true;
}

bool ScopedWorkspace::release() {
  if (released_) return true;
  released_ = true;
  Error err;
  if (!manager_->release(ws_, &err)) {
    global_engine_stats().cleanup_failures.fetch_add(1, std::memory_order_relaxed);
    log_warn("workspace", err.detail);
    return false;
  }
  return true;
}

}  // namespace sandcell

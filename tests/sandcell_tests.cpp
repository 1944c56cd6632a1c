#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "sandcell/admission.hpp"
#include "sandcell/config.hpp"
#include "sandcell/degraded.hpp"
#include "sandcell/docker_backend.hpp"
#include "sandcell/engine.hpp"
#include "sandcell/executor.hpp"
#include "sandcell/hash.hpp"
#include "sandcell/host_backend.hpp"
#include "sandcell/image_cache.hpp"
#include "sandcell/jsonlite.hpp"
#include "sandcell/language.hpp"
#include "sandcell/observability.hpp"
#include "sandcell/provisioner.hpp"
#include "sandcell/sandbox.hpp"
#include "sandcell/wire.hpp"
#include "sandcell/workspace.hpp"

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

void skip_test(const std::string& name, const std::string& reason) {
  std::cout << "  " << name << "... SKIPPED (" << reason << ")\n";
  g_tests_skipped++;
}

bool have_python3() { return std::system("command -v python3 >/dev/null 2>&1") == 0; }

std::string test_root(const std::string& suite) {
  return (fs::temp_directory_path() / ("sandcell-test-" + std::to_string(::getpid()) + "-" + suite)).string();
}

size_t entries_in(const std::string& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;
  size_t n = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) ++n;
  return n;
}

// Host backend config. RLIMIT_NPROC counts every process of the uid, so
// the pids cap is raised out of the way.
sandcell::EngineConfig host_config(const std::string& suite) {
  sandcell::EngineConfig c;
  c.backend = "host";
  c.workspace_root = test_root(suite);
  c.batch_limits.pids_limit = 100000;
  c.interactive_limits.pids_limit = 100000;
  c.default_timeout_ms = 5000;
  c.max_timeout_ms = 10000;
  return c;
}

std::unique_ptr<sandcell::Engine> host_engine(const sandcell::EngineConfig& config) {
  return std::make_unique<sandcell::Engine>(config, std::make_unique<sandcell::HostBackend>());
}

sandcell::ExecutionRequest shell_request(const std::string& code, const std::string& stdin_text = "") {
  sandcell::ExecutionRequest req;
  req.language = "shell";
  req.source_code = code;
  req.stdin_text = stdin_text;
  return req;
}

// Backend with no environments: counts pulls, optionally slow or failing.
class CountingBackend final : public sandcell::IIsolationBackend {
 public:
  std::atomic<int> pulls{0};
  std::atomic<bool> fail_pulls{false};
  std::atomic<bool> reachable{true};
  int pull_delay_ms{200};

  std::string backend_id() const override { return "counting"; }
  sandcell::CapabilityReport capabilities() const override { return {}; }

  bool ping(sandcell::Error* error) override {
    if (reachable) return true;
    sandcell::set_error(error, sandcell::ErrorCode::infrastructure_error, "daemon down");
    return false;
  }

  std::optional<bool> image_present(const std::string&, sandcell::Error*) override { return false; }

  bool pull_image(const std::string& image, std::uint64_t, sandcell::Error* error) override {
    pulls.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(pull_delay_ms));
    if (fail_pulls) {
      sandcell::set_error(error, sandcell::ErrorCode::image_unavailable, "manifest unknown: " + image);
      return false;
    }
    return true;
  }

  std::optional<std::string> create(const sandcell::EnvironmentSpec&, sandcell::CapabilityReport*,
                                    sandcell::Error* error) override {
    sandcell::set_error(error, sandcell::ErrorCode::environment_start_error, "not supported");
    return std::nullopt;
  }
  std::unique_ptr<sandcell::IEnvironmentChannel> start(const std::string&, sandcell::Error* error) override {
    sandcell::set_error(error, sandcell::ErrorCode::environment_start_error, "not supported");
    return nullptr;
  }
  bool stop(const std::string&, sandcell::Error*) override { return true; }
  bool remove(const std::string&, sandcell::Error*) override { return true; }
};

// Runs fn on n threads released together.
template <typename Fn>
void run_concurrently(int n, Fn fn) {
  std::atomic<int> ready{0};
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < n; ++i) {
    threads.emplace_back([&, i] {
      ready.fetch_add(1);
      while (!go.load()) std::this_thread::yield();
      fn(i);
    });
  }
  while (ready.load() < n) std::this_thread::yield();
  go.store(true);
  for (auto& t : threads) t.join();
}

// ============================================================================
// Language registry
// ============================================================================

void test_registry_lookup() {
  sandcell::LanguageRegistry registry;
  expect(registry.list().size() == 11, "eleven languages");

  sandcell::Error err;
  const auto* py = registry.lookup("  Python ", &err);
  expect(py != nullptr, "lookup is case-insensitive and trimmed");
  expect(py->id == sandcell::LanguageId::python, "python profile");
  expect(py->image == "python:3.9-alpine", "default python image");
  expect(py->source_file_name == "program.py", "python file name");

  expect(registry.lookup("cobol", &err) == nullptr, "unknown language rejected");
  expect(err.code == sandcell::ErrorCode::unsupported_language, "UnsupportedLanguage");

  for (const auto& p : registry.list()) {
    expect(sandcell::parse_language(sandcell::to_string(p.id)) == p.id, "id round trip " + sandcell::to_string(p.id));
    expect(!p.image.empty() && !p.run_command.empty(), "complete profile " + sandcell::to_string(p.id));
  }
}

void test_registry_image_override() {
  sandcell::LanguageRegistry registry(std::map<std::string, std::string>{{"python", "python:3.12-slim"}});
  expect(registry.get(sandcell::LanguageId::python).image == "python:3.12-slim", "override applied");
  expect(registry.get(sandcell::LanguageId::ruby).image == "ruby:alpine", "others untouched");
}

void test_java_file_naming() {
  const std::string src =
      "// public class Decoy {}\n"
      "/* public class Other */\n"
      "String s = \"public class Quoted\";\n"
      "public final class Greeter {\n"
      "  public static void main(String[] a) {}\n"
      "}\n";
  expect(sandcell::java_public_class(src) == std::optional<std::string>("Greeter"),
         "public class outside comments and literals");

  sandcell::LanguageRegistry registry;
  const auto& java = registry.get(sandcell::LanguageId::java);
  expect(sandcell::resolve_source_file_name(java, src) == "Greeter.java", "Greeter.java");
  expect(sandcell::resolve_source_file_name(java, "class Hidden {}") == "Main.java", "default Main.java");
  expect(sandcell::resolve_source_file_name(java, "public class A$B {}") == "A$B.java", "'$' kept in class names");

  const auto& py = registry.get(sandcell::LanguageId::python);
  expect(sandcell::resolve_source_file_name(py, src) == "program.py", "fixed rule ignores source");
}

void test_expand_command() {
  expect(sandcell::expand_command("cd {dir} && javac {src} && java {stem}", "/code", "Greeter.java") ==
             "cd /code && javac Greeter.java && java Greeter",
         "java command template");
  expect(sandcell::expand_command("python3 {dir}/{src} < {dir}/input.txt", "/w", "program.py") ==
             "python3 /w/program.py < /w/input.txt",
         "every occurrence substituted");

  // '$' is legal in Java identifiers and must not reach sh unquoted.
  const std::string nested = sandcell::expand_command("javac {src} && java {stem}", "/code", "A$B.java");
  expect(nested == "javac 'A$B.java' && java 'A$B'", "quoted: " + nested);
  expect(sandcell::expand_command("cat {src}", "/code", "it's.txt") == "cat 'it'\\''s.txt'",
         "embedded quote escaped");

  sandcell::ProcessSpec sh;
  sh.command = "sh";
  sh.argv = {"-c", sandcell::expand_command("printf '%s|%s' {src} {stem}", "/code", "A$B.java")};
  auto r = sandcell::run_process(sh);
  expect(r.stdout_text == "A$B.java|A$B", "shell sees the names intact: " + r.stdout_text);
}

// ============================================================================
// Workspaces
// ============================================================================

void test_workspace_lifecycle() {
  const std::string root = test_root("ws");
  sandcell::WorkspaceManager mgr(root);
  sandcell::LanguageRegistry registry;
  const auto& py = registry.get(sandcell::LanguageId::python);

  sandcell::Error err;
  auto ws = mgr.acquire("exec-ws1", py, "print(1)\n", "Ada", &err);
  expect(ws.has_value(), "acquire: " + err.detail);
  expect(ws->source_file == "program.py", "source file name");
  expect(ws->stdin_file == std::optional<std::string>("input.txt"), "stdin file present");

  std::ifstream src(fs::path(ws->root_path) / "program.py");
  std::string line;
  std::getline(src, line);
  expect(line == "print(1)", "source written");
  std::ifstream in(fs::path(ws->root_path) / "input.txt");
  std::getline(in, line);
  expect(line == "Ada", "stdin written");

  sandcell::Error dup;
  expect(!mgr.acquire("exec-ws1", py, "x", "", &dup).has_value(), "duplicate id rejected");
  expect(dup.code == sandcell::ErrorCode::workspace_io_error, "WorkspaceIOError on duplicate");

  expect(mgr.release(*ws, &err), "release");
  expect(!fs::exists(ws->root_path), "directory removed");
  expect(mgr.release(*ws, &err), "second release is a no-op");

  auto no_stdin = mgr.acquire("exec-ws2", py, "x", "", &err);
  expect(no_stdin && !no_stdin->stdin_file, "empty stdin writes no file");
  mgr.release(*no_stdin, &err);
  fs::remove_all(root);
}

void test_workspace_rejects_unsafe_ids() {
  sandcell::WorkspaceManager mgr(test_root("ws-unsafe"));
  sandcell::Error err;
  expect(!mgr.acquire_empty("../escape", &err), "path traversal rejected");
  expect(err.code == sandcell::ErrorCode::workspace_io_error, "WorkspaceIOError");
  expect(!sandcell::is_safe_workspace_id(""), "empty id");
  expect(!sandcell::is_safe_workspace_id(std::string(129, 'a')), "overlong id");
  expect(sandcell::is_safe_workspace_id("term-0123abcd_X"), "plain id");
  fs::remove_all(test_root("ws-unsafe"));
}

void test_scoped_workspace_releases() {
  const std::string root = test_root("ws-scoped");
  sandcell::WorkspaceManager mgr(root);
  sandcell::Error err;
  std::string path;
  {
    auto ws = mgr.acquire_empty("term-scoped", &err);
    expect(ws.has_value(), "acquire_empty");
    path = ws->root_path;
    sandcell::ScopedWorkspace scoped(mgr, std::move(*ws));
    expect(fs::is_directory(path), "exists while scoped");
  }
  expect(!fs::exists(path), "released at scope exit");
  fs::remove_all(root);
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_validation() {
  auto ok = sandcell::validate_config(
      R"({"config_version":"1","backend":"host","max_concurrent_environments":4,)"
      R"("batch_limits":{"memory_bytes":268435456,"cpu_quota_fraction":1.5,"pids_limit":64},)"
      R"("images":{"python":"python:3.12-alpine"}})");
  expect(ok.ok, "valid config accepted");
  expect(ok.config_version == "1", "config_version reported");
  expect(ok.errors.empty(), "no errors");

  auto unknown = sandcell::validate_config(R"({"backend":"host","colour":"blue"})");
  expect(unknown.ok, "unknown keys are not errors");
  expect(!unknown.warnings.empty(), "unknown key warned");

  auto bad = sandcell::validate_config(R"({"default_timeout_ms":90000,"max_timeout_ms":1000})");
  expect(!bad.ok && !bad.errors.empty(), "default above max rejected");

  expect(!sandcell::validate_config(R"({"batch_limits":{"memory_bytes":1024}})").ok, "tiny memory rejected");
  expect(!sandcell::validate_config(R"({"images":{"cobol":"cobol:latest"}})").ok, "unknown image language");
  expect(!sandcell::validate_config(R"({"backend":42})").ok, "wrong type rejected");
  expect(!sandcell::validate_config(R"({"strict_isolation":"yes"})").ok, "strict_isolation must be a boolean");
  expect(!sandcell::validate_config("{not json").ok, "malformed JSON rejected");
}

void test_config_load_and_clamp() {
  sandcell::EngineConfig base;
  sandcell::ConfigValidationResult v;
  auto cfg = sandcell::load_config_json(
      R"({"backend":"host","default_timeout_ms":2000,"max_timeout_ms":4000,"stdin_mode":"file",)"
      R"("images":{"ruby":"ruby:3.3"},"allow_degraded_mode":false,"strict_isolation":true})",
      base, &v);
  expect(cfg.has_value(), "config loads");
  expect(cfg->backend == "host", "backend applied");
  expect(cfg->stdin_mode == sandcell::StdinMode::file, "stdin mode applied");
  expect(!cfg->allow_degraded_mode, "degraded flag applied");
  expect(cfg->strict_isolation, "strict isolation applied");
  expect(cfg->image_overrides.at("ruby") == "ruby:3.3", "image override applied");

  expect(cfg->effective_timeout_ms(0) == 2000, "0 means default");
  expect(cfg->effective_timeout_ms(3000) == 3000, "within range kept");
  expect(cfg->effective_timeout_ms(999999) == 4000, "clamped to max");

  sandcell::ConfigValidationResult bad;
  expect(!sandcell::load_config_json(R"({"pull_timeout_ms":"soon"})", base, &bad), "invalid config not applied");
  expect(!bad.errors.empty(), "errors reported");
}

// ============================================================================
// Wire documents
// ============================================================================

void test_wire_batch_request() {
  sandcell::Error err;
  auto doc = sandcell::parse_batch_request(
      R"json({"executionId":"exec-1","language":"python","code":"print(1)","stdin":"x","timeoutMs":2500})json", &err);
  expect(doc.has_value(), "request parses: " + err.detail);
  expect(doc->request.id == "exec-1" && doc->request.language == "python", "fields");
  expect(doc->request.stdin_text == "x" && doc->timeout_ms == 2500, "optional fields");

  auto minimal = sandcell::parse_batch_request(R"({"language":"shell","code":"echo"})", &err);
  expect(minimal && minimal->request.id.empty() && minimal->timeout_ms == 0, "optional fields default");

  sandcell::Error missing;
  expect(!sandcell::parse_batch_request(R"({"language":"shell"})", &missing), "code required");
  expect(missing.code == sandcell::ErrorCode::invalid_request, "InvalidRequest");

  sandcell::Error typed;
  expect(!sandcell::parse_batch_request(R"({"language":"shell","code":"x","timeoutMs":"5"})", &typed),
         "timeoutMs must be a number");
  expect(typed.code == sandcell::ErrorCode::invalid_request, "InvalidRequest for wrong type");
}

void test_wire_batch_result() {
  auto failed = sandcell::platform_failure("exec-9", sandcell::ErrorCode::image_unavailable, "pull failed");
  const std::string json = sandcell::batch_result_to_json(failed);
  auto obj = sandcell::jsonlite::parse(json, nullptr);
  expect(sandcell::jsonlite::get_i64(obj, "exitCode") == -1, "negative exit code");
  expect(sandcell::jsonlite::get_string(obj, "errorKind") == "ImageUnavailable", "error kind wire name");
  expect(sandcell::jsonlite::get_string(obj, "status") == "error", "status");
  expect(sandcell::jsonlite::get_string(obj, "output") == "pull failed", "detail as output");

  sandcell::ExecutionResult ok;
  ok.execution_id = "exec-10";
  ok.status = sandcell::ExecutionStatus::success;
  ok.exit_code = 0;
  ok.output = "hi\n";
  auto ok_obj = sandcell::jsonlite::parse(sandcell::batch_result_to_json(ok), nullptr);
  expect(!sandcell::jsonlite::has(ok_obj, "errorKind"), "no errorKind on success");
  expect(sandcell::jsonlite::has(ok_obj, "outputDigest") && sandcell::jsonlite::has(ok_obj, "durationMs"),
         "digest and duration present");
}

void test_wire_terminal_frames() {
  sandcell::Error err;
  auto input = sandcell::parse_client_frame(R"({"type":"input","sessionId":"term-1","data":"ls\n"})", &err);
  expect(input && input->type == sandcell::ClientFrameType::input && input->data == "ls\n", "input frame");
  expect(input->to_event().type == sandcell::TerminalEventType::input, "input event");

  auto resize = sandcell::parse_client_frame(R"({"type":"resize","sessionId":"term-1","cols":120,"rows":40})", &err);
  expect(resize && resize->cols == 120 && resize->rows == 40, "resize frame");

  auto create = sandcell::parse_client_frame(R"({"type":"create","language":"python"})", &err);
  expect(create && create->type == sandcell::ClientFrameType::create && create->language == "python", "create");

  sandcell::Error bad;
  expect(!sandcell::parse_client_frame(R"({"type":"resize","sessionId":"term-1","cols":80})", &bad), "rows required");
  expect(!sandcell::parse_client_frame(R"({"type":"dance","sessionId":"term-1"})", &bad), "unknown type");
  expect(!sandcell::parse_client_frame(R"({"type":"input","data":"x"})", &bad), "sessionId required");
  expect(bad.code == sandcell::ErrorCode::invalid_request, "InvalidRequest");

  auto out = sandcell::jsonlite::parse(
      sandcell::outbound_to_json({"term-1", sandcell::OutboundType::output, "a\"b"}), nullptr);
  expect(sandcell::jsonlite::get_string(out, "type") == "output", "output type");
  expect(sandcell::jsonlite::get_string(out, "sessionId") == "term-1", "sessionId");
  expect(sandcell::jsonlite::get_string(out, "data") == "a\"b", "data escaped and restored");

  auto error = sandcell::jsonlite::parse(
      sandcell::outbound_to_json({"term-2", sandcell::OutboundType::error, "no capacity"}), nullptr);
  expect(sandcell::jsonlite::get_string(error, "message") == "no capacity", "error message field");
}

// ============================================================================
// Image cache
// ============================================================================

void test_image_cache_single_flight() {
  CountingBackend backend;
  sandcell::ImageCache cache(backend, 10000);

  std::atomic<int> ok{0};
  run_concurrently(8, [&](int) {
    sandcell::Error err;
    if (cache.ensure_available("python:3.9-alpine", std::nullopt, nullptr, &err)) ok.fetch_add(1);
  });
  expect(backend.pulls.load() == 1, "exactly one pull for concurrent callers");
  expect(ok.load() == 8, "every caller succeeds");
  expect(cache.is_cached("python:3.9-alpine"), "image remembered");

  sandcell::Error err;
  expect(cache.ensure_available("python:3.9-alpine", std::nullopt, nullptr, &err), "cached");
  expect(backend.pulls.load() == 1, "cache hit does not pull");
  expect(cache.counters().cache_hits.load() >= 1, "hit counted");
}

void test_image_cache_failure_shared_not_cached() {
  CountingBackend backend;
  backend.fail_pulls = true;
  sandcell::ImageCache cache(backend, 10000);

  std::atomic<int> unavailable{0};
  run_concurrently(6, [&](int) {
    sandcell::Error err;
    if (!cache.ensure_available("ghost:latest", std::nullopt, nullptr, &err) &&
        err.code == sandcell::ErrorCode::image_unavailable) {
      unavailable.fetch_add(1);
    }
  });
  expect(backend.pulls.load() == 1, "one pull for the failing flight");
  expect(unavailable.load() == 6, "every caller sees ImageUnavailable");
  expect(!cache.is_cached("ghost:latest"), "failure not cached");

  backend.fail_pulls = false;
  sandcell::Error err;
  expect(cache.ensure_available("ghost:latest", std::nullopt, nullptr, &err), "retry pulls again");
  expect(backend.pulls.load() == 2, "new flight after failure");
}

void test_image_cache_waiter_deadline() {
  CountingBackend backend;
  backend.pull_delay_ms = 600;
  sandcell::ImageCache cache(backend, 10000);

  sandcell::Error err;
  const auto t0 = Clock::now();
  expect(!cache.ensure_available("slow:1", Clock::now() + std::chrono::milliseconds(50), nullptr, &err),
         "gives up at its deadline");
  expect(err.code == sandcell::ErrorCode::image_unavailable, "ImageUnavailable on deadline");
  expect(Clock::now() - t0 < std::chrono::milliseconds(500), "did not wait for the pull");

  // The abandoned pull still completes for the next caller.
  sandcell::Error later;
  expect(cache.ensure_available("slow:1", std::nullopt, nullptr, &later), "joined flight succeeds");
  expect(backend.pulls.load() == 1, "no second pull");
}

// ============================================================================
// Provisioner
// ============================================================================

void test_build_spec_batch() {
  sandcell::EngineConfig config;
  config.batch_limits = {128ull * 1024 * 1024, 0.25, 32};
  CountingBackend backend;
  sandcell::Provisioner prov(config, backend);
  sandcell::LanguageRegistry registry;

  sandcell::Workspace ws{"exec-abc", "/tmp/ws/exec-abc", "program.py", std::nullopt};
  auto spec = prov.build_spec(registry.get(sandcell::LanguageId::python), ws, sandcell::EnvironmentMode::batch);
  expect(spec.name == "sandcell-exec-abc", "environment name");
  expect(spec.image == "python:3.9-alpine", "image");
  expect(spec.argv == std::vector<std::string>{"sh", "-c", "python3 /code/program.py"}, "batch command");
  expect(spec.network_policy == sandcell::NetworkPolicy::none, "no network");
  expect(spec.filesystem_policy == sandcell::FilesystemPolicy::readonly, "readonly");
  expect(spec.bind_mounts.size() == 1 && spec.bind_mounts[0].read_only, "read-only bind");
  expect(spec.bind_mounts[0].host_path == "/tmp/ws/exec-abc" && spec.bind_mounts[0].container_path == "/code",
         "bind paths");
  expect(spec.auto_remove && !spec.tty && spec.open_stdin, "batch flags");
  expect(spec.limits.memory_bytes == 128ull * 1024 * 1024 && spec.limits.pids_limit == 32, "configured limits");
  bool owner = false;
  for (const auto& l : spec.labels) owner = owner || (l.first == "sandcell.owner" && l.second == "exec-abc");
  expect(owner, "owner label");

  auto c_spec = prov.build_spec(registry.get(sandcell::LanguageId::c), ws, sandcell::EnvironmentMode::batch);
  expect(c_spec.filesystem_policy == sandcell::FilesystemPolicy::readwrite, "compiled languages get readwrite");
  expect(!c_spec.bind_mounts[0].read_only, "writable bind for compiled output");
}

void test_build_spec_stdin_file_mode() {
  sandcell::EngineConfig config;
  config.stdin_mode = sandcell::StdinMode::file;
  CountingBackend backend;
  sandcell::Provisioner prov(config, backend);
  sandcell::LanguageRegistry registry;

  sandcell::Workspace ws{"exec-in", "/tmp/ws/exec-in", "program.py", std::string("input.txt")};
  auto spec = prov.build_spec(registry.get(sandcell::LanguageId::python), ws, sandcell::EnvironmentMode::batch);
  expect(spec.argv.back() == "python3 /code/program.py < /code/input.txt", "stdin redirected from file");
  expect(!spec.open_stdin, "stdin closed in file mode");
}

void test_build_spec_interactive() {
  sandcell::EngineConfig config;
  CountingBackend backend;
  sandcell::Provisioner prov(config, backend);
  sandcell::LanguageRegistry registry;

  sandcell::Workspace ws{"term-abc", "/tmp/ws/term-abc", "", std::nullopt};
  auto spec =
      prov.build_spec(registry.get(sandcell::LanguageId::shell), ws, sandcell::EnvironmentMode::interactive);
  expect(spec.argv == std::vector<std::string>{"/bin/sh"}, "interactive shell");
  expect(spec.tty && spec.open_stdin && !spec.auto_remove, "interactive flags");
  expect(spec.network_policy == sandcell::NetworkPolicy::bridge, "bridge network");
  expect(spec.filesystem_policy == sandcell::FilesystemPolicy::readwrite, "readwrite");
  expect(spec.limits.pids_limit == config.interactive_limits.pids_limit, "interactive limits");
}

// ============================================================================
// Docker argument mapping
// ============================================================================

bool has_arg(const std::vector<std::string>& args, const std::string& arg) {
  return std::find(args.begin(), args.end(), arg) != args.end();
}

// Value following the first occurrence of flag, "" when absent.
std::string arg_after(const std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  return it == args.end() || it + 1 == args.end() ? "" : *(it + 1);
}

// Image followed by argv closes the argument list; every flag precedes it.
bool ends_with_command(const std::vector<std::string>& args, const sandcell::EnvironmentSpec& spec) {
  std::vector<std::string> tail = {spec.image};
  tail.insert(tail.end(), spec.argv.begin(), spec.argv.end());
  return args.size() > tail.size() && std::equal(tail.begin(), tail.end(), args.end() - tail.size());
}

void test_docker_args_batch_interpreted() {
  sandcell::EngineConfig config;
  config.batch_limits = {256ull * 1024 * 1024, 0.5, 32};
  CountingBackend backend;
  sandcell::Provisioner prov(config, backend);
  sandcell::LanguageRegistry registry;

  sandcell::Workspace ws{"exec-py", "/tmp/ws/exec-py", "program.py", std::nullopt};
  auto spec = prov.build_spec(registry.get(sandcell::LanguageId::python), ws, sandcell::EnvironmentMode::batch);
  auto args = sandcell::DockerBackend::create_args(spec);

  expect(args.front() == "create", "docker create");
  expect(arg_after(args, "--name") == "sandcell-exec-py", "container name");
  expect(has_arg(args, "sandcell.owner=exec-py"), "owner label");
  expect(arg_after(args, "--memory") == "268435456", "memory limit");
  expect(arg_after(args, "--memory-swap") == "268435456", "swap disabled");
  expect(arg_after(args, "--cpus") == "0.5", "cpu quota");
  expect(arg_after(args, "--pids-limit") == "32", "pids limit");
  expect(arg_after(args, "--network") == "none", "no network");
  expect(has_arg(args, "--read-only"), "read-only root filesystem");
  expect(arg_after(args, "--tmpfs") == "/tmp:rw,size=64m", "scratch tmpfs");
  expect(arg_after(args, "-v") == "/tmp/ws/exec-py:/code:ro", "workspace bound read-only");
  expect(arg_after(args, "-w") == "/code", "working dir");
  expect(has_arg(args, "--rm") && has_arg(args, "-i") && !has_arg(args, "-t"), "auto-remove, stdin, no tty");
  expect(ends_with_command(args, spec), "image and command last");
  expect(args.back() == "python3 /code/program.py", "run command");
}

void test_docker_args_batch_compiled() {
  sandcell::EngineConfig config;
  config.stdin_mode = sandcell::StdinMode::file;
  CountingBackend backend;
  sandcell::Provisioner prov(config, backend);
  sandcell::LanguageRegistry registry;

  sandcell::Workspace ws{"exec-c", "/tmp/ws/exec-c", "program.c", std::string("input.txt")};
  auto spec = prov.build_spec(registry.get(sandcell::LanguageId::c), ws, sandcell::EnvironmentMode::batch);
  auto args = sandcell::DockerBackend::create_args(spec);

  expect(arg_after(args, "--network") == "none", "no network");
  expect(!has_arg(args, "--read-only") && !has_arg(args, "--tmpfs"), "writable filesystem for the build");
  expect(arg_after(args, "-v") == "/tmp/ws/exec-c:/code", "workspace bound read-write");
  expect(has_arg(args, "--rm"), "auto-remove");
  expect(!has_arg(args, "-i") && !has_arg(args, "-t"), "stdin comes from input.txt");
  expect(arg_after(args, "--pids-limit") == std::to_string(config.batch_limits.pids_limit), "batch pids limit");
  expect(ends_with_command(args, spec), "image and command last");
  expect(args.back().find("< input.txt") != std::string::npos, "stdin redirected");
}

void test_docker_args_interactive() {
  sandcell::EngineConfig config;
  CountingBackend backend;
  sandcell::Provisioner prov(config, backend);
  sandcell::LanguageRegistry registry;

  sandcell::Workspace ws{"term-sh", "/tmp/ws/term-sh", "", std::nullopt};
  auto spec =
      prov.build_spec(registry.get(sandcell::LanguageId::shell), ws, sandcell::EnvironmentMode::interactive);
  auto args = sandcell::DockerBackend::create_args(spec);

  expect(arg_after(args, "--network") == "bridge", "bridge network");
  expect(!has_arg(args, "--read-only"), "writable filesystem");
  expect(arg_after(args, "-v") == "/tmp/ws/term-sh:/code", "workspace bound read-write");
  expect(!has_arg(args, "--rm"), "removed explicitly on close");
  expect(has_arg(args, "-i") && has_arg(args, "-t"), "stdin and tty");
  expect(arg_after(args, "--pids-limit") == std::to_string(config.interactive_limits.pids_limit),
         "interactive pids limit");
  expect(has_arg(args, "sandcell.mode=interactive"), "mode label");
  expect(ends_with_command(args, spec), "image and shell last");
}

// ============================================================================
// Admission
// ============================================================================

void test_admission_gate() {
  sandcell::AdmissionGate gate(1, 0);
  sandcell::Error err;
  auto first = gate.acquire(nullptr, &err);
  expect(first.valid(), "first ticket");
  expect(gate.in_use() == 1, "slot taken");

  auto second = gate.acquire(nullptr, &err);
  expect(!second.valid(), "gate full");
  expect(err.code == sandcell::ErrorCode::capacity_exceeded, "CapacityExceeded");

  first.release();
  expect(gate.in_use() == 0, "slot returned");
  auto third = gate.acquire(nullptr, &err);
  expect(third.valid(), "slot reusable");
}

void test_admission_wait_then_admit() {
  sandcell::AdmissionGate gate(1, 2000);
  sandcell::Error err;
  auto held = gate.acquire(nullptr, &err);
  std::thread releaser([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    held.release();
  });
  auto waited = gate.acquire(nullptr, &err);
  releaser.join();
  expect(waited.valid(), "waiter admitted once a slot frees");
}

// ============================================================================
// Batch execution (host backend)
// ============================================================================

void test_batch_hello() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  auto r = exec.run(shell_request("echo \"Hello, World!\"\n"), 0, nullptr);
  expect(r.status == sandcell::ExecutionStatus::success, "success: " + r.output);
  expect(r.output == "Hello, World!\n", "output");
  expect(r.exit_code == 0, "exit 0");
  expect(r.output_digest.size() == 64, "digest");
  expect(r.execution_id.rfind("exec-", 0) == 0, "generated id");
  expect(!fs::exists(fs::path(engine->config().workspace_root) / r.execution_id), "workspace removed");
  expect(engine->admission().in_use() == 0, "slot released");
}

void test_batch_stdin() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  auto r = exec.run(shell_request("read name\necho \"Hello, $name!\"\n", "Ada"), 0, nullptr);
  expect(r.output.find("Hello, Ada!\n") != std::string::npos, "stdin delivered: " + r.output);
}

void test_batch_stdin_file_mode() {
  auto config = host_config("batch");
  config.stdin_mode = sandcell::StdinMode::file;
  auto engine = host_engine(config);
  sandcell::BatchExecutionController exec(*engine);
  auto r = exec.run(shell_request("read a\nread b\necho \"$b-$a\"\n", "one\ntwo\n"), 0, nullptr);
  expect(r.output == "two-one\n", "stdin read from file: " + r.output);
}

void test_batch_nonzero_exit_and_stderr() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  auto r = exec.run(shell_request("echo out\necho err 1>&2\nexit 3\n"), 0, nullptr);
  expect(r.status == sandcell::ExecutionStatus::error, "non-zero exit is an error");
  expect(r.exit_code == 3, "measured exit code");
  expect(r.error_kind == sandcell::ErrorCode::none, "program outcome, not a platform failure");
  expect(r.output.find("out\n") != std::string::npos && r.output.find("err\n") != std::string::npos,
         "stdout and stderr combined");
}

void test_batch_timeout() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  const auto t0 = Clock::now();
  auto r = exec.run(shell_request("while true; do :; done\n"), 1000, nullptr);
  const auto elapsed = Clock::now() - t0;
  expect(r.error_kind == sandcell::ErrorCode::execution_timeout, "ExecutionTimeout");
  expect(r.exit_code == -1, "no exit code measured");
  expect(elapsed >= std::chrono::milliseconds(1000), "ran for the timeout");
  expect(elapsed < std::chrono::milliseconds(4000), "returned promptly after the timeout");
  expect(entries_in(engine->config().workspace_root) == 0, "no leftover workspace");
}

void test_batch_cancel() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  sandcell::CancelToken cancel;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cancel.cancel();
  });
  auto r = exec.run(shell_request("while true; do :; done\n"), 8000, &cancel);
  canceller.join();
  expect(r.error_kind == sandcell::ErrorCode::execution_cancelled, "ExecutionCancelled");
  expect(entries_in(engine->config().workspace_root) == 0, "workspace removed after cancel");
}

void test_batch_unsupported_language() {
  auto engine = host_engine(host_config("batch-unsup"));
  sandcell::BatchExecutionController exec(*engine);
  sandcell::ExecutionRequest req;
  req.language = "unknownlang";
  req.source_code = "x";
  auto r = exec.run(req, 0, nullptr);
  expect(r.error_kind == sandcell::ErrorCode::unsupported_language, "UnsupportedLanguage");
  expect(r.exit_code == -1, "exit -1");
  expect(!fs::exists(engine->config().workspace_root) || entries_in(engine->config().workspace_root) == 0,
         "nothing allocated");
}

void test_batch_determinism() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  const auto req = shell_request("i=0\nwhile [ $i -lt 5 ]; do echo line$i; i=$((i+1)); done\n", "ignored");
  auto a = exec.run(req, 0, nullptr);
  auto b = exec.run(req, 0, nullptr);
  expect(a.output == b.output, "same output");
  expect(a.exit_code == b.exit_code, "same exit code");
  expect(a.output_digest == b.output_digest, "same digest");
  expect(a.execution_id != b.execution_id, "distinct ids");
}

void test_batch_output_cap() {
  auto config = host_config("batch");
  config.max_output_bytes = 1024;
  auto engine = host_engine(config);
  sandcell::BatchExecutionController exec(*engine);
  auto r = exec.run(shell_request("i=0\nwhile [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done\n"), 0, nullptr);
  expect(r.output_truncated, "truncated");
  expect(r.output.size() == 1024 + std::string("(truncated)").size(), "capped at max_output_bytes");
  expect(r.output.substr(1024) == "(truncated)", "marker appended");
}

void test_batch_output_cap_utf8_boundary() {
  auto config = host_config("batch");
  config.max_output_bytes = 3;
  auto engine = host_engine(config);
  sandcell::BatchExecutionController exec(*engine);
  // Two 2-byte characters; the cap falls inside the second one.
  auto r = exec.run(shell_request("printf '\\303\\251\\303\\251'\n"), 0, nullptr);
  expect(r.output_truncated, "truncated");
  expect(r.output == "\xc3\xa9(truncated)", "cut before the split character: " + r.output);
}

void test_utf8_complete_prefix() {
  using sandcell::jsonlite::utf8_complete_prefix;
  expect(utf8_complete_prefix("") == 0, "empty");
  expect(utf8_complete_prefix("abc") == 3, "ascii");
  expect(utf8_complete_prefix("a\xc3\xa9") == 3, "complete 2-byte");
  expect(utf8_complete_prefix("a\xc3") == 1, "lead byte held back");
  expect(utf8_complete_prefix("a\xe2\x82") == 1, "partial 3-byte held back");
  expect(utf8_complete_prefix("\xf0\x9f\x98") == 0, "partial 4-byte held back");
  expect(utf8_complete_prefix("\xf0\x9f\x98\x80") == 4, "complete 4-byte");
}

bool lists(const std::vector<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

// The host backend cannot make the filesystem read-only, apply a CPU quota
// or run the image; a batch result says so instead of looking fully isolated.
void test_batch_reports_unenforced_isolation() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  auto r = exec.run(shell_request("echo ran\n"), 0, nullptr);
  expect(r.status == sandcell::ExecutionStatus::success, "ran: " + r.output);
  expect(lists(r.unenforced, "readonly_filesystem"), "readonly filesystem listed");
  expect(lists(r.unenforced, "cpu_quota"), "cpu quota listed");
  expect(lists(r.unenforced, "image_isolation"), "image isolation listed");
  expect(!lists(r.unenforced, "memory_limit"), "memory limit is enforced");

  auto obj = sandcell::jsonlite::parse(sandcell::batch_result_to_json(r), nullptr);
  auto wire = sandcell::jsonlite::get_string_array(obj, "unenforced");
  expect(wire.size() == r.unenforced.size() && lists(wire, "readonly_filesystem"), "unenforced on the wire");
}

void test_batch_strict_isolation_refuses() {
  auto config = host_config("batch-strict");
  config.strict_isolation = true;
  auto engine = host_engine(config);
  sandcell::BatchExecutionController exec(*engine);
  auto r = exec.run(shell_request("echo ran\n"), 0, nullptr);
  expect(r.error_kind == sandcell::ErrorCode::environment_start_error, "EnvironmentStartError");
  expect(r.exit_code == -1, "nothing measured");
  expect(r.output.find("ran\n") == std::string::npos, "program never ran");
  expect(r.output.find("readonly_filesystem") != std::string::npos, "missing policy named: " + r.output);
  expect(entries_in(engine->config().workspace_root) == 0, "workspace removed");
  expect(engine->admission().in_use() == 0, "slot released");
}

void test_batch_capacity_exceeded() {
  auto config = host_config("batch");
  config.max_concurrent_environments = 1;
  config.admission_wait_ms = 0;
  auto engine = host_engine(config);
  sandcell::Error err;
  auto held = engine->admission().acquire(nullptr, &err);
  expect(held.valid(), "hold the only slot");

  sandcell::BatchExecutionController exec(*engine);
  auto r = exec.run(shell_request("echo hi\n"), 0, nullptr);
  expect(r.error_kind == sandcell::ErrorCode::capacity_exceeded, "CapacityExceeded");
  held.release();
  auto ok = exec.run(shell_request("echo hi\n"), 0, nullptr);
  expect(ok.status == sandcell::ExecutionStatus::success, "admitted once free");
}

void test_batch_invalid_execution_id() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  auto req = shell_request("echo hi\n");
  req.id = "../../etc";
  auto r = exec.run(req, 0, nullptr);
  expect(r.error_kind == sandcell::ErrorCode::invalid_request, "InvalidRequest for unsafe id");
}

void test_batch_concurrent_runs() {
  auto config = host_config("batch");
  config.max_concurrent_environments = 4;
  config.admission_wait_ms = 10000;
  auto engine = host_engine(config);
  sandcell::BatchExecutionController exec(*engine);
  std::atomic<int> ok{0};
  run_concurrently(8, [&](int i) {
    auto r = exec.run(shell_request("echo run" + std::to_string(i) + "\n"), 0, nullptr);
    if (r.status == sandcell::ExecutionStatus::success && r.output == "run" + std::to_string(i) + "\n") {
      ok.fetch_add(1);
    }
  });
  expect(ok.load() == 8, "all concurrent runs isolated and successful");
  expect(entries_in(config.workspace_root) == 0, "all workspaces removed");
}

void test_python_hello() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  sandcell::ExecutionRequest req;
  req.language = "python";
  req.source_code = "print(\"Hello, World!\")\n";
  auto r = exec.run(req, 0, nullptr);
  expect(r.status == sandcell::ExecutionStatus::success, "python success: " + r.output);
  expect(r.output == "Hello, World!\n", "python output");
}

void test_python_input() {
  auto engine = host_engine(host_config("batch"));
  sandcell::BatchExecutionController exec(*engine);
  sandcell::ExecutionRequest req;
  req.language = "python";
  req.source_code = "name = input()\nprint(f\"Hello, {name}!\")\n";
  req.stdin_text = "Ada";
  auto r = exec.run(req, 0, nullptr);
  expect(r.output.find("Hello, Ada!\n") != std::string::npos, "python stdin: " + r.output);
}

// ============================================================================
// Degraded mode and executor selection
// ============================================================================

void test_degraded_executor() {
  sandcell::EngineConfig config;
  sandcell::LanguageRegistry registry;
  sandcell::DegradedExecutor exec(registry, config, "docker daemon unreachable");

  sandcell::ExecutionRequest req;
  req.language = "python";
  req.source_code = "print(1)";
  auto r = exec.run(req, 0, nullptr);
  expect(r.simulated, "marked simulated");
  expect(r.status == sandcell::ExecutionStatus::error, "never success");
  expect(r.error_kind == sandcell::ErrorCode::simulated_execution, "SimulatedExecution");
  expect(r.exit_code == -1, "no exit code");
  expect(r.output.find("Nothing was run") != std::string::npos, "says nothing ran");
  expect(r.output.find("python:3.9-alpine") != std::string::npos, "names the image");

  req.language = "unknownlang";
  auto u = exec.run(req, 0, nullptr);
  expect(u.error_kind == sandcell::ErrorCode::unsupported_language, "still validates language");
  expect(!u.simulated, "validation failure is not a simulation");
}

void test_make_executor_selection() {
  auto config = host_config("select");
  {
    auto engine = host_engine(config);
    sandcell::Error err;
    auto exec = sandcell::make_executor(*engine, &err);
    expect(exec && exec->mode() == "host", "real executor when reachable");
  }
  {
    auto backend = std::make_unique<CountingBackend>();
    backend->reachable = false;
    sandcell::Engine engine(config, std::move(backend));
    sandcell::Error err;
    auto exec = sandcell::make_executor(engine, &err);
    expect(exec && exec->mode() == "degraded", "degraded when unreachable and allowed");
  }
  {
    config.allow_degraded_mode = false;
    auto backend = std::make_unique<CountingBackend>();
    backend->reachable = false;
    sandcell::Engine engine(config, std::move(backend));
    sandcell::Error err;
    expect(!sandcell::make_executor(engine, &err), "no executor when degraded mode is off");
    expect(err.code == sandcell::ErrorCode::infrastructure_error, "InfrastructureError");
  }
}

void test_make_backend_rejects_unknown() {
  sandcell::EngineConfig config;
  config.backend = "qemu";
  sandcell::Error err;
  expect(!sandcell::make_backend(config, &err), "unknown backend");
  expect(err.code == sandcell::ErrorCode::config_invalid, "ConfigInvalid");
}

// ============================================================================
// Identifiers and digests
// ============================================================================

void test_ids_and_digests() {
  const auto a = sandcell::new_opaque_id("exec");
  const auto b = sandcell::new_opaque_id("exec");
  expect(a != b, "ids are unique");
  expect(a.size() == 5 + 32 && a.rfind("exec-", 0) == 0, "prefix + 32 hex");
  expect(sandcell::is_safe_workspace_id(a), "ids are safe path components");

  expect(sandcell::output_digest("x") == sandcell::output_digest("x"), "digest deterministic");
  expect(sandcell::output_digest("x") != sandcell::blake3_hex("x"), "output digest is domain separated");
  expect(sandcell::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
}

}  // namespace

int main() {
  std::cout << "=== sandcell core test suite ===\n";

  std::cout << "\n[Language registry]\n";
  run_test("lookup", test_registry_lookup);
  run_test("image override", test_registry_image_override);
  run_test("java file naming", test_java_file_naming);
  run_test("command templates", test_expand_command);

  std::cout << "\n[Workspaces]\n";
  run_test("lifecycle", test_workspace_lifecycle);
  run_test("unsafe ids rejected", test_workspace_rejects_unsafe_ids);
  run_test("scoped release", test_scoped_workspace_releases);

  std::cout << "\n[Configuration]\n";
  run_test("validation", test_config_validation);
  run_test("load and clamp", test_config_load_and_clamp);

  std::cout << "\n[Wire]\n";
  run_test("batch request", test_wire_batch_request);
  run_test("batch result", test_wire_batch_result);
  run_test("terminal frames", test_wire_terminal_frames);
  run_test("utf-8 complete prefix", test_utf8_complete_prefix);

  std::cout << "\n[Image cache]\n";
  run_test("single flight (8 callers)", test_image_cache_single_flight);
  run_test("failure shared, not cached", test_image_cache_failure_shared_not_cached);
  run_test("waiter deadline", test_image_cache_waiter_deadline);

  std::cout << "\n[Provisioner]\n";
  run_test("batch spec", test_build_spec_batch);
  run_test("stdin file mode", test_build_spec_stdin_file_mode);
  run_test("interactive spec", test_build_spec_interactive);

  std::cout << "\n[Docker arguments]\n";
  run_test("batch, interpreted", test_docker_args_batch_interpreted);
  run_test("batch, compiled", test_docker_args_batch_compiled);
  run_test("interactive", test_docker_args_interactive);

  std::cout << "\n[Admission]\n";
  run_test("capacity", test_admission_gate);
  run_test("wait then admit", test_admission_wait_then_admit);

  std::cout << "\n[Batch execution: host backend]\n";
  run_test("hello", test_batch_hello);
  run_test("stdin", test_batch_stdin);
  run_test("stdin file mode", test_batch_stdin_file_mode);
  run_test("non-zero exit and stderr", test_batch_nonzero_exit_and_stderr);
  run_test("timeout", test_batch_timeout);
  run_test("cancel", test_batch_cancel);
  run_test("unsupported language", test_batch_unsupported_language);
  run_test("determinism", test_batch_determinism);
  run_test("output cap", test_batch_output_cap);
  run_test("output cap on a character boundary", test_batch_output_cap_utf8_boundary);
  run_test("capacity exceeded", test_batch_capacity_exceeded);
  run_test("unenforced isolation reported", test_batch_reports_unenforced_isolation);
  run_test("strict isolation refuses", test_batch_strict_isolation_refuses);
  run_test("invalid execution id", test_batch_invalid_execution_id);
  run_test("concurrent runs (8)", test_batch_concurrent_runs);
  if (have_python3()) {
    run_test("python hello", test_python_hello);
    run_test("python input", test_python_input);
  } else {
    skip_test("python hello", "python3 not installed");
    skip_test("python input", "python3 not installed");
  }

  std::cout << "\n[Degraded mode]\n";
  run_test("simulated response", test_degraded_executor);
  run_test("executor selection", test_make_executor_selection);
  run_test("unknown backend", test_make_backend_rejects_unknown);

  std::cout << "\n[Identifiers]\n";
  run_test("ids and digests", test_ids_and_digests);

  std::error_code ec;
  fs::remove_all(test_root("batch"), ec);
  fs::remove_all(test_root("batch-unsup"), ec);
  fs::remove_all(test_root("select"), ec);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " passed";
  if (g_tests_skipped > 0) std::cout << ", " << g_tests_skipped << " skipped";
  std::cout << " ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}

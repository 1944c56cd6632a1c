#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "sandcell/backend.hpp"
#include "sandcell/config.hpp"
#include "sandcell/engine.hpp"
#include "sandcell/executor.hpp"
#include "sandcell/hash.hpp"
#include "sandcell/jsonlite.hpp"
#include "sandcell/log.hpp"
#include "sandcell/observability.hpp"
#include "sandcell/terminal.hpp"
#include "sandcell/version.hpp"
#include "sandcell/wire.hpp"

namespace {

// Exit status for failures of the platform or of the invocation itself.
constexpr int kExitPlatform = 2;

std::optional<std::string> read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

std::string read_stdin() {
  std::ostringstream oss;
  oss << std::cin.rdbuf();
  return oss.str();
}

void usage() {
  std::cerr
      << "usage: sandcell [--config FILE] [--backend docker|host] COMMAND\n"
         "  run --language L (--code TEXT | --source FILE) [--stdin FILE]\n"
         "      [--timeout-ms N] [--json]\n"
         "  exec                       request JSON on stdin, result JSON on stdout\n"
         "  terminal                   NDJSON client frames on stdin\n"
         "  languages\n"
         "  doctor\n"
         "  config validate --file FILE\n"
         "  version\n";
}

struct GlobalOptions {
  std::string config_file;
  std::string backend;
  std::string cmd;
  std::vector<std::string> args;  // After cmd
};

std::optional<GlobalOptions> parse_global(int argc, char **argv) {
  GlobalOptions o;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      o.config_file = argv[++i];
    } else if (a == "--backend" && i + 1 < argc) {
      o.backend = argv[++i];
    } else if (o.cmd.empty() && a.rfind("--", 0) != 0) {
      o.cmd = a;
    } else if (!o.cmd.empty()) {
      o.args.push_back(a);
    } else {
      std::cerr << "unknown option " << a << "\n";
      return std::nullopt;
    }
  }
  if (o.cmd.empty())
    return std::nullopt;
  return o;
}

std::string arg_value(const std::vector<std::string> &args,
                      const std::string &name, const std::string &def = "") {
  for (size_t i = 0; i + 1 < args.size(); ++i)
    if (args[i] == name)
      return args[i + 1];
  return def;
}

bool has_flag(const std::vector<std::string> &args, const std::string &name) {
  for (const auto &a : args)
    if (a == name)
      return true;
  return false;
}

void print_validation(const sandcell::ConfigValidationResult &v) {
  sandcell::jsonlite::Array errors(v.errors.begin(), v.errors.end());
  sandcell::jsonlite::Array warnings(v.warnings.begin(), v.warnings.end());
  sandcell::jsonlite::Object o;
  o["ok"] = v.ok;
  o["config_version"] = v.config_version;
  o["errors"] = std::move(errors);
  o["warnings"] = std::move(warnings);
  std::cout << sandcell::jsonlite::to_json(sandcell::jsonlite::Value(std::move(o)))
            << "\n";
}

std::optional<sandcell::EngineConfig> load_config(const GlobalOptions &opts) {
  sandcell::EngineConfig config = sandcell::EngineConfig::from_env();
  if (!opts.config_file.empty()) {
    auto text = read_file(opts.config_file);
    if (!text) {
      std::cerr << "cannot read config " << opts.config_file << "\n";
      return std::nullopt;
    }
    sandcell::ConfigValidationResult validation;
    auto loaded = sandcell::load_config_json(*text, config, &validation);
    if (!loaded) {
      print_validation(validation);
      return std::nullopt;
    }
    for (const auto &w : validation.warnings)
      sandcell::log_warn("config", w);
    config = std::move(*loaded);
  }
  if (!opts.backend.empty())
    config.backend = opts.backend;
  return config;
}

std::unique_ptr<sandcell::Engine> build_engine(const GlobalOptions &opts) {
  auto config = load_config(opts);
  if (!config)
    return nullptr;
  sandcell::Error err;
  auto backend = sandcell::make_backend(*config, &err);
  if (!backend) {
    std::cerr << sandcell::to_string(err.code) << ": " << err.detail << "\n";
    return nullptr;
  }
  return std::make_unique<sandcell::Engine>(std::move(*config),
                                            std::move(backend));
}

int result_exit_status(const sandcell::ExecutionResult &r) {
  if (r.status == sandcell::ExecutionStatus::success)
    return 0;
  if (r.error_kind == sandcell::ErrorCode::none && r.exit_code > 0)
    return r.exit_code > 255 ? 255 : r.exit_code;
  return kExitPlatform;
}

// Writes system frames to stdout, one line each.
class StdoutSink final : public sandcell::ITerminalSink {
public:
  void on_event(const sandcell::OutboundEvent &event) override {
    write_line(sandcell::outbound_to_json(event));
  }

  void write_line(const std::string &line) {
    std::lock_guard<std::mutex> lk(mu_);
    std::cout << line << "\n" << std::flush;
  }

private:
  std::mutex mu_;
};

int cmd_run(const GlobalOptions &opts) {
  sandcell::BatchRequestDoc doc;
  doc.request.language = arg_value(opts.args, "--language");
  if (doc.request.language.empty()) {
    usage();
    return kExitPlatform;
  }
  const std::string source_file = arg_value(opts.args, "--source");
  if (!source_file.empty()) {
    auto text = read_file(source_file);
    if (!text) {
      std::cerr << "cannot read " << source_file << "\n";
      return kExitPlatform;
    }
    doc.request.source_code = std::move(*text);
  } else {
    doc.request.source_code = arg_value(opts.args, "--code");
  }
  const std::string stdin_file = arg_value(opts.args, "--stdin");
  if (!stdin_file.empty()) {
    auto text = read_file(stdin_file);
    if (!text) {
      std::cerr << "cannot read " << stdin_file << "\n";
      return kExitPlatform;
    }
    doc.request.stdin_text = std::move(*text);
  }
  doc.timeout_ms = std::strtoull(
      arg_value(opts.args, "--timeout-ms", "0").c_str(), nullptr, 10);

  auto engine = build_engine(opts);
  if (!engine)
    return kExitPlatform;
  sandcell::Error err;
  auto executor = sandcell::make_executor(*engine, &err);
  if (!executor) {
    std::cerr << sandcell::to_string(err.code) << ": " << err.detail << "\n";
    return kExitPlatform;
  }

  const auto result = executor->run(doc.request, doc.timeout_ms, nullptr);
  if (has_flag(opts.args, "--json")) {
    std::cout << sandcell::batch_result_to_json(result) << "\n";
  } else {
    std::cout << result.output << std::flush;
    if (result.error_kind != sandcell::ErrorCode::none)
      std::cerr << sandcell::to_string(result.error_kind) << ": "
                << result.error_detail << "\n";
  }
  return result_exit_status(result);
}

int cmd_exec(const GlobalOptions &opts) {
  sandcell::Error err;
  auto doc = sandcell::parse_batch_request(read_stdin(), &err);
  if (!doc) {
    auto r = sandcell::platform_failure("", err.code, err.detail);
    r.output_digest = sandcell::output_digest(r.output);
    std::cout << sandcell::batch_result_to_json(r) << "\n";
    return kExitPlatform;
  }

  auto engine = build_engine(opts);
  if (!engine)
    return kExitPlatform;
  auto executor = sandcell::make_executor(*engine, &err);
  if (!executor) {
    auto r = sandcell::platform_failure(doc->request.id, err.code, err.detail);
    r.output_digest = sandcell::output_digest(r.output);
    std::cout << sandcell::batch_result_to_json(r) << "\n";
    return kExitPlatform;
  }
  const auto result = executor->run(doc->request, doc->timeout_ms, nullptr);
  std::cout << sandcell::batch_result_to_json(result) << "\n";
  return result.error_kind == sandcell::ErrorCode::none ||
                 result.error_kind == sandcell::ErrorCode::execution_timeout
             ? 0
             : kExitPlatform;
}

int cmd_terminal(const GlobalOptions &opts) {
  auto engine = build_engine(opts);
  if (!engine)
    return kExitPlatform;

  const std::string connection = "stdin";
  auto sink = std::make_shared<StdoutSink>();
  sandcell::TerminalSessionManager sessions(*engine);

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty())
      continue;
    sandcell::Error err;
    auto frame = sandcell::parse_client_frame(line, &err);
    if (!frame) {
      sink->write_line(sandcell::protocol_error_to_json("", err));
      continue;
    }
    if (frame->type == sandcell::ClientFrameType::create) {
      // Failures have already been reported through the sink.
      sessions.create(frame->language, connection, sink, &err);
      continue;
    }
    if (!sessions.submit(frame->session_id, frame->to_event(), &err))
      sink->write_line(
          sandcell::protocol_error_to_json(frame->session_id, err));
  }

  sessions.connection_dropped(connection);
  sessions.shutdown();
  return 0;
}

int cmd_languages(const GlobalOptions &opts) {
  auto config = load_config(opts);
  if (!config)
    return kExitPlatform;
  sandcell::LanguageRegistry registry(config->image_overrides);
  sandcell::jsonlite::Array langs;
  for (const auto &p : registry.list()) {
    sandcell::jsonlite::Object o;
    o["id"] = sandcell::to_string(p.id);
    o["image"] = p.image;
    o["sourceFile"] = p.file_name_rule == sandcell::FileNameRule::java_public_class
                          ? "<PublicClass>.java"
                          : p.source_file_name;
    o["compiled"] = p.compiled;
    langs.emplace_back(std::move(o));
  }
  std::cout << sandcell::jsonlite::to_json(sandcell::jsonlite::Value(std::move(langs)))
            << "\n";
  return 0;
}

int cmd_doctor(const GlobalOptions &opts) {
  auto engine = build_engine(opts);
  if (!engine)
    return kExitPlatform;

  sandcell::Error err;
  bool reachable = false;
  try {
    reachable = engine->backend().ping(&err);
  } catch (const std::exception &e) {
    sandcell::set_error(&err, sandcell::ErrorCode::infrastructure_error,
                        e.what());
  }
  const auto caps = engine->backend().capabilities();
  const auto hash = sandcell::hash_runtime_info();

  std::vector<std::string> blockers;
  if (!reachable)
    blockers.push_back(engine->config().allow_degraded_mode
                           ? "backend_unreachable_degraded"
                           : "backend_unreachable");
  if (sandcell::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262")
    blockers.push_back("hash_vectors_failed");

  sandcell::jsonlite::Object o;
  o["ok"] = blockers.empty();
  o["blockers"] = sandcell::jsonlite::Array(blockers.begin(), blockers.end());
  o["backend"] = engine->backend().backend_id();
  o["reachable"] = reachable;
  if (!reachable)
    o["backend_error"] = err.detail;
  o["enforced"] =
      sandcell::jsonlite::Array(caps.enforced.begin(), caps.enforced.end());
  o["unsupported"] = sandcell::jsonlite::Array(caps.unsupported.begin(),
                                               caps.unsupported.end());
  o["workspace_root"] = engine->config().resolved_workspace_root();
  o["max_concurrent_environments"] =
      static_cast<std::uint64_t>(engine->config().max_concurrent_environments);
  o["hash_primitive"] = hash.primitive;
  o["hash_version"] = hash.version;

  // Nested documents are already JSON; splice them in textually.
  std::string out = sandcell::jsonlite::to_json(sandcell::jsonlite::Value(std::move(o)));
  out.pop_back();
  out += ",\"version\":" +
         sandcell::version::manifest_to_json(
             sandcell::version::current_manifest()) +
         ",\"stats\":" + sandcell::global_engine_stats().to_json() + "}";
  std::cout << out << "\n";
  return blockers.empty() ? 0 : kExitPlatform;
}

int cmd_config(const GlobalOptions &opts) {
  if (opts.args.empty() || opts.args[0] != "validate") {
    usage();
    return kExitPlatform;
  }
  const std::string file = arg_value(opts.args, "--file", opts.config_file);
  if (file.empty()) {
    usage();
    return kExitPlatform;
  }
  auto text = read_file(file);
  if (!text) {
    std::cerr << "cannot read " << file << "\n";
    return kExitPlatform;
  }
  const auto v = sandcell::validate_config(*text);
  print_validation(v);
  return v.ok ? 0 : kExitPlatform;
}

} // namespace

int main(int argc, char **argv) {
  auto opts = parse_global(argc, argv);
  if (!opts) {
    usage();
    return kExitPlatform;
  }

  try {
    if (opts->cmd == "run")
      return cmd_run(*opts);
    if (opts->cmd == "exec")
      return cmd_exec(*opts);
    if (opts->cmd == "terminal")
      return cmd_terminal(*opts);
    if (opts->cmd == "languages")
      return cmd_languages(*opts);
    if (opts->cmd == "doctor")
      return cmd_doctor(*opts);
    if (opts->cmd == "config")
      return cmd_config(*opts);
    if (opts->cmd == "version") {
      std::cout << sandcell::version::manifest_to_json(
                       sandcell::version::current_manifest())
                << "\n";
      return 0;
    }
  } catch (const std::exception &e) {
    sandcell::log_error("cli", e.what());
    return kExitPlatform;
  }

  usage();
  return kExitPlatform;
}

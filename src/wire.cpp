#include "sandcell/wire.hpp"

#include <limits>
#include <variant>

#include "sandcell/jsonlite.hpp"

namespace sandcell {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

std::optional<Object> parse_object(const std::string& text, Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  Object obj = jsonlite::parse(text, &jerr);
  if (jerr) {
    set_error(error, ErrorCode::invalid_request, jerr->code + ": " + jerr->message);
    return std::nullopt;
  }
  return obj;
}

// Absent -> true with *out untouched. Wrong type -> InvalidRequest.
bool read_string(const Object& obj, const std::string& key, bool required, std::string* out, Error* error) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    if (required) set_error(error, ErrorCode::invalid_request, "missing \"" + key + "\"");
    return !required;
  }
  const auto* s = std::get_if<std::string>(&it->second.v);
  if (!s) {
    set_error(error, ErrorCode::invalid_request, "\"" + key + "\" must be a string");
    return false;
  }
  *out = *s;
  return true;
}

bool read_uint(const Object& obj, const std::string& key, bool required, std::uint64_t max, std::uint64_t* out,
               Error* error) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    if (required) set_error(error, ErrorCode::invalid_request, "missing \"" + key + "\"");
    return !required;
  }
  const auto* n = std::get_if<std::uint64_t>(&it->second.v);
  if (!n || *n > max) {
    set_error(error, ErrorCode::invalid_request,
              "\"" + key + "\" must be an integer in [0, " + std::to_string(max) + "]");
    return false;
  }
  *out = *n;
  return true;
}

}  // namespace

std::optional<BatchRequestDoc> parse_batch_request(const std::string& json, Error* error) {
  auto obj = parse_object(json, error);
  if (!obj) return std::nullopt;

  BatchRequestDoc doc;
  if (!read_string(*obj, "executionId", false, &doc.request.id, error)) return std::nullopt;
  if (!read_string(*obj, "language", true, &doc.request.language, error)) return std::nullopt;
  if (!read_string(*obj, "code", true, &doc.request.source_code, error)) return std::nullopt;
  if (!read_string(*obj, "stdin", false, &doc.request.stdin_text, error)) return std::nullopt;
  if (!read_uint(*obj, "timeoutMs", false, std::numeric_limits<std::uint32_t>::max(), &doc.timeout_ms, error)) {
    return std::nullopt;
  }
  return doc;
}

std::string batch_request_to_json(const BatchRequestDoc& doc) {
  Object o;
  if (!doc.request.id.empty()) o["executionId"] = doc.request.id;
  o["language"] = doc.request.language;
  o["code"] = doc.request.source_code;
  if (!doc.request.stdin_text.empty()) o["stdin"] = doc.request.stdin_text;
  if (doc.timeout_ms != 0) o["timeoutMs"] = doc.timeout_ms;
  return jsonlite::to_json(Value(std::move(o)));
}

std::string batch_result_to_json(const ExecutionResult& result) {
  Object o;
  o["executionId"] = result.execution_id;
  o["status"] = to_string(result.status);
  o["output"] = result.output;
  if (result.exit_code < 0) {
    o["exitCode"] = static_cast<double>(result.exit_code);
  } else {
    o["exitCode"] = static_cast<std::uint64_t>(result.exit_code);
  }
  if (result.error_kind != ErrorCode::none) o["errorKind"] = to_string(result.error_kind);
  o["simulated"] = result.simulated;
  o["outputTruncated"] = result.output_truncated;
  o["outputDigest"] = result.output_digest;
  o["durationMs"] = static_cast<std::uint64_t>(result.duration_ms);
  o["unenforced"] = Array(result.unenforced.begin(), result.unenforced.end());
  return jsonlite::to_json(Value(std::move(o)));
}

TerminalEvent ClientFrame::to_event() const {
  switch (type) {
    case ClientFrameType::resize:
      return TerminalEvent::resize(cols, rows);
    case ClientFrameType::close:
      return TerminalEvent::close();
    case ClientFrameType::create:
    case ClientFrameType::input:
      break;
  }
  return TerminalEvent::input(data);
}

std::optional<ClientFrame> parse_client_frame(const std::string& line, Error* error) {
  auto obj = parse_object(line, error);
  if (!obj) return std::nullopt;

  std::string type;
  if (!read_string(*obj, "type", true, &type, error)) return std::nullopt;

  ClientFrame frame;
  if (type == "create") {
    frame.type = ClientFrameType::create;
    if (!read_string(*obj, "language", false, &frame.language, error)) return std::nullopt;
    return frame;
  }

  if (type == "input") {
    frame.type = ClientFrameType::input;
  } else if (type == "resize") {
    frame.type = ClientFrameType::resize;
  } else if (type == "close") {
    frame.type = ClientFrameType::close;
  } else {
    set_error(error, ErrorCode::invalid_request, "unknown frame type \"" + type + "\"");
    return std::nullopt;
  }
  if (!read_string(*obj, "sessionId", true, &frame.session_id, error)) return std::nullopt;

  if (frame.type == ClientFrameType::input) {
    if (!read_string(*obj, "data", true, &frame.data, error)) return std::nullopt;
  } else if (frame.type == ClientFrameType::resize) {
    std::uint64_t cols = 0;
    std::uint64_t rows = 0;
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint16_t>::max();
    if (!read_uint(*obj, "cols", true, kMax, &cols, error)) return std::nullopt;
    if (!read_uint(*obj, "rows", true, kMax, &rows, error)) return std::nullopt;
    frame.cols = static_cast<std::uint16_t>(cols);
    frame.rows = static_cast<std::uint16_t>(rows);
  }
  return frame;
}

std::string outbound_to_json(const OutboundEvent& event) {
  Object o;
  o["type"] = to_string(event.type);
  o["sessionId"] = event.session_id;
  switch (event.type) {
    case OutboundType::output:
      o["data"] = event.data;
      break;
    case OutboundType::error:
      o["message"] = event.data;
      break;
    case OutboundType::closed:
      if (!event.data.empty()) o["reason"] = event.data;
      break;
    case OutboundType::created:
      break;
  }
  return jsonlite::to_json(Value(std::move(o)));
}

std::string protocol_error_to_json(const std::string& session_id, const Error& error) {
  Object o;
  o["type"] = "error";
  if (!session_id.empty()) o["sessionId"] = session_id;
  o["message"] = error.detail;
  if (error.code != ErrorCode::none) o["errorKind"] = to_string(error.code);
  return jsonlite::to_json(Value(std::move(o)));
}

}  // namespace sandcell

#pragma once

// sandcell/wire.hpp - JSON documents exchanged with callers.
//
// BATCH:
//   request  {"executionId"?, "language", "code", "stdin"?, "timeoutMs"?}
//   result   {"executionId", "status", "output", "exitCode", "errorKind"?,
//             "simulated", "outputTruncated", "outputDigest", "durationMs",
//             "unenforced"}
//
// TERMINAL (one JSON object per line):
//   client -> system
//     {"type":"create","language"?}
//     {"type":"input","sessionId","data"}
//     {"type":"resize","sessionId","cols","rows"}
//     {"type":"close","sessionId"}
//   system -> client
//     {"type":"created","sessionId"}
//     {"type":"output","sessionId","data"}
//     {"type":"error","sessionId"?,"message","errorKind"?}
//     {"type":"closed","sessionId","reason"?}
//
// Decoding is strict about types: a present field of the wrong type is an
// InvalidRequest, never silently defaulted.

#include <cstdint>
#include <optional>
#include <string>

#include "sandcell/terminal.hpp"
#include "sandcell/types.hpp"

namespace sandcell {

struct BatchRequestDoc {
  ExecutionRequest request;
  std::uint64_t timeout_ms{0};  // 0 = default
};

std::optional<BatchRequestDoc> parse_batch_request(const std::string& json, Error* error);
std::string batch_request_to_json(const BatchRequestDoc& doc);
std::string batch_result_to_json(const ExecutionResult& result);

enum class ClientFrameType { create, input, resize, close };

struct ClientFrame {
  ClientFrameType type{ClientFrameType::input};
  std::string session_id;
  std::string language;  // create only
  std::string data;      // input only
  std::uint16_t cols{0};
  std::uint16_t rows{0};

  // Manager event for input/resize/close frames.
  TerminalEvent to_event() const;
};

std::optional<ClientFrame> parse_client_frame(const std::string& line, Error* error);

// One line, no trailing newline.
std::string outbound_to_json(const OutboundEvent& event);

// Error frame for failures that belong to no session (malformed lines,
// unknown session ids).
std::string protocol_error_to_json(const std::string& session_id, const Error& error);

}  // namespace sandcell

#pragma once

#include "agentlink/config.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/types.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <string_view>

namespace agentlink {

enum class envelope_type {
  request,
  response,
  error,
  heartbeat,
  register_agent,
  unregister_agent,
  stream_chunk,
  stream_end,
};

inline std::string_view envelope_type_name(envelope_type type) {
  switch (type) {
  case envelope_type::request:
    return "request";
  case envelope_type::response:
    return "response";
  case envelope_type::error:
    return "error";
  case envelope_type::heartbeat:
    return "heartbeat";
  case envelope_type::register_agent:
    return "register";
  case envelope_type::unregister_agent:
    return "unregister";
  case envelope_type::stream_chunk:
    return "stream_chunk";
  case envelope_type::stream_end:
    return "stream_end";
  }
  return "unknown";
}

inline bool parse_envelope_type(std::string_view name, envelope_type &out) {
  static constexpr envelope_type all[] = {
      envelope_type::request,          envelope_type::response,
      envelope_type::error,            envelope_type::heartbeat,
      envelope_type::register_agent,   envelope_type::unregister_agent,
      envelope_type::stream_chunk,     envelope_type::stream_end,
  };
  for (auto type : all) {
    if (envelope_type_name(type) == name) {
      out = type;
      return true;
    }
  }
  return false;
}

/// Protocol-level wrapper: one envelope per frame.
struct envelope {
  std::string version = std::string(kProtocolVersion);
  envelope_type type = envelope_type::request;
  std::string id;
  timestamp time = now();
  json payload = json::object();
};

/// Random RFC 4122 version 4 UUID, used as request id.
inline std::string make_request_id() {
  thread_local std::mt19937_64 rng = []() {
    std::random_device rd;
    std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seed);
  }();
  std::uniform_int_distribution<uint64_t> dist;
  uint64_t hi = dist(rng);
  uint64_t lo = dist(rng);
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return buf;
}

// --- message and tool_result ---

inline json encode_message(const message &msg) {
  return {{"role", msg.role()},
          {"content", msg.content()},
          {"metadata", msg.metadata()},
          {"timestamp", format_timestamp(msg.time())}};
}

/// Throws malformed_payload_error when fields are missing or ill-typed.
inline message decode_message(const json &data) {
  if (!data.is_object()) {
    throw malformed_payload_error("Failed to decode message: not an object",
                                  {{"data", data}});
  }
  auto role = data.find("role");
  auto content = data.find("content");
  if (role == data.end() || !role->is_string()) {
    throw malformed_payload_error(
        "Failed to decode message: missing or invalid 'role'",
        {{"data", data}});
  }
  if (content == data.end()) {
    throw malformed_payload_error(
        "Failed to decode message: missing 'content'", {{"data", data}});
  }

  json metadata = json::object();
  auto meta = data.find("metadata");
  if (meta != data.end() && !meta->is_null()) {
    if (!meta->is_object()) {
      throw malformed_payload_error(
          "Failed to decode message: 'metadata' must be an object",
          {{"data", data}});
    }
    metadata = *meta;
  }

  std::optional<timestamp> ts;
  auto time_it = data.find("timestamp");
  if (time_it != data.end() && !time_it->is_null()) {
    if (!time_it->is_string()) {
      throw malformed_payload_error(
          "Failed to decode message: 'timestamp' must be a string",
          {{"data", data}});
    }
    try {
      ts = parse_timestamp(time_it->get<std::string>());
    } catch (const std::invalid_argument &e) {
      throw malformed_payload_error(
          std::string("Failed to decode message: ") + e.what(),
          {{"data", data}});
    }
  }

  try {
    return message(role->get<std::string>(), *content, std::move(metadata), ts);
  } catch (const std::invalid_argument &e) {
    throw malformed_payload_error(
        std::string("Failed to decode message: ") + e.what(), {{"data", data}});
  }
}

inline json encode_tool_result(const tool_result &result) {
  return {{"success", result.success()},
          {"data", result.data()},
          {"error", result.error() ? json(*result.error()) : json(nullptr)},
          {"metadata", result.metadata()}};
}

inline tool_result decode_tool_result(const json &data) {
  if (!data.is_object()) {
    throw malformed_payload_error("Failed to decode tool result: not an object",
                                  {{"data", data}});
  }
  auto success = data.find("success");
  if (success == data.end() || !success->is_boolean()) {
    throw malformed_payload_error(
        "Failed to decode tool result: missing or invalid 'success'",
        {{"data", data}});
  }

  std::optional<std::string> error;
  auto err = data.find("error");
  if (err != data.end() && !err->is_null()) {
    if (!err->is_string()) {
      throw malformed_payload_error(
          "Failed to decode tool result: 'error' must be a string",
          {{"data", data}});
    }
    error = err->get<std::string>();
  }

  json metadata = data.value("metadata", json::object());
  if (metadata.is_null())
    metadata = json::object();
  if (!metadata.is_object()) {
    throw malformed_payload_error(
        "Failed to decode tool result: 'metadata' must be an object",
        {{"data", data}});
  }

  try {
    return tool_result(success->get<bool>(), data.value("data", json()),
                       std::move(error), std::move(metadata));
  } catch (const std::invalid_argument &e) {
    throw malformed_payload_error(
        std::string("Failed to decode tool result: ") + e.what(),
        {{"data", data}});
  }
}

// --- envelopes ---

inline json encode_envelope(const envelope &env) {
  return {{"version", env.version},
          {"type", std::string(envelope_type_name(env.type))},
          {"id", env.id},
          {"timestamp", format_timestamp(env.time)},
          {"payload", env.payload}};
}

/// Validate and convert a parsed envelope. Missing fields and unknown types
/// are INVALID_MESSAGE, a foreign version is UNSUPPORTED_VERSION.
inline envelope decode_envelope(const json &data) {
  if (!data.is_object()) {
    throw invalid_message_error("Envelope must be a JSON object");
  }

  auto version = data.find("version");
  if (version == data.end()) {
    throw invalid_message_error("Missing 'version' field in envelope");
  }
  if (!version->is_string() || version->get<std::string>() != kProtocolVersion) {
    throw unsupported_version_error(
        "Unsupported protocol version: " +
            (version->is_string() ? version->get<std::string>()
                                  : version->dump()),
        {{"version", *version}});
  }

  auto type = data.find("type");
  if (type == data.end()) {
    throw invalid_message_error("Missing 'type' field in envelope");
  }
  envelope env;
  if (!type->is_string() ||
      !parse_envelope_type(type->get<std::string>(), env.type)) {
    throw invalid_message_error("Invalid message type: " + type->dump(),
                                {{"type", *type}});
  }

  auto id = data.find("id");
  if (id == data.end()) {
    throw invalid_message_error("Missing 'id' field in envelope");
  }
  if (!id->is_string()) {
    throw invalid_message_error("Envelope 'id' must be a string",
                                {{"id", *id}});
  }
  env.id = id->get<std::string>();

  auto payload = data.find("payload");
  if (payload == data.end()) {
    throw invalid_message_error("Missing 'payload' field in envelope");
  }
  if (!payload->is_object()) {
    throw invalid_message_error("Envelope 'payload' must be an object");
  }
  env.payload = *payload;
  env.version = version->get<std::string>();

  auto time_it = data.find("timestamp");
  if (time_it != data.end()) {
    if (!time_it->is_string()) {
      throw invalid_message_error("Envelope 'timestamp' must be a string",
                                  {{"timestamp", *time_it}});
    }
    try {
      env.time = parse_timestamp(time_it->get<std::string>());
    } catch (const std::invalid_argument &e) {
      throw invalid_message_error(e.what(), {{"timestamp", *time_it}});
    }
  }
  return env;
}

/// UTF-8 JSON body of one frame.
inline std::string encode_bytes(const envelope &env) {
  try {
    return encode_envelope(env).dump();
  } catch (const json::type_error &e) {
    throw malformed_payload_error(std::string("Failed to encode envelope: ") +
                                  e.what());
  }
}

inline std::string encode_bytes(const message &msg) {
  try {
    return encode_message(msg).dump();
  } catch (const json::type_error &e) {
    throw malformed_payload_error(std::string("Failed to encode message: ") +
                                  e.what());
  }
}

inline json parse_body(std::string_view data) {
  try {
    return json::parse(data.begin(), data.end());
  } catch (const json::parse_error &e) {
    throw malformed_payload_error(std::string("Failed to decode JSON: ") +
                                  e.what());
  }
}

inline envelope decode_bytes(std::string_view data) {
  return decode_envelope(parse_body(data));
}

inline message decode_message_bytes(std::string_view data) {
  return decode_message(parse_body(data));
}

inline envelope make_request_envelope(const std::string &method,
                                      const std::string &agent_name,
                                      const message &msg) {
  envelope env;
  env.type = envelope_type::request;
  env.id = make_request_id();
  env.payload = {{"method", method}, {"message", encode_message(msg)}};
  if (!agent_name.empty()) {
    env.payload["agent_name"] = agent_name;
  }
  return env;
}

inline envelope make_response_envelope(const std::string &request_id,
                                       json payload) {
  envelope env;
  env.type = envelope_type::response;
  env.id = request_id;
  env.payload = std::move(payload);
  return env;
}

inline envelope make_error_envelope(const std::string &request_id,
                                    std::string_view code,
                                    const std::string &error_message,
                                    json details = json::object()) {
  envelope env;
  env.type = envelope_type::error;
  env.id = request_id;
  env.payload = {{"error_code", std::string(code)},
                 {"error_message", error_message},
                 {"error_details",
                  details.is_null() ? json::object() : std::move(details)}};
  return env;
}

inline envelope make_error_envelope(const std::string &request_id,
                                    const protocol_error &err) {
  return make_error_envelope(request_id, err.code_name(), err.message(),
                             err.details());
}

inline envelope make_heartbeat_envelope(const std::string &id,
                                        const std::string &agent_name) {
  envelope env;
  env.type = envelope_type::heartbeat;
  env.id = id;
  env.payload = {{"agent_name", agent_name}};
  return env;
}

inline envelope make_stream_chunk_envelope(const std::string &request_id,
                                           const message &chunk) {
  envelope env;
  env.type = envelope_type::stream_chunk;
  env.id = request_id;
  env.payload = {{"message", encode_message(chunk)}};
  return env;
}

inline envelope make_stream_end_envelope(const std::string &request_id) {
  envelope env;
  env.type = envelope_type::stream_end;
  env.id = request_id;
  return env;
}

// --- framing ---

constexpr std::size_t kFrameHeaderSize = 4;

inline std::array<uint8_t, kFrameHeaderSize> encode_frame_header(uint32_t len) {
  return {static_cast<uint8_t>((len >> 24) & 0xFF),
          static_cast<uint8_t>((len >> 16) & 0xFF),
          static_cast<uint8_t>((len >> 8) & 0xFF),
          static_cast<uint8_t>(len & 0xFF)};
}

/// Read a big-endian length and reject it before any body is allocated.
inline uint32_t decode_frame_length(const uint8_t *header,
                                    std::size_t max_frame_size = kMaxFrameSize) {
  uint32_t len = (static_cast<uint32_t>(header[0]) << 24) |
                 (static_cast<uint32_t>(header[1]) << 16) |
                 (static_cast<uint32_t>(header[2]) << 8) |
                 static_cast<uint32_t>(header[3]);
  if (len > max_frame_size) {
    throw malformed_payload_error(
        "Message size " + std::to_string(len) + " exceeds maximum " +
            std::to_string(max_frame_size),
        {{"length", len}});
  }
  return len;
}

/// Length prefix plus body, ready for a single send().
inline std::string frame(std::string_view body,
                         std::size_t max_frame_size = kMaxFrameSize) {
  if (body.size() > max_frame_size) {
    throw malformed_payload_error(
        "Message size " + std::to_string(body.size()) + " exceeds maximum " +
            std::to_string(max_frame_size),
        {{"length", body.size()}});
  }
  auto header = encode_frame_header(static_cast<uint32_t>(body.size()));
  std::string out;
  out.reserve(kFrameHeaderSize + body.size());
  out.append(reinterpret_cast<const char *>(header.data()), header.size());
  out.append(body.data(), body.size());
  return out;
}

} // namespace agentlink

#include "../include/agentlink/codec.hpp"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

using agentlink::json;

json valid_envelope_json() {
  return {{"version", "1.0"},
          {"type", "request"},
          {"id", "req-1"},
          {"timestamp", "2025-01-02T03:04:05.123456+00:00"},
          {"payload", {{"method", "process"}}}};
}

template <typename Error> bool decode_throws(const json &data) {
  try {
    (void)agentlink::decode_envelope(data);
  } catch (const Error &) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  int passed = 0;

  // --- timestamps ---
  {
    auto ts = agentlink::parse_timestamp("2025-01-02T03:04:05.123456+00:00");
    assert(agentlink::format_timestamp(ts) ==
           "2025-01-02T03:04:05.123456+00:00");
    ++passed;

    auto zulu = agentlink::parse_timestamp("2025-01-02T03:04:05Z");
    assert(agentlink::format_timestamp(zulu) ==
           "2025-01-02T03:04:05.000000+00:00");
    ++passed;

    auto shifted = agentlink::parse_timestamp("2025-01-02T05:04:05+02:00");
    assert(shifted == zulu);
    ++passed;

    auto bare = agentlink::parse_timestamp("2025-01-02 03:04:05.5");
    assert(bare - zulu == std::chrono::milliseconds(500));
    ++passed;

    auto nanos = agentlink::parse_timestamp("2025-01-02T03:04:05.123456789Z");
    assert(nanos == ts);
    ++passed;

    for (const char *bad : {"", "2025-01-02", "2025/01/02T03:04:05",
                            "2025-13-02T03:04:05", "2025-01-02T03:04:05.",
                            "2025-01-02T03:04:05+0200", "yesterday"}) {
      try {
        (void)agentlink::parse_timestamp(bad);
        assert(false && "should have thrown");
      } catch (const std::invalid_argument &) {
        ++passed;
      }
    }
  }

  // --- message round trip ---
  {
    auto at = agentlink::parse_timestamp("2024-06-01T12:00:00.000042Z");
    agentlink::message msg("user", json{{"text", "hi"}, {"n", 3}},
                           json{{"trace", "abc"}}, at);
    auto decoded = agentlink::decode_message_bytes(agentlink::encode_bytes(msg));
    assert(decoded == msg);
    ++passed;
    assert(decoded.metadata()["trace"] == "abc");
    ++passed;
    assert(decoded.time() == at);
    ++passed;

    agentlink::message text("agent", "plain");
    assert(agentlink::decode_message(agentlink::encode_message(text)) == text);
    ++passed;

    agentlink::message null_content("user", nullptr);
    assert(agentlink::decode_message(agentlink::encode_message(null_content))
               .content()
               .is_null());
    ++passed;
  }

  // --- message validation ---
  {
    try {
      agentlink::message bad("", "x");
      assert(false && "should have thrown");
    } catch (const std::invalid_argument &) {
      ++passed;
    }
    try {
      agentlink::message bad("user", "x", json::array());
      assert(false && "should have thrown");
    } catch (const std::invalid_argument &) {
      ++passed;
    }

    for (const json &bad :
         {json("text"), json{{"content", "x"}},
          json{{"role", 1}, {"content", "x"}}, json{{"role", "user"}},
          json{{"role", "user"}, {"content", "x"}, {"metadata", "m"}},
          json{{"role", "user"}, {"content", "x"}, {"timestamp", "soon"}}}) {
      try {
        (void)agentlink::decode_message(bad);
        assert(false && "should have thrown");
      } catch (const agentlink::malformed_payload_error &e) {
        assert(e.code() == agentlink::error_code::malformed_payload);
        ++passed;
      }
    }

    auto missing_time = agentlink::decode_message(
        json{{"role", "user"}, {"content", "x"}, {"metadata", nullptr}});
    assert(missing_time.metadata().is_object());
    ++passed;
  }

  // --- invalid utf-8 cannot be encoded ---
  {
    agentlink::message msg("user", std::string("\xff\xfe", 2));
    try {
      (void)agentlink::encode_bytes(msg);
      assert(false && "should have thrown");
    } catch (const agentlink::malformed_payload_error &) {
      ++passed;
    }
  }

  // --- tool_result ---
  {
    auto ok = agentlink::tool_result::ok(json{{"sum", 5}});
    assert(agentlink::decode_tool_result(agentlink::encode_tool_result(ok)) ==
           ok);
    ++passed;

    auto failed = agentlink::tool_result::failure("division by zero");
    auto decoded =
        agentlink::decode_tool_result(agentlink::encode_tool_result(failed));
    assert(!decoded.success());
    ++passed;
    assert(decoded.error() && *decoded.error() == "division by zero");
    ++passed;

    try {
      agentlink::tool_result bad(false, nullptr, std::nullopt);
      assert(false && "should have thrown");
    } catch (const std::invalid_argument &) {
      ++passed;
    }
    try {
      (void)agentlink::decode_tool_result(json{{"success", false}});
      assert(false && "should have thrown");
    } catch (const agentlink::malformed_payload_error &) {
      ++passed;
    }

    // a failed result carries no data
    try {
      agentlink::tool_result bad(false, json{{"partial", 1}}, "overflow");
      assert(false && "should have thrown");
    } catch (const std::invalid_argument &) {
      ++passed;
    }
    try {
      (void)agentlink::decode_tool_result(
          json{{"success", false}, {"data", 3}, {"error", "overflow"}});
      assert(false && "should have thrown");
    } catch (const agentlink::malformed_payload_error &) {
      ++passed;
    }
  }

  // --- envelope round trip ---
  {
    agentlink::message msg("user", "hello");
    auto env = agentlink::make_request_envelope("process", "echo", msg);
    auto decoded = agentlink::decode_bytes(agentlink::encode_bytes(env));
    assert(decoded.version == "1.0");
    ++passed;
    assert(decoded.type == agentlink::envelope_type::request);
    ++passed;
    assert(decoded.id == env.id);
    ++passed;
    assert(decoded.time == env.time);
    ++passed;
    assert(decoded.payload["method"] == "process");
    ++passed;
    assert(decoded.payload["agent_name"] == "echo");
    ++passed;
    assert(agentlink::decode_message(decoded.payload["message"]) == msg);
    ++passed;

    auto err = agentlink::make_error_envelope(
        env.id, agentlink::agent_not_found_error("ghost"));
    auto wire = agentlink::encode_envelope(err);
    assert(wire["type"] == "error");
    ++passed;
    assert(wire["payload"]["error_code"] == "AGENT_NOT_FOUND");
    ++passed;
    assert(wire["payload"]["error_message"] == "Agent 'ghost' not found");
    ++passed;
    assert(wire["payload"]["error_details"].is_object());
    ++passed;

    auto register_env = agentlink::envelope{};
    register_env.type = agentlink::envelope_type::register_agent;
    register_env.id = "r";
    assert(agentlink::encode_envelope(register_env)["type"] == "register");
    ++passed;

    auto end = agentlink::make_stream_end_envelope("s");
    assert(agentlink::decode_bytes(agentlink::encode_bytes(end)).type ==
           agentlink::envelope_type::stream_end);
    ++passed;
  }

  // --- envelope validation ---
  {
    auto without = [](const char *field) {
      auto data = valid_envelope_json();
      data.erase(field);
      return data;
    };
    assert(decode_throws<agentlink::invalid_message_error>(without("version")));
    ++passed;
    assert(decode_throws<agentlink::invalid_message_error>(without("type")));
    ++passed;
    assert(decode_throws<agentlink::invalid_message_error>(without("id")));
    ++passed;
    assert(decode_throws<agentlink::invalid_message_error>(without("payload")));
    ++passed;

    auto no_time = agentlink::decode_envelope(without("timestamp"));
    assert(no_time.id == "req-1");
    ++passed;

    auto data = valid_envelope_json();
    data["version"] = "2.0";
    try {
      (void)agentlink::decode_envelope(data);
      assert(false && "should have thrown");
    } catch (const agentlink::unsupported_version_error &e) {
      assert(e.code_name() == "UNSUPPORTED_VERSION");
      ++passed;
      assert(e.details()["version"] == "2.0");
      ++passed;
    }

    data = valid_envelope_json();
    data["type"] = "shout";
    assert(decode_throws<agentlink::invalid_message_error>(data));
    ++passed;

    data = valid_envelope_json();
    data["id"] = 7;
    assert(decode_throws<agentlink::invalid_message_error>(data));
    ++passed;

    data = valid_envelope_json();
    data["payload"] = "text";
    assert(decode_throws<agentlink::invalid_message_error>(data));
    ++passed;

    data = valid_envelope_json();
    data["timestamp"] = "not a time";
    assert(decode_throws<agentlink::invalid_message_error>(data));
    ++passed;

    data = valid_envelope_json();
    data["timestamp"] = 1735787045;
    try {
      (void)agentlink::decode_envelope(data);
      assert(false && "should have thrown");
    } catch (const agentlink::invalid_message_error &e) {
      assert(e.code_name() == "INVALID_MESSAGE");
      ++passed;
      assert(e.details()["timestamp"] == 1735787045);
      ++passed;
    }

    assert(decode_throws<agentlink::invalid_message_error>(json::array()));
    ++passed;
  }

  // --- undecodable bytes ---
  for (const char *bad : {"{not json", "", "[1, 2"}) {
    try {
      (void)agentlink::decode_bytes(bad);
      assert(false && "should have thrown");
    } catch (const agentlink::malformed_payload_error &) {
      ++passed;
    }
  }

  // --- framing ---
  {
    auto framed = agentlink::frame("abc");
    assert(framed.size() == agentlink::kFrameHeaderSize + 3);
    ++passed;
    assert(framed[0] == 0 && framed[1] == 0 && framed[2] == 0 &&
           framed[3] == 3);
    ++passed;
    assert(framed.substr(4) == "abc");
    ++passed;

    auto header = agentlink::encode_frame_header(0x01020304);
    assert(header[0] == 1 && header[1] == 2 && header[2] == 3 &&
           header[3] == 4);
    ++passed;
    assert(agentlink::decode_frame_length(header.data(), 0x01020304) ==
           0x01020304u);
    ++passed;

    auto at_limit = agentlink::encode_frame_header(
        static_cast<uint32_t>(agentlink::kMaxFrameSize));
    assert(agentlink::decode_frame_length(at_limit.data()) ==
           agentlink::kMaxFrameSize);
    ++passed;

    auto over = agentlink::encode_frame_header(
        static_cast<uint32_t>(agentlink::kMaxFrameSize + 1));
    try {
      (void)agentlink::decode_frame_length(over.data());
      assert(false && "should have thrown");
    } catch (const agentlink::malformed_payload_error &e) {
      assert(std::string(e.what()).find("exceeds maximum") != std::string::npos);
      ++passed;
    }

    try {
      (void)agentlink::frame(std::string(65, 'x'), 64);
      assert(false && "should have thrown");
    } catch (const agentlink::malformed_payload_error &) {
      ++passed;
    }
  }

  // --- request ids ---
  {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
      auto id = agentlink::make_request_id();
      assert(id.size() == 36);
      assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
      assert(id[14] == '4');
      ids.insert(id);
    }
    assert(ids.size() == 1000);
    ++passed;

    // every thread draws from its own generator
    std::vector<std::vector<std::string>> per_thread(8);
    std::vector<std::thread> workers;
    for (auto &out : per_thread) {
      workers.emplace_back([&out]() {
        for (int i = 0; i < 500; ++i)
          out.push_back(agentlink::make_request_id());
      });
    }
    for (auto &t : workers)
      t.join();
    for (const auto &out : per_thread)
      ids.insert(out.begin(), out.end());
    assert(ids.size() == 1000 + 8 * 500);
    ++passed;
  }

  // --- error codes ---
  {
    agentlink::error_code code{};
    assert(agentlink::parse_error_code("AGENT_TIMEOUT", code));
    ++passed;
    assert(code == agentlink::error_code::agent_timeout);
    ++passed;
    assert(!agentlink::parse_error_code("NOT_A_CODE", code));
    ++passed;

    try {
      agentlink::throw_remote_error("calc", "TOOL_NOT_FOUND",
                                    "Tool 'sqrt' not found", json::object());
    } catch (const agentlink::tool_not_found_error &e) {
      assert(e.message() == "Tool 'sqrt' not found");
      ++passed;
    }
    try {
      agentlink::throw_remote_error("calc", "AGENT_ERROR", "boom",
                                    json::object());
    } catch (const agentlink::remote_execution_error &e) {
      assert(e.agent_name() == "calc");
      ++passed;
      assert(e.original_error() == "boom");
      ++passed;
    }
    try {
      agentlink::throw_remote_error("calc", "FUTURE_CODE", "later",
                                    json::object());
    } catch (const agentlink::remote_execution_error &e) {
      assert(e.details()["error_code"] == "FUTURE_CODE");
      ++passed;
    }
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}

#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace agentlink {

enum class error_code {
  connection_failed,
  connection_timeout,
  connection_closed,
  invalid_message,
  unsupported_version,
  malformed_payload,
  agent_not_found,
  agent_unavailable,
  agent_timeout,
  agent_error,
  tool_not_found,
  tool_execution_failed,
  registration_failed,
  duplicate_agent,
};

/// Wire name of an error code, e.g. "CONNECTION_FAILED".
inline std::string_view error_code_name(error_code code) {
  switch (code) {
  case error_code::connection_failed:
    return "CONNECTION_FAILED";
  case error_code::connection_timeout:
    return "CONNECTION_TIMEOUT";
  case error_code::connection_closed:
    return "CONNECTION_CLOSED";
  case error_code::invalid_message:
    return "INVALID_MESSAGE";
  case error_code::unsupported_version:
    return "UNSUPPORTED_VERSION";
  case error_code::malformed_payload:
    return "MALFORMED_PAYLOAD";
  case error_code::agent_not_found:
    return "AGENT_NOT_FOUND";
  case error_code::agent_unavailable:
    return "AGENT_UNAVAILABLE";
  case error_code::agent_timeout:
    return "AGENT_TIMEOUT";
  case error_code::agent_error:
    return "AGENT_ERROR";
  case error_code::tool_not_found:
    return "TOOL_NOT_FOUND";
  case error_code::tool_execution_failed:
    return "TOOL_EXECUTION_FAILED";
  case error_code::registration_failed:
    return "REGISTRATION_FAILED";
  case error_code::duplicate_agent:
    return "DUPLICATE_AGENT";
  }
  return "UNKNOWN";
}

/// Inverse of error_code_name. Returns false for codes this side does not know.
inline bool parse_error_code(std::string_view name, error_code &out) {
  static constexpr error_code all[] = {
      error_code::connection_failed,   error_code::connection_timeout,
      error_code::connection_closed,   error_code::invalid_message,
      error_code::unsupported_version, error_code::malformed_payload,
      error_code::agent_not_found,     error_code::agent_unavailable,
      error_code::agent_timeout,       error_code::agent_error,
      error_code::tool_not_found,      error_code::tool_execution_failed,
      error_code::registration_failed, error_code::duplicate_agent,
  };
  for (auto code : all) {
    if (error_code_name(code) == name) {
      out = code;
      return true;
    }
  }
  return false;
}

class protocol_error : public std::runtime_error {
public:
  protocol_error(error_code code, const std::string &message,
                 nlohmann::json details = nlohmann::json::object())
      : std::runtime_error(std::string(error_code_name(code)) + ": " +
                           message),
        code_(code), message_(message),
        details_(details.is_null() ? nlohmann::json::object()
                                   : std::move(details)) {}

  error_code code() const { return code_; }
  std::string_view code_name() const { return error_code_name(code_); }
  const std::string &message() const { return message_; }
  const nlohmann::json &details() const { return details_; }

private:
  error_code code_;
  std::string message_;
  nlohmann::json details_;
};

// --- connection errors ---

class connection_error : public protocol_error {
public:
  explicit connection_error(const std::string &message,
                            nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::connection_failed, message,
                       std::move(details)) {}

protected:
  connection_error(error_code code, const std::string &message,
                   nlohmann::json details)
      : protocol_error(code, message, std::move(details)) {}
};

class connection_timeout_error : public connection_error {
public:
  explicit connection_timeout_error(
      const std::string &message,
      nlohmann::json details = nlohmann::json::object())
      : connection_error(error_code::connection_timeout, message,
                         std::move(details)) {}
};

class connection_closed_error : public connection_error {
public:
  explicit connection_closed_error(
      const std::string &message,
      nlohmann::json details = nlohmann::json::object())
      : connection_error(error_code::connection_closed, message,
                         std::move(details)) {}
};

// --- protocol errors ---

class invalid_message_error : public protocol_error {
public:
  explicit invalid_message_error(
      const std::string &message,
      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::invalid_message, message,
                       std::move(details)) {}
};

class unsupported_version_error : public protocol_error {
public:
  explicit unsupported_version_error(
      const std::string &message,
      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::unsupported_version, message,
                       std::move(details)) {}
};

class malformed_payload_error : public protocol_error {
public:
  explicit malformed_payload_error(
      const std::string &message,
      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::malformed_payload, message,
                       std::move(details)) {}
};

// --- agent, tool and registry errors ---
// The first constructor argument is the subject (agent or tool name); the
// message is derived from it. The wire_message_t overload keeps a message
// received from a peer verbatim.

struct wire_message_t {};
constexpr wire_message_t wire_message{};

class agent_not_found_error : public protocol_error {
public:
  explicit agent_not_found_error(
      const std::string &agent_name,
      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::agent_not_found,
                       "Agent '" + agent_name + "' not found",
                       std::move(details)) {}
  agent_not_found_error(const std::string &message, nlohmann::json details,
                        wire_message_t)
      : protocol_error(error_code::agent_not_found, message,
                       std::move(details)) {}
};

class agent_unavailable_error : public protocol_error {
public:
  explicit agent_unavailable_error(
      const std::string &agent_name,
      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::agent_unavailable,
                       "Agent '" + agent_name + "' is unavailable",
                       std::move(details)) {}
  agent_unavailable_error(const std::string &message, nlohmann::json details,
                          wire_message_t)
      : protocol_error(error_code::agent_unavailable, message,
                       std::move(details)) {}
};

class agent_timeout_error : public protocol_error {
public:
  agent_timeout_error(const std::string &agent_name, long long timeout_ms,
                      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::agent_timeout,
                       "Agent '" + agent_name + "' timed out after " +
                           std::to_string(timeout_ms) + "ms",
                       std::move(details)) {}
  agent_timeout_error(const std::string &message, nlohmann::json details,
                      wire_message_t)
      : protocol_error(error_code::agent_timeout, message,
                       std::move(details)) {}
};

class tool_not_found_error : public protocol_error {
public:
  explicit tool_not_found_error(
      const std::string &tool_name,
      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::tool_not_found,
                       "Tool '" + tool_name + "' not found",
                       std::move(details)) {}
  tool_not_found_error(const std::string &message, nlohmann::json details,
                       wire_message_t)
      : protocol_error(error_code::tool_not_found, message,
                       std::move(details)) {}
};

class tool_execution_failed_error : public protocol_error {
public:
  tool_execution_failed_error(
      const std::string &tool_name, const std::string &reason,
      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::tool_execution_failed,
                       "Tool '" + tool_name + "' execution failed: " + reason,
                       std::move(details)) {}
  tool_execution_failed_error(const std::string &message,
                              nlohmann::json details, wire_message_t)
      : protocol_error(error_code::tool_execution_failed, message,
                       std::move(details)) {}
};

class registration_failed_error : public protocol_error {
public:
  explicit registration_failed_error(
      const std::string &message,
      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::registration_failed, message,
                       std::move(details)) {}
};

class duplicate_agent_error : public protocol_error {
public:
  explicit duplicate_agent_error(
      const std::string &agent_name,
      nlohmann::json details = nlohmann::json::object())
      : protocol_error(error_code::duplicate_agent,
                       "Agent '" + agent_name + "' is already registered",
                       std::move(details)) {}
  duplicate_agent_error(const std::string &message, nlohmann::json details,
                        wire_message_t)
      : protocol_error(error_code::duplicate_agent, message,
                       std::move(details)) {}
};

/// The remote agent's process() threw. Carries the remote error text as-is.
class remote_execution_error : public std::runtime_error {
public:
  remote_execution_error(const std::string &agent_name,
                         const std::string &original_error,
                         nlohmann::json details = nlohmann::json::object())
      : std::runtime_error("Remote execution failed on agent '" + agent_name +
                           "': " + original_error),
        agent_name_(agent_name), original_error_(original_error),
        details_(details.is_null() ? nlohmann::json::object()
                                   : std::move(details)) {}

  const std::string &agent_name() const { return agent_name_; }
  const std::string &original_error() const { return original_error_; }
  const nlohmann::json &details() const { return details_; }

private:
  std::string agent_name_;
  std::string original_error_;
  nlohmann::json details_;
};

/// Throw the typed error matching a wire error code received from a peer.
/// Codes without a dedicated protocol class (AGENT_ERROR, unknown codes)
/// surface as remote_execution_error for the named agent.
[[noreturn]] inline void throw_remote_error(const std::string &agent_name,
                                            std::string_view code_name,
                                            const std::string &message,
                                            const nlohmann::json &details) {
  error_code code{};
  if (!parse_error_code(code_name, code)) {
    nlohmann::json tagged = details.is_object() ? details
                                                : nlohmann::json::object();
    tagged["error_code"] = std::string(code_name);
    throw remote_execution_error(agent_name, message, tagged);
  }

  switch (code) {
  case error_code::connection_failed:
    throw connection_error(message, details);
  case error_code::connection_timeout:
    throw connection_timeout_error(message, details);
  case error_code::connection_closed:
    throw connection_closed_error(message, details);
  case error_code::invalid_message:
    throw invalid_message_error(message, details);
  case error_code::unsupported_version:
    throw unsupported_version_error(message, details);
  case error_code::malformed_payload:
    throw malformed_payload_error(message, details);
  case error_code::agent_not_found:
    throw agent_not_found_error(message, details, wire_message);
  case error_code::agent_unavailable:
    throw agent_unavailable_error(message, details, wire_message);
  case error_code::agent_timeout:
    throw agent_timeout_error(message, details, wire_message);
  case error_code::tool_not_found:
    throw tool_not_found_error(message, details, wire_message);
  case error_code::tool_execution_failed:
    throw tool_execution_failed_error(message, details, wire_message);
  case error_code::registration_failed:
    throw registration_failed_error(message, details);
  case error_code::duplicate_agent:
    throw duplicate_agent_error(message, details, wire_message);
  case error_code::agent_error:
    break;
  }
  throw remote_execution_error(agent_name, message, details);
}

} // namespace agentlink

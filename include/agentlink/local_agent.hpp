#pragma once

#include "agentlink/codec.hpp"
#include "agentlink/config.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/logging.hpp"
#include "agentlink/periodic_task.hpp"
#include "agentlink/registry.hpp"
#include "agentlink/transport.hpp"
#include "agentlink/types.hpp"

#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace agentlink {

struct local_agent_options {
  /// When set, the agent registers on start() and heartbeats until stop().
  std::shared_ptr<agent_registry> registry;
  std::chrono::milliseconds heartbeat_interval = kDefaultHeartbeatInterval;
  /// A connection with no request for this long is closed.
  std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout;
  std::size_t max_frame_size = kMaxFrameSize;
  json capabilities = json::object();
  json metadata = json::object();
};

/// Exports one agent over a listener. Every accepted connection is served on
/// its own thread; requests on one connection are answered in order.
class local_agent {
public:
  local_agent(std::shared_ptr<agent> impl, std::string endpoint,
              local_agent_options options = {})
      : agent_(std::move(impl)), endpoint_(std::move(endpoint)),
        options_(std::move(options)) {
    if (!agent_)
      throw std::invalid_argument("local_agent requires an agent");
    name_ = agent_->name();
    (void)parse_uri(endpoint_);
  }

  ~local_agent() { stop(); }

  local_agent(const local_agent &) = delete;
  local_agent &operator=(const local_agent &) = delete;

  void start() {
    if (running_.load())
      throw std::runtime_error("local agent '" + name_ + "' is already running");

    listener_ = agentlink::listen(endpoint_);
    bound_endpoint_ = listener_endpoint(*listener_);
    running_.store(true);
    accept_thread_ = std::thread([this]() { accept_loop(); });
    log().info("agent '{}' listening on {}", name_, bound_endpoint_);

    if (options_.registry) {
      agent_registration reg;
      reg.name = name_;
      reg.endpoint = bound_endpoint_;
      reg.capabilities = options_.capabilities;
      reg.metadata = options_.metadata;
      try {
        options_.registry->register_agent(std::move(reg));
      } catch (const std::exception &e) {
        log().error("agent '{}' failed to register: {}", name_, e.what());
        stop();
        throw;
      }
      registered_ = true;
      heartbeat_task_.start(
          options_.heartbeat_interval, [this]() { return send_heartbeat(); },
          true);
    }
  }

  void stop() {
    if (!running_.exchange(false))
      return;

    heartbeat_task_.stop();
    if (accept_thread_.joinable())
      accept_thread_.join();
    if (listener_)
      close_listener(*listener_);

    std::list<std::unique_ptr<session>> sessions;
    {
      std::lock_guard<std::mutex> lock(sessions_mu_);
      sessions.swap(sessions_);
    }
    for (auto &s : sessions)
      s->conn->shutdown();
    for (auto &s : sessions) {
      if (s->thread.joinable())
        s->thread.join();
    }

    // another instance may hold the name by now
    if (registered_.exchange(false))
      options_.registry->unregister_agent(name_, bound_endpoint_);
    log().info("agent '{}' stopped", name_);
  }

  bool running() const { return running_.load(); }

  const std::string &name() const { return name_; }

  /// Bound endpoint once started (with the real port for tcp://host:0),
  /// the configured one before.
  std::string endpoint() const {
    return bound_endpoint_.empty() ? endpoint_ : bound_endpoint_;
  }

  /// The listener, for dialing mem:// agents in-process.
  const listener &bound_listener() const {
    if (!listener_)
      throw std::runtime_error("local agent '" + name_ + "' is not started");
    return *listener_;
  }

  /// Connections currently being served.
  std::size_t connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mu_);
    std::size_t live = 0;
    for (const auto &s : sessions_) {
      if (!s->done.load())
        ++live;
    }
    return live;
  }

private:
  struct session {
    std::unique_ptr<transport> conn;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  bool send_heartbeat() {
    try {
      options_.registry->heartbeat(name_);
      return true;
    } catch (const agent_not_found_error &) {
      log().warn("agent '{}' is no longer registered, stopping heartbeats",
                 name_);
      registered_ = false;
      return false;
    } catch (const std::exception &e) {
      log().error("heartbeat failed for '{}': {}", name_, e.what());
      return true;
    }
  }

  void accept_loop() {
    while (running_.load()) {
      std::unique_ptr<transport> conn;
      try {
        conn = agentlink::accept(*listener_, kAcceptPollInterval);
      } catch (const std::exception &e) {
        if (!running_.load())
          break;
        log().error("accept failed on {}: {}", bound_endpoint_, e.what());
        std::this_thread::sleep_for(kAcceptPollInterval);
        continue;
      }

      reap_sessions();
      if (!conn)
        continue;

      log().debug("client connected to '{}' from {}", name_, conn->endpoint());
      auto s = std::make_unique<session>();
      s->conn = std::move(conn);
      session *raw = s.get();

      std::lock_guard<std::mutex> lock(sessions_mu_);
      sessions_.push_back(std::move(s));
      raw->thread = std::thread([this, raw]() {
        serve(*raw->conn);
        raw->done.store(true);
      });
    }
  }

  /// Join and drop sessions whose handler has returned.
  void reap_sessions() {
    std::lock_guard<std::mutex> lock(sessions_mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if ((*it)->done.load()) {
        if ((*it)->thread.joinable())
          (*it)->thread.join();
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  void serve(transport &conn) {
    const std::string peer = conn.endpoint();
    while (running_.load()) {
      std::string body;
      try {
        body = conn.receive_framed(deadline_after(options_.idle_timeout),
                                   options_.max_frame_size);
      } catch (const connection_timeout_error &) {
        log().debug("closing idle connection from {}", peer);
        break;
      } catch (const connection_error &e) {
        log().debug("client {} disconnected: {}", peer, e.what());
        break;
      } catch (const protocol_error &e) {
        log().warn("rejecting frame from {}: {}", peer, e.what());
        reply_before_close(conn, make_error_envelope("unknown", e));
        break;
      }

      envelope request;
      try {
        request = decode_bytes(body);
      } catch (const protocol_error &e) {
        log().warn("undecodable envelope from {}: {}", peer, e.what());
        reply_before_close(conn, make_error_envelope("unknown", e));
        break;
      }

      try {
        dispatch(request, conn);
      } catch (const connection_error &e) {
        log().debug("failed to reply to {}: {}", peer, e.what());
        break;
      } catch (const protocol_error &e) {
        log().error("failed to encode reply to {}: {}", peer, e.what());
        break;
      }
    }
    conn.close();
  }

  /// Last error envelope on a connection that is about to close.
  void reply_before_close(transport &conn, const envelope &err) {
    try {
      conn.send_framed(encode_bytes(err), options_.max_frame_size);
    } catch (const protocol_error &e) {
      log().debug("could not deliver error envelope to {}: {}",
                  conn.endpoint(), e.what());
    }
  }

  void dispatch(const envelope &request, transport &conn) {
    if (request.type == envelope_type::heartbeat) {
      send_reply(conn, request.id,
                 encode_bytes(make_heartbeat_envelope(request.id, name_)));
      return;
    }
    if (request.type != envelope_type::request) {
      std::string type(envelope_type_name(request.type));
      send_error(conn, request.id,
                 invalid_message_error("Expected 'request' but got '" + type +
                                           "'",
                                       {{"type", type}}));
      return;
    }

    std::string method = string_field(request.payload, "method");
    std::string target = string_field(request.payload, "agent_name");
    if (!target.empty() && target != name_) {
      send_error(conn, request.id,
                 agent_not_found_error(target, {{"served_agent", name_}}));
      return;
    }

    if (method == "process") {
      handle_process(request, conn);
    } else if (method == "stream") {
      handle_stream(request, conn);
    } else {
      send_error(conn, request.id,
                 invalid_message_error("Unknown method: " + method,
                                       {{"method", method}}));
    }
  }

  void handle_process(const envelope &request, transport &conn) {
    std::string reply;
    try {
      message input = decode_message(request_message(request));
      message output = agent_->process(input);
      reply = encode_bytes(make_response_envelope(
          request.id, {{"message", encode_message(output)}}));
    } catch (const protocol_error &e) {
      reply = encode_bytes(make_error_envelope(request.id, e));
    } catch (const std::exception &e) {
      log().warn("agent '{}' failed: {}", name_, e.what());
      reply = agent_error_reply(request.id, e.what());
    } catch (...) {
      log().error("agent '{}' threw a non-standard exception", name_);
      reply = agent_error_reply(request.id, "unknown error");
    }
    send_reply(conn, request.id, reply);
  }

  void handle_stream(const envelope &request, transport &conn) {
    bool transport_failed = false;
    try {
      message input = decode_message(request_message(request));
      agent_->stream(input, [&](const message &chunk) {
        auto encoded =
            encode_bytes(make_stream_chunk_envelope(request.id, chunk));
        try {
          send_reply(conn, request.id, encoded);
        } catch (const connection_error &) {
          transport_failed = true;
          throw;
        }
      });
    } catch (const protocol_error &e) {
      if (transport_failed)
        throw;
      send_error(conn, request.id, e);
      return;
    } catch (const std::exception &e) {
      log().warn("agent '{}' failed while streaming: {}", name_, e.what());
      send_reply(conn, request.id, agent_error_reply(request.id, e.what()));
      return;
    } catch (...) {
      log().error("agent '{}' threw a non-standard exception while streaming",
                  name_);
      send_reply(conn, request.id,
                 agent_error_reply(request.id, "unknown error"));
      return;
    }
    send_reply(conn, request.id,
               encode_bytes(make_stream_end_envelope(request.id)));
  }

  std::string agent_error_reply(const std::string &id,
                                const std::string &what) const {
    return encode_bytes(make_error_envelope(
        id, error_code_name(error_code::agent_error), what,
        {{"agent_name", name_}}));
  }

  void send_error(transport &conn, const std::string &id,
                  const protocol_error &err) {
    send_reply(conn, id, encode_bytes(make_error_envelope(id, err)));
  }

  /// Send an encoded envelope; an oversized reply becomes a
  /// MALFORMED_PAYLOAD error for the same id.
  void send_reply(transport &conn, const std::string &id,
                  const std::string &encoded) {
    if (encoded.size() > options_.max_frame_size) {
      auto err = malformed_payload_error(
          "Response size " + std::to_string(encoded.size()) +
              " exceeds maximum " + std::to_string(options_.max_frame_size),
          {{"length", encoded.size()}});
      conn.send_framed(encode_bytes(make_error_envelope(id, err)),
                       options_.max_frame_size);
      return;
    }
    conn.send_framed(encoded, options_.max_frame_size);
  }

  static const json &request_message(const envelope &request) {
    auto it = request.payload.find("message");
    if (it == request.payload.end())
      throw malformed_payload_error("Missing 'message' in request payload");
    return *it;
  }

  static std::string string_field(const json &payload, const char *key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string())
      return {};
    return it->get<std::string>();
  }

  std::shared_ptr<agent> agent_;
  std::string name_;
  std::string endpoint_;
  local_agent_options options_;

  std::optional<listener> listener_;
  std::string bound_endpoint_;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;

  mutable std::mutex sessions_mu_;
  std::list<std::unique_ptr<session>> sessions_;

  periodic_task heartbeat_task_;
  std::atomic<bool> registered_{false};
};

} // namespace agentlink

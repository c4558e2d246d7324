#pragma once

#include "agentlink/codec.hpp"
#include "agentlink/config.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/logging.hpp"
#include "agentlink/transport.hpp"
#include "agentlink/types.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace agentlink {

struct remote_agent_options {
  /// Bound on connect plus the wait for each reply frame.
  std::chrono::milliseconds timeout = kDefaultRequestTimeout;
  std::size_t max_frame_size = kMaxFrameSize;
};

/// Client-side proxy: an agent whose process() runs in a remote local_agent.
///
/// Connects lazily on first use and reuses the connection. Calls on one
/// instance are serialized; a call that fails at the transport or framing
/// level closes the connection so the next call dials again. A stream
/// callback runs without the connection lock held, so it may call close()
/// but not process(), stream() or ping() on the same instance.
class remote_agent : public agent {
public:
  remote_agent(std::string name, const std::string &endpoint,
               remote_agent_options options = {})
      : name_(std::move(name)), endpoint_(endpoint),
        transport_(make_transport(endpoint)), options_(options) {}

  remote_agent(std::string name, std::unique_ptr<transport> conn,
               remote_agent_options options = {})
      : name_(std::move(name)), transport_(std::move(conn)),
        options_(options) {
    if (!transport_)
      throw std::invalid_argument("remote_agent requires a transport");
    endpoint_ = transport_->endpoint();
  }

  ~remote_agent() override { close(); }

  remote_agent(const remote_agent &) = delete;
  remote_agent &operator=(const remote_agent &) = delete;

  std::string name() const override { return name_; }
  const std::string &endpoint() const { return endpoint_; }

  /// Throws connection_error (or connection_timeout_error) when the agent
  /// cannot be reached or does not answer in time, a protocol error for a bad
  /// reply, the typed error carried by an error envelope, and
  /// remote_execution_error when the remote agent itself failed.
  message process(const message &msg) override {
    auto lock = acquire();
    auto request = make_request_envelope("process", name_, msg);
    auto until = deadline_after(options_.timeout);
    send_request(request, until);

    envelope reply = receive_reply(request.id, until);
    if (reply.type == envelope_type::error)
      raise_error(reply);
    if (reply.type != envelope_type::response)
      unexpected_reply(reply, "response");
    return reply_message(reply);
  }

  /// Invoke `emit` for every chunk the remote agent streams back. The timeout
  /// applies to each chunk. Closing this proxy from inside `emit` ends the
  /// stream quietly.
  void stream(const message &msg, const stream_callback &emit) override {
    auto lock = acquire();
    stream_guard guard(*this, lock);
    auto request = make_request_envelope("stream", name_, msg);
    send_request(request, deadline_after(options_.timeout));

    for (;;) {
      envelope reply =
          receive_reply(request.id, deadline_after(options_.timeout));
      switch (reply.type) {
      case envelope_type::error:
        raise_error(reply);
      case envelope_type::stream_chunk: {
        message chunk = reply_message(reply);
        lock.unlock();
        try {
          emit(chunk);
        } catch (...) {
          lock.lock();
          // the rest of the stream is still in flight
          transport_->close();
          throw;
        }
        lock.lock();
        if (!transport_->is_connected())
          return;
        break;
      }
      case envelope_type::stream_end:
        return;
      default:
        unexpected_reply(reply, "stream_chunk' or 'stream_end");
      }
    }
  }

  /// Heartbeat round trip to the serving local_agent.
  std::chrono::microseconds ping() {
    auto lock = acquire();
    auto started = std::chrono::steady_clock::now();
    auto request = make_heartbeat_envelope(make_request_id(), name_);
    auto until = deadline_after(options_.timeout);
    send_request(request, until);

    envelope reply = receive_reply(request.id, until);
    if (reply.type == envelope_type::error)
      raise_error(reply);
    if (reply.type != envelope_type::heartbeat)
      unexpected_reply(reply, "heartbeat");
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);
  }

  bool is_connected() const {
    std::lock_guard<std::mutex> lock(mu_);
    return transport_->is_connected();
  }

  void close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (transport_->is_connected())
      log().debug("closing connection to '{}' at {}", name_, endpoint_);
    transport_->close();
  }

private:
  /// Marks a stream in progress while its callback runs unlocked.
  struct stream_guard {
    stream_guard(remote_agent &owner, std::unique_lock<std::mutex> &lock)
        : owner_(owner), lock_(lock) {
      owner_.streaming_ = true;
      owner_.stream_thread_ = std::this_thread::get_id();
    }
    ~stream_guard() {
      if (!lock_.owns_lock())
        lock_.lock();
      owner_.streaming_ = false;
      owner_.stream_thread_ = std::thread::id();
      owner_.idle_.notify_all();
    }

    remote_agent &owner_;
    std::unique_lock<std::mutex> &lock_;
  };

  /// Connection lock, once no stream callback is running. A call made from
  /// inside this instance's own stream callback would wait forever.
  std::unique_lock<std::mutex> acquire() {
    std::unique_lock<std::mutex> lock(mu_);
    if (streaming_ && stream_thread_ == std::this_thread::get_id()) {
      throw std::logic_error("remote_agent '" + name_ +
                             "' called from its own stream callback");
    }
    idle_.wait(lock, [this]() { return !streaming_; });
    return lock;
  }

  void send_request(const envelope &request, deadline until) {
    std::string body = encode_bytes(request);
    if (!transport_->is_connected()) {
      transport_->connect(until);
      log().debug("connected to '{}' at {}", name_, endpoint_);
    }
    try {
      transport_->send_framed(body, options_.max_frame_size);
    } catch (const connection_error &) {
      transport_->close();
      throw;
    }
  }

  /// Next frame, which must answer `request_id`. Any failure here leaves the
  /// connection out of step, so it is closed.
  envelope receive_reply(const std::string &request_id, deadline until) {
    std::string body;
    try {
      body = transport_->receive_framed(until, options_.max_frame_size);
    } catch (const connection_timeout_error &) {
      transport_->close();
      throw connection_timeout_error(
          "Agent '" + name_ + "' did not respond within " +
              std::to_string(options_.timeout.count()) + "ms",
          {{"agent_name", name_},
           {"endpoint", endpoint_},
           {"timeout_ms", options_.timeout.count()}});
    } catch (const protocol_error &) {
      transport_->close();
      throw;
    }

    envelope reply;
    try {
      reply = decode_bytes(body);
    } catch (const protocol_error &) {
      transport_->close();
      throw;
    }
    if (reply.id != request_id) {
      transport_->close();
      throw invalid_message_error("Response id does not match request id",
                                  {{"request_id", request_id},
                                   {"response_id", reply.id}});
    }
    return reply;
  }

  [[noreturn]] void raise_error(const envelope &reply) {
    const auto &payload = reply.payload;
    auto text = [&payload](const char *key) {
      auto it = payload.find(key);
      return it != payload.end() && it->is_string() ? it->get<std::string>()
                                                    : std::string();
    };
    auto details_it = payload.find("error_details");
    json details = details_it != payload.end() && details_it->is_object()
                       ? *details_it
                       : json::object();
    throw_remote_error(name_, text("error_code"), text("error_message"),
                       details);
  }

  [[noreturn]] void unexpected_reply(const envelope &reply,
                                     const std::string &expected) {
    transport_->close();
    std::string type(envelope_type_name(reply.type));
    throw invalid_message_error(
        "Expected '" + expected + "' but got '" + type + "'", {{"type", type}});
  }

  static message reply_message(const envelope &reply) {
    auto it = reply.payload.find("message");
    if (it == reply.payload.end())
      throw malformed_payload_error("Missing 'message' in response payload");
    return decode_message(*it);
  }

  std::string name_;
  std::string endpoint_;
  std::unique_ptr<transport> transport_;
  remote_agent_options options_;
  mutable std::mutex mu_;
  std::condition_variable idle_;
  bool streaming_ = false;
  std::thread::id stream_thread_;
};

} // namespace agentlink

#pragma once

#include "agentlink/codec.hpp"
#include "agentlink/config.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/uri.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <climits>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace agentlink {

using deadline = std::chrono::steady_clock::time_point;

/// Sentinel for "block until data or close".
constexpr deadline kNoDeadline = deadline::max();

/// Deadline `timeout` from now; a non-positive timeout means no deadline.
inline deadline deadline_after(std::chrono::milliseconds timeout) {
  return timeout.count() <= 0 ? kNoDeadline
                              : std::chrono::steady_clock::now() + timeout;
}

/// Largest chunk returned by a single receive().
constexpr std::size_t kReceiveChunk = 64 * 1024;

inline std::string errno_text(int err) { return std::strerror(err); }

/// Bidirectional byte stream. One instance belongs to one logical connection;
/// only shutdown() may be called from another thread.
class transport {
public:
  virtual ~transport() = default;

  virtual void connect(deadline until = kNoDeadline) = 0;
  virtual void send(std::string_view data) = 0;
  /// Whatever is available, at most kReceiveChunk bytes.
  virtual std::string receive(deadline until = kNoDeadline) = 0;
  virtual std::string receive_exactly(std::size_t n,
                                      deadline until = kNoDeadline) = 0;
  virtual void close() = 0;
  /// Unblock pending I/O from another thread. The transport reads as closed.
  virtual void shutdown() = 0;
  virtual bool is_connected() const = 0;
  virtual std::string endpoint() const = 0;

  void send_framed(std::string_view body,
                   std::size_t max_frame_size = kMaxFrameSize) {
    send(frame(body, max_frame_size));
  }

  /// Read one length-prefixed frame. The length is checked against
  /// max_frame_size before the body is read.
  std::string receive_framed(deadline until = kNoDeadline,
                             std::size_t max_frame_size = kMaxFrameSize) {
    auto header = receive_exactly(kFrameHeaderSize, until);
    auto len = decode_frame_length(
        reinterpret_cast<const uint8_t *>(header.data()), max_frame_size);
    if (len == 0)
      return {};
    return receive_exactly(len, until);
  }
};

namespace detail {

/// Milliseconds left until `until`, rounded up, or -1 for no deadline.
/// Throws connection_timeout_error once the deadline has passed.
inline int poll_timeout_ms(deadline until, const std::string &what) {
  if (until == kNoDeadline)
    return -1;
  auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
                       until - std::chrono::steady_clock::now())
                       .count();
  if (remaining <= 0)
    throw connection_timeout_error("Timed out " + what);
  return static_cast<int>(std::min<long long>(remaining, INT_MAX));
}

inline void wait_fd(int fd, short events, deadline until,
                    const std::string &what) {
  for (;;) {
    int timeout_ms = poll_timeout_ms(until, what);
    pollfd pfd{fd, events, 0};
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc > 0)
      return;
    if (rc < 0 && errno != EINTR)
      throw connection_error("poll() failed: " + errno_text(errno));
  }
}

/// connect() bounded by a deadline, via a non-blocking socket.
inline void connect_fd(int fd, const sockaddr *addr, socklen_t len,
                       deadline until, const std::string &target) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    throw connection_error("fcntl() failed: " + errno_text(errno));

  int rc = ::connect(fd, addr, len);
  if (rc != 0 && errno != EINPROGRESS && errno != EINTR) {
    throw connection_error("Failed to connect to " + target + ": " +
                               errno_text(errno),
                           {{"endpoint", target}});
  }
  if (rc != 0) {
    wait_fd(fd, POLLOUT, until, "connecting to " + target);
    int err = 0;
    socklen_t err_len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &err_len) != 0)
      err = errno;
    if (err != 0) {
      throw connection_error("Failed to connect to " + target + ": " +
                                 errno_text(err),
                             {{"endpoint", target}});
    }
  }

  if (::fcntl(fd, F_SETFL, flags) < 0)
    throw connection_error("fcntl() failed: " + errno_text(errno));
}

struct byte_pipe {
  std::mutex mu;
  std::condition_variable cv;
  std::string buffer;
  bool closed = false;
};

inline void close_pipe(const std::shared_ptr<byte_pipe> &pipe) {
  {
    std::lock_guard<std::mutex> lock(pipe->mu);
    pipe->closed = true;
  }
  pipe->cv.notify_all();
}

} // namespace detail

/// File-descriptor stream shared by the unix and tcp transports. Constructed
/// directly it adopts an accepted connection.
class socket_transport : public transport {
public:
  socket_transport(int fd, std::string endpoint)
      : fd_(fd), endpoint_(std::move(endpoint)), connected_(fd >= 0) {}

  ~socket_transport() override { close(); }

  socket_transport(const socket_transport &) = delete;
  socket_transport &operator=(const socket_transport &) = delete;

  void connect(deadline until = kNoDeadline) override {
    if (is_connected())
      return;
    close();
    int fd = open_socket(until);
    {
      std::lock_guard<std::mutex> lock(mu_);
      fd_ = fd;
    }
    connected_.store(true);
  }

  void send(std::string_view data) override {
    int fd = socket_fd();
    if (fd < 0 || !is_connected())
      throw connection_error("Not connected", {{"endpoint", endpoint_}});

    const char *ptr = data.data();
    size_t sent = 0;
    while (sent < data.size()) {
      ssize_t n = ::send(fd, ptr + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        int err = errno;
        connected_.store(false);
        if (err == EPIPE || err == ECONNRESET)
          throw connection_closed_error("Connection closed by peer",
                                        {{"endpoint", endpoint_}});
        throw connection_error("Failed to send data: " + errno_text(err),
                               {{"endpoint", endpoint_}});
      }
      sent += static_cast<size_t>(n);
    }
  }

  std::string receive(deadline until = kNoDeadline) override {
    int fd = socket_fd();
    if (fd < 0 || !is_connected())
      throw connection_error("Not connected", {{"endpoint", endpoint_}});

    std::string out(kReceiveChunk, '\0');
    for (;;) {
      detail::wait_fd(fd, POLLIN, until, "waiting for data on " + endpoint_);
      ssize_t n = ::recv(fd, out.data(), out.size(), 0);
      if (n > 0) {
        out.resize(static_cast<size_t>(n));
        return out;
      }
      handle_recv_failure(n);
    }
  }

  std::string receive_exactly(std::size_t n,
                              deadline until = kNoDeadline) override {
    int fd = socket_fd();
    if (fd < 0 || !is_connected())
      throw connection_error("Not connected", {{"endpoint", endpoint_}});

    std::string out(n, '\0');
    size_t got = 0;
    while (got < n) {
      detail::wait_fd(fd, POLLIN, until, "waiting for data on " + endpoint_);
      ssize_t r = ::recv(fd, out.data() + got, n - got, 0);
      if (r > 0) {
        got += static_cast<size_t>(r);
        continue;
      }
      if (r == 0 && got > 0) {
        connected_.store(false);
        throw connection_closed_error("Expected " + std::to_string(n) +
                                          " bytes but only got " +
                                          std::to_string(got),
                                      {{"endpoint", endpoint_}});
      }
      handle_recv_failure(r);
    }
    return out;
  }

  void close() override {
    std::lock_guard<std::mutex> lock(mu_);
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    connected_.store(false);
  }

  void shutdown() override {
    std::lock_guard<std::mutex> lock(mu_);
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
    }
    connected_.store(false);
  }

  bool is_connected() const override { return connected_.load(); }
  std::string endpoint() const override { return endpoint_; }

protected:
  explicit socket_transport(std::string endpoint)
      : endpoint_(std::move(endpoint)) {}

  /// Dial the peer and return a connected descriptor.
  virtual int open_socket(deadline until) {
    (void)until;
    throw connection_error("Accepted connection cannot be redialed",
                           {{"endpoint", endpoint_}});
  }

private:
  int socket_fd() const {
    std::lock_guard<std::mutex> lock(mu_);
    return fd_;
  }

  /// recv() returned 0 or -1: EINTR retries, everything else throws.
  void handle_recv_failure(ssize_t n) {
    if (n < 0 && (errno == EINTR || errno == EAGAIN))
      return;
    int err = errno;
    connected_.store(false);
    if (n == 0 || err == ECONNRESET)
      throw connection_closed_error("Connection closed by peer",
                                    {{"endpoint", endpoint_}});
    throw connection_error("Failed to receive data: " + errno_text(err),
                           {{"endpoint", endpoint_}});
  }

  mutable std::mutex mu_;
  int fd_ = -1;
  std::string endpoint_;
  std::atomic<bool> connected_{false};
};

/// Same-host client over a Unix domain socket.
class unix_socket_transport : public socket_transport {
public:
  explicit unix_socket_transport(std::string path)
      : socket_transport("unix://" + path), path_(std::move(path)) {}

  const std::string &path() const { return path_; }

protected:
  int open_socket(deadline until) override {
    sockaddr_un addr{};
    if (path_.size() >= sizeof(addr.sun_path))
      throw std::invalid_argument("unix socket path too long: " + path_);
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path_.c_str());

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
      throw connection_error("socket() failed: " + errno_text(errno));
    try {
      detail::connect_fd(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr),
                         until, path_);
    } catch (...) {
      ::close(fd);
      throw;
    }
    return fd;
  }

private:
  std::string path_;
};

/// Cross-host client over TCP. No encryption.
class tcp_transport : public socket_transport {
public:
  tcp_transport(std::string host, int port)
      : socket_transport("tcp://" + host + ":" + std::to_string(port)),
        host_(std::move(host)), port_(port) {}

  const std::string &host() const { return host_; }
  int port() const { return port_; }

protected:
  int open_socket(deadline until) override {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    std::string target = host_ + ":" + std::to_string(port_);
    int rc = ::getaddrinfo(host_.c_str(), std::to_string(port_).c_str(),
                           &hints, &res);
    if (rc != 0) {
      throw connection_error("Failed to resolve " + target + ": " +
                                 ::gai_strerror(rc),
                             {{"endpoint", endpoint()}});
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res,
                                                              ::freeaddrinfo);

    std::string last_error = "no addresses";
    for (auto *ai = res; ai != nullptr; ai = ai->ai_next) {
      int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                        ai->ai_protocol);
      if (fd < 0) {
        last_error = errno_text(errno);
        continue;
      }
      try {
        detail::connect_fd(fd, ai->ai_addr, ai->ai_addrlen, until, target);
      } catch (const connection_timeout_error &) {
        ::close(fd);
        throw;
      } catch (const connection_error &e) {
        ::close(fd);
        last_error = e.message();
        continue;
      }
      int one = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      return fd;
    }
    throw connection_error(last_error, {{"endpoint", endpoint()}});
  }

private:
  std::string host_;
  int port_;
};

/// One end of an in-process loop-back pipe pair, for tests.
class memory_transport : public transport {
public:
  memory_transport(std::shared_ptr<detail::byte_pipe> inbound,
                   std::shared_ptr<detail::byte_pipe> outbound,
                   std::string endpoint = "mem://")
      : inbound_(std::move(inbound)), outbound_(std::move(outbound)),
        endpoint_(std::move(endpoint)) {}

  ~memory_transport() override { close(); }

  void connect(deadline until = kNoDeadline) override {
    (void)until;
    if (!is_connected())
      throw connection_error("In-memory transport cannot be reopened",
                             {{"endpoint", endpoint_}});
  }

  void send(std::string_view data) override {
    if (!is_connected())
      throw connection_error("Not connected", {{"endpoint", endpoint_}});
    {
      std::lock_guard<std::mutex> lock(outbound_->mu);
      if (outbound_->closed)
        throw connection_closed_error("Connection closed by peer",
                                      {{"endpoint", endpoint_}});
      outbound_->buffer.append(data.data(), data.size());
    }
    outbound_->cv.notify_all();
  }

  std::string receive(deadline until = kNoDeadline) override {
    return take(1, kReceiveChunk, until);
  }

  std::string receive_exactly(std::size_t n,
                              deadline until = kNoDeadline) override {
    return take(n, n, until);
  }

  void close() override {
    connected_.store(false);
    detail::close_pipe(inbound_);
    detail::close_pipe(outbound_);
  }

  void shutdown() override { close(); }

  bool is_connected() const override { return connected_.load(); }
  std::string endpoint() const override { return endpoint_; }

private:
  /// Wait for at least `min` bytes, then take up to `max`.
  std::string take(std::size_t min, std::size_t max, deadline until) {
    if (!is_connected())
      throw connection_error("Not connected", {{"endpoint", endpoint_}});

    std::unique_lock<std::mutex> lock(inbound_->mu);
    auto ready = [&]() {
      return inbound_->buffer.size() >= min || inbound_->closed;
    };
    if (until == kNoDeadline) {
      inbound_->cv.wait(lock, ready);
    } else if (!inbound_->cv.wait_until(lock, until, ready)) {
      throw connection_timeout_error("Timed out waiting for data on " +
                                     endpoint_);
    }

    if (inbound_->buffer.size() < min) {
      throw connection_closed_error("Connection closed by peer",
                                    {{"endpoint", endpoint_}});
    }
    auto count = std::min(max, inbound_->buffer.size());
    std::string out = inbound_->buffer.substr(0, count);
    inbound_->buffer.erase(0, count);
    return out;
  }

  std::shared_ptr<detail::byte_pipe> inbound_;
  std::shared_ptr<detail::byte_pipe> outbound_;
  std::string endpoint_;
  std::atomic<bool> connected_{true};
};

/// Connected (server, client) in-memory pair.
inline std::pair<std::unique_ptr<transport>, std::unique_ptr<transport>>
make_memory_transport_pair(const std::string &endpoint = "mem://") {
  auto client_to_server = std::make_shared<detail::byte_pipe>();
  auto server_to_client = std::make_shared<detail::byte_pipe>();
  return {std::make_unique<memory_transport>(client_to_server,
                                             server_to_client, endpoint),
          std::make_unique<memory_transport>(server_to_client,
                                             client_to_server, endpoint)};
}

// --- listeners ---

struct tcp_listener {
  int fd = -1;
  std::string host;
  int port = 0;
};

struct unix_listener {
  int fd = -1;
  std::string path;
};

namespace detail {

struct mem_backlog {
  std::mutex mu;
  std::condition_variable cv;
  std::deque<std::unique_ptr<transport>> pending;
  bool closed = false;
};

} // namespace detail

struct mem_listener {
  std::string address = "mem://";
  std::shared_ptr<detail::mem_backlog> backlog =
      std::make_shared<detail::mem_backlog>();
};

using listener = std::variant<tcp_listener, unix_listener, mem_listener>;

namespace detail {

/// Create missing directories of `dir` with owner-only permissions.
/// Existing directories are left untouched.
inline void ensure_private_dir(const std::string &dir) {
  if (dir.empty())
    return;
  struct stat st {};
  if (::stat(dir.c_str(), &st) == 0) {
    if (!S_ISDIR(st.st_mode))
      throw std::runtime_error("not a directory: " + dir);
    return;
  }
  auto slash = dir.rfind('/');
  if (slash != std::string::npos && slash > 0)
    ensure_private_dir(dir.substr(0, slash));
  if (::mkdir(dir.c_str(), 0700) != 0 && errno != EEXIST)
    throw std::runtime_error("mkdir(" + dir + ") failed: " + errno_text(errno));
}

inline std::string peer_endpoint(int fd, const std::string &fallback) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0)
    return fallback;

  char host[INET6_ADDRSTRLEN] = {0};
  int port = 0;
  if (addr.ss_family == AF_INET) {
    auto *in = reinterpret_cast<sockaddr_in *>(&addr);
    ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
    port = ntohs(in->sin_port);
  } else if (addr.ss_family == AF_INET6) {
    auto *in6 = reinterpret_cast<sockaddr_in6 *>(&addr);
    ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
    port = ntohs(in6->sin6_port);
  } else {
    return fallback;
  }
  return "tcp://" + std::string(host) + ":" + std::to_string(port);
}

/// accept() with a poll timeout. Returns -1 when nothing arrived in time.
inline int accept_fd(int listen_fd, std::chrono::milliseconds timeout,
                     const char *kind) {
  if (listen_fd < 0)
    throw connection_error(std::string(kind) + " listener is closed");

  pollfd pfd{listen_fd, POLLIN, 0};
  int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (rc == 0)
    return -1;
  if (rc < 0) {
    if (errno == EINTR)
      return -1;
    throw connection_error(std::string("poll(") + kind +
                           ") failed: " + errno_text(errno));
  }

  int fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
  if (fd < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED)
      return -1;
    throw connection_error(std::string("accept(") + kind +
                           ") failed: " + errno_text(errno));
  }
  return fd;
}

} // namespace detail

/// Bind a listener for a unix://, tcp:// or mem:// URI.
/// - unix: creates a missing parent directory as 0700, replaces a stale
///   socket file, and leaves the socket file 0600
/// - tcp: port 0 picks a free port, reported by listener_endpoint()
/// - mem: in-process backlog fed by mem_dial()
inline listener listen(const std::string &uri) {
  auto parsed = parse_uri(uri);

  if (parsed.scheme == "tcp") {
    std::string host = parsed.host == "localhost" ? "127.0.0.1" : parsed.host;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(parsed.port));
    if (host == "0.0.0.0") {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
      throw std::invalid_argument("invalid tcp host: " + parsed.host);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
      throw std::runtime_error("socket() failed: " + errno_text(errno));

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("bind(" + uri + ") failed: " + errno_text(err));
    }
    if (::listen(fd, SOMAXCONN) < 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("listen() failed: " + errno_text(err));
    }

    socklen_t len = sizeof(addr);
    int port = parsed.port;
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0)
      port = ntohs(addr.sin_port);
    return tcp_listener{fd, host, port};
  }

  if (parsed.scheme == "unix") {
    sockaddr_un addr{};
    if (parsed.path.size() >= sizeof(addr.sun_path))
      throw std::invalid_argument("unix socket path too long: " + parsed.path);

    auto slash = parsed.path.rfind('/');
    if (slash != std::string::npos && slash > 0)
      detail::ensure_private_dir(parsed.path.substr(0, slash));

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
      throw std::runtime_error("socket() failed: " + errno_text(errno));

    ::unlink(parsed.path.c_str());
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s",
                  parsed.path.c_str());

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("bind(unix) failed: " + errno_text(err));
    }
    if (::chmod(parsed.path.c_str(), 0600) != 0) {
      int err = errno;
      ::close(fd);
      ::unlink(parsed.path.c_str());
      throw std::runtime_error("chmod(unix) failed: " + errno_text(err));
    }
    if (::listen(fd, SOMAXCONN) < 0) {
      int err = errno;
      ::close(fd);
      ::unlink(parsed.path.c_str());
      throw std::runtime_error("listen(unix) failed: " + errno_text(err));
    }
    return unix_listener{fd, parsed.path};
  }

  mem_listener mem;
  mem.address = parsed.raw;
  return mem;
}

/// Accept one connection, waiting at most `timeout`.
/// Returns nullptr on timeout so accept loops can check for shutdown.
inline std::unique_ptr<transport> accept(listener &lis,
                                         std::chrono::milliseconds timeout) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    int fd = detail::accept_fd(tcp->fd, timeout, "tcp");
    if (fd < 0)
      return nullptr;
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return std::make_unique<socket_transport>(
        fd, detail::peer_endpoint(fd, "tcp://" + tcp->host + ":" +
                                          std::to_string(tcp->port)));
  }

  if (auto *unix_lis = std::get_if<unix_listener>(&lis)) {
    int fd = detail::accept_fd(unix_lis->fd, timeout, "unix");
    if (fd < 0)
      return nullptr;
    return std::make_unique<socket_transport>(fd, "unix://" + unix_lis->path);
  }

  auto &mem = std::get<mem_listener>(lis);
  std::unique_lock<std::mutex> lock(mem.backlog->mu);
  bool ready = mem.backlog->cv.wait_for(lock, timeout, [&mem]() {
    return !mem.backlog->pending.empty() || mem.backlog->closed;
  });
  if (!ready)
    return nullptr;
  if (mem.backlog->closed)
    throw connection_error("mem listener is closed");
  auto conn = std::move(mem.backlog->pending.front());
  mem.backlog->pending.pop_front();
  return conn;
}

/// Dial the client side of a mem:// listener.
inline std::unique_ptr<transport> mem_dial(const listener &lis) {
  const auto *mem = std::get_if<mem_listener>(&lis);
  if (mem == nullptr)
    throw std::invalid_argument("mem_dial() requires mem:// listener");

  auto pair = make_memory_transport_pair(mem->address);
  {
    std::lock_guard<std::mutex> lock(mem->backlog->mu);
    if (mem->backlog->closed)
      throw connection_error("mem listener is closed",
                             {{"endpoint", mem->address}});
    mem->backlog->pending.push_back(std::move(pair.first));
  }
  mem->backlog->cv.notify_all();
  return std::move(pair.second);
}

inline std::string listener_endpoint(const listener &lis) {
  if (const auto *tcp = std::get_if<tcp_listener>(&lis))
    return "tcp://" + tcp->host + ":" + std::to_string(tcp->port);
  if (const auto *unix_lis = std::get_if<unix_listener>(&lis))
    return "unix://" + unix_lis->path;
  return std::get<mem_listener>(lis).address;
}

inline void close_listener(listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    if (tcp->fd >= 0) {
      ::close(tcp->fd);
      tcp->fd = -1;
    }
    return;
  }
  if (auto *unix_lis = std::get_if<unix_listener>(&lis)) {
    if (unix_lis->fd >= 0) {
      ::close(unix_lis->fd);
      unix_lis->fd = -1;
      ::unlink(unix_lis->path.c_str());
    }
    return;
  }
  auto &mem = std::get<mem_listener>(lis);
  std::deque<std::unique_ptr<transport>> orphans;
  {
    std::lock_guard<std::mutex> lock(mem.backlog->mu);
    mem.backlog->closed = true;
    orphans.swap(mem.backlog->pending);
  }
  mem.backlog->cv.notify_all();
  for (auto &conn : orphans)
    conn->close();
}

/// Client transport for a unix:// or tcp:// endpoint.
inline std::unique_ptr<transport> make_transport(const std::string &uri) {
  auto parsed = parse_uri(uri);
  if (parsed.scheme == "unix")
    return std::make_unique<unix_socket_transport>(parsed.path);
  if (parsed.scheme == "tcp") {
    if (parsed.port == 0)
      throw std::invalid_argument("invalid port in endpoint: " + uri);
    return std::make_unique<tcp_transport>(parsed.host, parsed.port);
  }
  throw std::invalid_argument("mem:// endpoints are dialed with mem_dial(): " +
                              uri);
}

} // namespace agentlink

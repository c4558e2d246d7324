#include "../include/agentlink/transport.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>

namespace {

using namespace std::chrono_literals;

std::string make_temp_dir() {
  char tmpl[] = "/tmp/agentlink_transport_XXXXXX";
  char *dir = ::mkdtemp(tmpl);
  assert(dir != nullptr);
  return dir;
}

mode_t file_mode(const std::string &path) {
  struct stat st {};
  assert(::stat(path.c_str(), &st) == 0);
  return st.st_mode;
}

bool exists(const std::string &path) {
  struct stat st {};
  return ::stat(path.c_str(), &st) == 0;
}

/// Connected (server, client) pair over a fresh listener.
std::pair<std::unique_ptr<agentlink::transport>,
          std::unique_ptr<agentlink::transport>>
connect_pair(agentlink::listener &lis) {
  std::unique_ptr<agentlink::transport> client;
  auto endpoint = agentlink::listener_endpoint(lis);
  auto parsed = agentlink::parse_uri(endpoint);
  if (parsed.scheme == "unix") {
    client = std::make_unique<agentlink::unix_socket_transport>(parsed.path);
  } else {
    client = std::make_unique<agentlink::tcp_transport>(parsed.host,
                                                        parsed.port);
  }
  client->connect(agentlink::deadline_after(2000ms));
  auto server = agentlink::accept(lis, 2000ms);
  assert(server != nullptr);
  return {std::move(server), std::move(client)};
}

} // namespace

int main() {
  int passed = 0;

  // --- scheme ---
  assert(agentlink::scheme("tcp://:9090") == "tcp");
  ++passed;
  assert(agentlink::scheme("unix:///tmp/x.sock") == "unix");
  ++passed;
  assert(agentlink::scheme("mem://") == "mem");
  ++passed;

  // --- parse_uri ---
  {
    auto parsed = agentlink::parse_uri("tcp://127.0.0.1:8080");
    assert(parsed.scheme == "tcp");
    ++passed;
    assert(parsed.host == "127.0.0.1");
    ++passed;
    assert(parsed.port == 8080);
    ++passed;

    auto any = agentlink::parse_uri("tcp://:9090");
    assert(any.host == "0.0.0.0");
    ++passed;

    auto v6 = agentlink::parse_uri("tcp://[::1]:7000");
    assert(v6.host == "::1" && v6.port == 7000);
    ++passed;

    auto unix_uri = agentlink::parse_uri("unix:///tmp/agents/echo.sock");
    assert(unix_uri.scheme == "unix");
    ++passed;
    assert(unix_uri.path == "/tmp/agents/echo.sock");
    ++passed;

    auto mem = agentlink::parse_uri("mem://bus");
    assert(mem.scheme == "mem" && mem.path == "bus");
    ++passed;

    for (const char *bad : {"ftp://host", "tcp://host", "tcp://host:99999",
                            "tcp://host:http", "unix://", "plain"}) {
      try {
        (void)agentlink::parse_uri(bad);
        assert(false && "should have thrown");
      } catch (const std::invalid_argument &) {
        ++passed;
      }
    }
  }

  // --- memory transport ---
  {
    auto pair = agentlink::make_memory_transport_pair();
    auto &server = pair.first;
    auto &client = pair.second;
    assert(server->is_connected() && client->is_connected());
    ++passed;

    client->send("ab");
    client->send("cd");
    assert(server->receive_exactly(4) == "abcd");
    ++passed;

    server->send_framed("{\"ok\":true}");
    assert(client->receive_framed() == "{\"ok\":true}");
    ++passed;

    try {
      (void)server->receive_exactly(1, agentlink::deadline_after(50ms));
      assert(false && "should have timed out");
    } catch (const agentlink::connection_timeout_error &e) {
      assert(e.code() == agentlink::error_code::connection_timeout);
      ++passed;
    }

    std::thread late([&client]() {
      std::this_thread::sleep_for(30ms);
      client->send("xy");
    });
    assert(server->receive_exactly(2, agentlink::deadline_after(2000ms)) ==
           "xy");
    ++passed;
    late.join();

    client->close();
    try {
      (void)server->receive(agentlink::deadline_after(1000ms));
      assert(false && "should have thrown");
    } catch (const agentlink::connection_closed_error &) {
      ++passed;
    }
    try {
      client->send("again");
      assert(false && "should have thrown");
    } catch (const agentlink::connection_error &) {
      ++passed;
    }
    try {
      client->connect();
      assert(false && "should have thrown");
    } catch (const agentlink::connection_error &) {
      ++passed;
    }
  }

  // --- oversized frame rejected before the body is read ---
  {
    auto pair = agentlink::make_memory_transport_pair();
    auto header = agentlink::encode_frame_header(
        static_cast<uint32_t>(agentlink::kMaxFrameSize + 1));
    pair.second->send(std::string(reinterpret_cast<const char *>(header.data()),
                                  header.size()));
    try {
      (void)pair.first->receive_framed(agentlink::deadline_after(1000ms));
      assert(false && "should have thrown");
    } catch (const agentlink::malformed_payload_error &) {
      ++passed;
    }

    try {
      pair.second->send_framed(std::string(128, 'x'), 64);
      assert(false && "should have thrown");
    } catch (const agentlink::malformed_payload_error &) {
      ++passed;
    }
  }

  // --- unix listener ---
  {
    std::string dir = make_temp_dir() + "/nested";
    std::string path = dir + "/agent.sock";
    auto lis = agentlink::listen("unix://" + path);
    auto *unix_lis = std::get_if<agentlink::unix_listener>(&lis);
    assert(unix_lis != nullptr);
    ++passed;
    assert(agentlink::listener_endpoint(lis) == "unix://" + path);
    ++passed;
    assert(S_ISSOCK(file_mode(path)));
    ++passed;
    assert((file_mode(path) & 0777) == 0600);
    ++passed;
    assert((file_mode(dir) & 0777) == 0700);
    ++passed;

    auto pair = connect_pair(lis);
    auto &server = pair.first;
    auto &client = pair.second;
    assert(client->endpoint() == "unix://" + path);
    ++passed;

    client->send_framed("ping");
    assert(server->receive_framed(agentlink::deadline_after(1000ms)) == "ping");
    ++passed;
    server->send_framed("pong");
    assert(client->receive_framed(agentlink::deadline_after(1000ms)) == "pong");
    ++passed;

    // one frame split across writes
    auto framed = agentlink::frame("split-body");
    std::thread writer([&client, &framed]() {
      client->send(framed.substr(0, 2));
      std::this_thread::sleep_for(20ms);
      client->send(framed.substr(2, 5));
      std::this_thread::sleep_for(20ms);
      client->send(framed.substr(7));
    });
    assert(server->receive_framed(agentlink::deadline_after(2000ms)) ==
           "split-body");
    ++passed;
    writer.join();

    try {
      (void)server->receive_framed(agentlink::deadline_after(50ms));
      assert(false && "should have timed out");
    } catch (const agentlink::connection_timeout_error &) {
      ++passed;
    }

    std::thread closer([&server]() {
      std::this_thread::sleep_for(30ms);
      server->shutdown();
    });
    try {
      (void)server->receive_framed(agentlink::deadline_after(2000ms));
      assert(false && "should have thrown");
    } catch (const agentlink::connection_error &) {
      ++passed;
    }
    closer.join();

    try {
      (void)client->receive_framed(agentlink::deadline_after(2000ms));
      assert(false && "should have thrown");
    } catch (const agentlink::connection_closed_error &) {
      ++passed;
    }
    assert(!client->is_connected());
    ++passed;

    agentlink::close_listener(lis);
    assert(!exists(path));
    ++passed;
    ::rmdir(dir.c_str());
  }

  // --- stale socket file is replaced ---
  {
    std::string path = make_temp_dir() + "/stale.sock";
    {
      std::ofstream f(path);
      f << "left over";
    }
    auto lis = agentlink::listen("unix://" + path);
    assert(S_ISSOCK(file_mode(path)));
    ++passed;
    agentlink::close_listener(lis);
  }

  // --- unix connection failure ---
  {
    agentlink::unix_socket_transport client("/tmp/agentlink-no-such-dir/x.sock");
    try {
      client.connect(agentlink::deadline_after(1000ms));
      assert(false && "should have thrown");
    } catch (const agentlink::connection_error &e) {
      assert(e.code() == agentlink::error_code::connection_failed);
      ++passed;
    }
    assert(!client.is_connected());
    ++passed;
    try {
      client.send("x");
      assert(false && "should have thrown");
    } catch (const agentlink::connection_error &) {
      ++passed;
    }
  }

  // --- tcp listener ---
  {
    auto lis = agentlink::listen("tcp://127.0.0.1:0");
    auto *tcp = std::get_if<agentlink::tcp_listener>(&lis);
    assert(tcp != nullptr);
    ++passed;
    assert(tcp->port > 0);
    ++passed;
    assert(agentlink::listener_endpoint(lis) ==
           "tcp://127.0.0.1:" + std::to_string(tcp->port));
    ++passed;

    assert(agentlink::accept(lis, 50ms) == nullptr);
    ++passed;

    auto pair = connect_pair(lis);
    assert(pair.first->endpoint().rfind("tcp://127.0.0.1:", 0) == 0);
    ++passed;

    std::string big(256 * 1024, 'z');
    std::thread writer([&pair, &big]() { pair.second->send_framed(big); });
    assert(pair.first->receive_framed(agentlink::deadline_after(5000ms)) ==
           big);
    ++passed;
    writer.join();

    pair.first->close();
    try {
      (void)pair.second->receive_framed(agentlink::deadline_after(2000ms));
      assert(false && "should have thrown");
    } catch (const agentlink::connection_closed_error &) {
      ++passed;
    }

    auto via_factory = agentlink::make_transport(
        "tcp://127.0.0.1:" + std::to_string(tcp->port));
    via_factory->connect(agentlink::deadline_after(2000ms));
    assert(via_factory->is_connected());
    ++passed;
    auto accepted = agentlink::accept(lis, 2000ms);
    assert(accepted != nullptr);
    ++passed;

    agentlink::close_listener(lis);
    try {
      (void)agentlink::accept(lis, 10ms);
      assert(false && "should have thrown");
    } catch (const agentlink::connection_error &) {
      ++passed;
    }
  }

  // --- mem listener ---
  {
    auto lis = agentlink::listen("mem://bus");
    assert(agentlink::listener_endpoint(lis) == "mem://bus");
    ++passed;
    assert(agentlink::accept(lis, 20ms) == nullptr);
    ++passed;

    auto client = agentlink::mem_dial(lis);
    auto server = agentlink::accept(lis, 1000ms);
    assert(server != nullptr);
    ++passed;
    client->send_framed("hi");
    assert(server->receive_framed(agentlink::deadline_after(1000ms)) == "hi");
    ++passed;

    agentlink::close_listener(lis);
    try {
      (void)agentlink::mem_dial(lis);
      assert(false && "should have thrown");
    } catch (const agentlink::connection_error &) {
      ++passed;
    }

    auto tcp_lis = agentlink::listen("tcp://127.0.0.1:0");
    try {
      (void)agentlink::mem_dial(tcp_lis);
      assert(false && "should have thrown");
    } catch (const std::invalid_argument &) {
      ++passed;
    }
    agentlink::close_listener(tcp_lis);
  }

  // --- unsupported URIs ---
  try {
    (void)agentlink::listen("ftp://host");
    assert(false && "should have thrown");
  } catch (const std::invalid_argument &) {
    ++passed;
  }
  try {
    (void)agentlink::make_transport("mem://bus");
    assert(false && "should have thrown");
  } catch (const std::invalid_argument &) {
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}

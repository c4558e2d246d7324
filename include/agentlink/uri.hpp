#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>

namespace agentlink {

/// Extract the scheme from a transport URI.
inline std::string scheme(std::string_view uri) {
  auto pos = uri.find("://");
  return pos != std::string_view::npos ? std::string(uri.substr(0, pos))
                                       : std::string(uri);
}

/// Parsed endpoint URI: unix:///path, tcp://host:port or mem://name.
struct parsed_uri {
  std::string raw;
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path;
};

inline int parse_port(const std::string &text, const std::string &uri) {
  if (text.empty())
    throw std::invalid_argument("missing port in endpoint: " + uri);
  size_t used = 0;
  int port = -1;
  try {
    port = std::stoi(text, &used);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("invalid port in endpoint: " + uri);
  }
  if (used != text.size() || port < 0 || port > 65535)
    throw std::invalid_argument("invalid port in endpoint: " + uri);
  return port;
}

/// Split "host:port"; an empty host means every interface.
inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     const std::string &uri) {
  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    throw std::invalid_argument("invalid tcp endpoint format: " + uri);

  std::string host = addr.substr(0, pos);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  if (host.empty())
    host = "0.0.0.0";
  return {host, parse_port(addr.substr(pos + 1), uri)};
}

inline parsed_uri parse_uri(const std::string &uri) {
  std::string s = scheme(uri);

  if (s == "tcp") {
    if (uri.rfind("tcp://", 0) != 0)
      throw std::invalid_argument("invalid tcp URI: " + uri);
    auto [host, port] = split_host_port(uri.substr(6), uri);
    return {uri, "tcp", host, port, ""};
  }

  if (s == "unix") {
    if (uri.rfind("unix://", 0) != 0)
      throw std::invalid_argument("invalid unix URI: " + uri);
    auto path = uri.substr(7);
    if (path.empty())
      throw std::invalid_argument("invalid unix URI: " + uri);
    return {uri, "unix", "", 0, path};
  }

  if (s == "mem") {
    if (uri.rfind("mem://", 0) != 0)
      throw std::invalid_argument("invalid mem URI: " + uri);
    return {uri, "mem", "", 0, uri.substr(6)};
  }

  throw std::invalid_argument("unsupported transport URI: " + uri);
}

} // namespace agentlink

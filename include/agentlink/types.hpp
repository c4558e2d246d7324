#pragma once

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace agentlink {

using json = nlohmann::json;

/// Wall-clock time at microsecond precision, the resolution of the wire form.
using timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

inline timestamp now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now());
}

/// Format as ISO-8601 UTC, e.g. "2025-01-02T03:04:05.123456+00:00".
inline std::string format_timestamp(timestamp ts) {
  auto micros = ts.time_since_epoch().count();
  auto seconds = micros / 1000000;
  auto fraction = micros % 1000000;
  if (fraction < 0) {
    fraction += 1000000;
    --seconds;
  }

  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  ::gmtime_r(&t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<long long>(fraction));
  return buf;
}

/// Parse an ISO-8601 timestamp. Accepts "Z", "+HH:MM"/"-HH:MM" or no offset
/// (taken as UTC) and 0-9 fraction digits. Throws std::invalid_argument.
inline timestamp parse_timestamp(const std::string &text) {
  auto fail = [&text]() -> std::invalid_argument {
    return std::invalid_argument("invalid ISO-8601 timestamp: " + text);
  };

  auto digits = [&](size_t pos, size_t count) {
    if (pos + count > text.size())
      throw fail();
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
      if (!std::isdigit(static_cast<unsigned char>(text[i])))
        throw fail();
      value = value * 10 + (text[i] - '0');
    }
    return value;
  };
  auto expect = [&](size_t pos, char c) {
    if (pos >= text.size() || text[pos] != c)
      throw fail();
  };

  std::tm tm{};
  tm.tm_year = digits(0, 4) - 1900;
  expect(4, '-');
  tm.tm_mon = digits(5, 2) - 1;
  expect(7, '-');
  tm.tm_mday = digits(8, 2);
  if (text.size() <= 10 || (text[10] != 'T' && text[10] != ' '))
    throw fail();
  tm.tm_hour = digits(11, 2);
  expect(13, ':');
  tm.tm_min = digits(14, 2);
  expect(16, ':');
  tm.tm_sec = digits(17, 2);

  if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
      tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
    throw fail();

  size_t pos = 19;
  long long micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int count = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (count < 6) {
        micros = micros * 10 + (text[pos] - '0');
      }
      ++count;
      ++pos;
    }
    if (count == 0 || count > 9)
      throw fail();
    for (int i = count; i < 6; ++i)
      micros *= 10;
  }

  long long offset_seconds = 0;
  if (pos < text.size()) {
    char sign = text[pos];
    if (sign == 'Z' || sign == 'z') {
      ++pos;
    } else if (sign == '+' || sign == '-') {
      int hours = digits(pos + 1, 2);
      expect(pos + 3, ':');
      int minutes = digits(pos + 4, 2);
      offset_seconds = (hours * 3600LL + minutes * 60LL) * (sign == '+' ? 1 : -1);
      pos += 6;
    } else {
      throw fail();
    }
  }
  if (pos != text.size())
    throw fail();

  long long epoch = static_cast<long long>(::timegm(&tm)) - offset_seconds;
  return timestamp(std::chrono::microseconds(epoch * 1000000 + micros));
}

/// Universal message exchanged between agents. Immutable once constructed.
class message {
public:
  message(std::string role, json content, json metadata = json::object(),
          std::optional<timestamp> ts = std::nullopt)
      : role_(std::move(role)), content_(std::move(content)),
        metadata_(metadata.is_null() ? json::object() : std::move(metadata)),
        timestamp_(ts ? *ts : now()) {
    if (role_.empty())
      throw std::invalid_argument("message role cannot be empty");
    if (!metadata_.is_object())
      throw std::invalid_argument("message metadata must be an object");
  }

  const std::string &role() const { return role_; }
  const json &content() const { return content_; }
  const json &metadata() const { return metadata_; }
  timestamp time() const { return timestamp_; }

  bool operator==(const message &other) const {
    return role_ == other.role_ && content_ == other.content_ &&
           metadata_ == other.metadata_ && timestamp_ == other.timestamp_;
  }
  bool operator!=(const message &other) const { return !(*this == other); }

private:
  std::string role_;
  json content_;
  json metadata_;
  timestamp timestamp_;
};

/// Outcome of a tool execution. A failed result always carries an error.
class tool_result {
public:
  static tool_result ok(json data, json metadata = json::object()) {
    return tool_result(true, std::move(data), std::nullopt,
                       std::move(metadata));
  }
  static tool_result failure(std::string error, json metadata = json::object()) {
    return tool_result(false, nullptr, std::move(error), std::move(metadata));
  }

  tool_result(bool success, json data, std::optional<std::string> error,
              json metadata = json::object())
      : success_(success), data_(std::move(data)), error_(std::move(error)),
        metadata_(metadata.is_null() ? json::object() : std::move(metadata)) {
    if (!success_ && !error_)
      throw std::invalid_argument("failed tool_result must have an error");
    if (!success_ && !data_.is_null())
      throw std::invalid_argument("failed tool_result cannot carry data");
  }

  bool success() const { return success_; }
  const json &data() const { return data_; }
  const std::optional<std::string> &error() const { return error_; }
  const json &metadata() const { return metadata_; }

  bool operator==(const tool_result &other) const {
    return success_ == other.success_ && data_ == other.data_ &&
           error_ == other.error_ && metadata_ == other.metadata_;
  }

private:
  bool success_;
  json data_;
  std::optional<std::string> error_;
  json metadata_;
};

using stream_callback = std::function<void(const message &)>;

/// Minimal agent contract: a name and process(). Local implementations,
/// local_agent-exported ones and remote_agent proxies are interchangeable.
class agent {
public:
  virtual ~agent() = default;

  virtual std::string name() const = 0;
  virtual message process(const message &msg) = 0;

  /// Emit response messages as they are produced. Optional.
  virtual void stream(const message &msg, const stream_callback &emit) {
    (void)msg;
    (void)emit;
    throw std::logic_error(name() + " does not support streaming");
  }

  virtual std::vector<std::string> capabilities() const { return {}; }
};

} // namespace agentlink

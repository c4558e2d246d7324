#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace agentlink {

/// Wire protocol version carried by every envelope.
constexpr std::string_view kProtocolVersion = "1.0";

/// Largest frame body accepted or sent (10 MiB).
constexpr std::size_t kMaxFrameSize = 10 * 1024 * 1024;

constexpr std::chrono::milliseconds kDefaultRequestTimeout{30000};
constexpr std::chrono::milliseconds kDefaultIdleTimeout{60000};
constexpr std::chrono::milliseconds kDefaultHeartbeatInterval{30000};
constexpr std::chrono::milliseconds kDefaultHeartbeatTimeout{90000};
constexpr std::chrono::milliseconds kDefaultPruneInterval{60000};

/// Accept loops wake up this often to observe shutdown.
constexpr std::chrono::milliseconds kAcceptPollInterval{100};

} // namespace agentlink

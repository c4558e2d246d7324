#pragma once

#include "agentlink/config.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/logging.hpp"
#include "agentlink/periodic_task.hpp"
#include "agentlink/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace agentlink {

struct agent_registration {
  std::string name;
  std::string endpoint;
  json capabilities = json::object();
  json metadata = json::object();
  timestamp registered_at{};
  timestamp last_heartbeat{};
};

struct registry_options {
  /// Expected interval between heartbeats from registered agents.
  std::chrono::milliseconds heartbeat_interval = kDefaultHeartbeatInterval;
  /// Age of last_heartbeat after which an entry is stale.
  std::chrono::milliseconds heartbeat_timeout = kDefaultHeartbeatTimeout;
  std::chrono::milliseconds prune_interval = kDefaultPruneInterval;
  /// Time source; tests substitute a manual clock.
  std::function<timestamp()> clock = &agentlink::now;
};

/// In-process agent directory with heartbeat-based liveness.
///
/// Not a singleton: construct one per scope and pass it to the local_agent
/// instances that should register in it. All state sits behind one
/// reader/writer lock.
class agent_registry {
public:
  explicit agent_registry(registry_options options = {})
      : options_(std::move(options)) {
    if (!options_.clock)
      options_.clock = &agentlink::now;
    if (options_.heartbeat_timeout <= options_.heartbeat_interval) {
      throw std::invalid_argument(
          "heartbeat_timeout must exceed heartbeat_interval");
    }
  }

  ~agent_registry() { stop(); }

  agent_registry(const agent_registry &) = delete;
  agent_registry &operator=(const agent_registry &) = delete;

  /// Start the background prune task.
  void start() {
    if (prune_task_.running())
      return;
    prune_task_.start(options_.prune_interval, [this]() {
      try {
        auto pruned = prune_stale_agents();
        if (pruned > 0)
          log().info("pruned {} stale agent(s)", pruned);
      } catch (const std::exception &e) {
        log().error("prune pass failed: {}", e.what());
      }
      return true;
    });
    log().info("agent registry started");
  }

  void stop() {
    if (!prune_task_.running())
      return;
    prune_task_.stop();
    log().info("agent registry stopped");
  }

  bool running() const { return prune_task_.running(); }

  /// Store a registration, stamping registered_at and last_heartbeat.
  /// A live entry under the same name at another endpoint is a duplicate;
  /// the same endpoint or a stale entry is replaced.
  void register_agent(agent_registration registration) {
    if (registration.name.empty()) {
      throw registration_failed_error("Agent name cannot be empty");
    }
    if (registration.capabilities.is_null())
      registration.capabilities = json::object();
    if (registration.metadata.is_null())
      registration.metadata = json::object();

    auto at = options_.clock();
    registration.registered_at = at;
    registration.last_heartbeat = at;

    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = agents_.find(registration.name);
    if (it != agents_.end()) {
      if (!is_stale(it->second, at) &&
          it->second.endpoint != registration.endpoint) {
        throw duplicate_agent_error(
            registration.name, {{"endpoint", it->second.endpoint},
                                {"requested_endpoint", registration.endpoint}});
      }
      log().info("re-registering agent: {}", registration.name);
      it->second = std::move(registration);
      return;
    }
    log().info("registering new agent: {} at {}", registration.name,
               registration.endpoint);
    auto name = registration.name;
    agents_.emplace(std::move(name), std::move(registration));
  }

  void unregister_agent(const std::string &name) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (agents_.erase(name) > 0) {
      log().info("unregistered agent: {}", name);
    } else {
      log().warn("attempted to unregister unknown agent: {}", name);
    }
  }

  /// Remove `name` only while it is still registered at `endpoint`.
  /// Returns false when the entry is gone or belongs to another endpoint.
  bool unregister_agent(const std::string &name, const std::string &endpoint) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = agents_.find(name);
    if (it == agents_.end()) {
      log().warn("attempted to unregister unknown agent: {}", name);
      return false;
    }
    if (it->second.endpoint != endpoint) {
      log().warn("not unregistering agent '{}': registered at {}, not {}",
                 name, it->second.endpoint, endpoint);
      return false;
    }
    agents_.erase(it);
    log().info("unregistered agent: {}", name);
    return true;
  }

  agent_registration lookup(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = agents_.find(name);
    if (it == agents_.end())
      throw agent_not_found_error(name);
    return it->second;
  }

  /// Snapshot of every registration, ordered by name.
  std::vector<agent_registration> list() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<agent_registration> out;
    out.reserve(agents_.size());
    for (const auto &kv : agents_)
      out.push_back(kv.second);
    return out;
  }

  /// Renew last_heartbeat. The new value is strictly greater than the old one
  /// even if the clock has not advanced.
  void heartbeat(const std::string &name) {
    auto at = options_.clock();
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = agents_.find(name);
    if (it == agents_.end())
      throw agent_not_found_error(name);

    auto &last = it->second.last_heartbeat;
    last = at > last ? at : last + std::chrono::microseconds(1);
    log().debug("heartbeat received from agent: {}", name);
  }

  /// Remove entries whose heartbeat is older than heartbeat_timeout.
  std::size_t prune_stale_agents() {
    auto at = options_.clock();
    std::size_t pruned = 0;

    std::unique_lock<std::shared_mutex> lock(mu_);
    for (auto it = agents_.begin(); it != agents_.end();) {
      if (is_stale(it->second, at)) {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
            at - it->second.last_heartbeat);
        log().warn("pruned stale agent: {} (no heartbeat for {:.1f}s)",
                   it->first, age.count() / 1000.0);
        it = agents_.erase(it);
        ++pruned;
      } else {
        ++it;
      }
    }
    return pruned;
  }

  std::size_t size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return agents_.size();
  }

  const registry_options &options() const { return options_; }

private:
  bool is_stale(const agent_registration &reg, timestamp at) const {
    return at - reg.last_heartbeat > options_.heartbeat_timeout;
  }

  registry_options options_;
  mutable std::shared_mutex mu_;
  std::map<std::string, agent_registration> agents_;
  periodic_task prune_task_;
};

} // namespace agentlink

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace agentlink {

/// Background loop calling `tick` every `interval` until stop() or until
/// `tick` returns false. stop() wakes the sleeping loop immediately.
class periodic_task {
public:
  using tick_fn = std::function<bool()>;

  periodic_task() = default;
  ~periodic_task() { stop(); }

  periodic_task(const periodic_task &) = delete;
  periodic_task &operator=(const periodic_task &) = delete;

  /// With run_immediately the first tick happens before the first sleep.
  void start(std::chrono::milliseconds interval, tick_fn tick,
             bool run_immediately = false) {
    if (interval.count() <= 0) {
      throw std::invalid_argument("periodic_task interval must be positive");
    }
    stop();
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = false;
    finished_ = false;
    thread_ = std::thread([this, interval, tick = std::move(tick),
                           run_immediately]() {
      run(interval, tick, run_immediately);
    });
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  /// True while the loop thread is alive and has not ended on its own.
  bool running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return thread_.joinable() && !stopping_ && !finished_;
  }

private:
  void run(std::chrono::milliseconds interval, const tick_fn &tick,
           bool run_immediately) {
    if (run_immediately && !tick()) {
      finish();
      return;
    }
    for (;;) {
      {
        std::unique_lock<std::mutex> lock(mu_);
        if (cv_.wait_for(lock, interval, [this]() { return stopping_; })) {
          return;
        }
      }
      if (!tick()) {
        finish();
        return;
      }
    }
  }

  void finish() {
    std::lock_guard<std::mutex> lock(mu_);
    finished_ = true;
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::thread thread_;
  bool stopping_ = false;
  bool finished_ = false;
};

} // namespace agentlink

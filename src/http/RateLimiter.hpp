#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

// Per-client request budget: `threshold` requests per `reset_after` window,
// the window starting at a client's first request. Shared between the
// server's worker threads.
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(int threshold = 5,
              Clock::duration reset_after = std::chrono::minutes(5))
      : threshold_(threshold), reset_after_(reset_after) {}

  // true if the request may proceed (and is counted)
  bool allow(const std::string &client, Clock::time_point now = Clock::now()) {
    std::lock_guard<std::mutex> lock(mu_);
    // sweep idle clients at most once per window
    if (now - last_sweep_ >= reset_after_) {
      pruneLocked(now);
      last_sweep_ = now;
    }
    auto it = clients_.find(client);
    if (it == clients_.end()) {
      clients_[client] = ClientInfo{1, now, now};
      return true;
    }
    ClientInfo &info = it->second;
    if (now - info.window_start >= reset_after_) {
      info.count = 0;
      info.window_start = now;
    }
    if (info.count >= threshold_)
      return false;
    info.count++;
    info.last_seen = now;
    return true;
  }

  // Drop clients idle for a full window
  void prune(Clock::time_point now = Clock::now()) {
    std::lock_guard<std::mutex> lock(mu_);
    pruneLocked(now);
  }

  size_t tracked() const {
    std::lock_guard<std::mutex> lock(mu_);
    return clients_.size();
  }

private:
  struct ClientInfo {
    int count = 0;
    Clock::time_point window_start;
    Clock::time_point last_seen;
  };

  void pruneLocked(Clock::time_point now) {
    for (auto it = clients_.begin(); it != clients_.end();) {
      if (now - it->second.last_seen >= reset_after_)
        it = clients_.erase(it);
      else
        ++it;
    }
  }

  int threshold_;
  Clock::duration reset_after_;
  Clock::time_point last_sweep_ = Clock::now();
  mutable std::mutex mu_;
  std::unordered_map<std::string, ClientInfo> clients_;
};

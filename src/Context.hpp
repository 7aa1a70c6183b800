#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

// Cancellation token with an optional deadline. Copies share state, so a
// Context handed to a blocked call can be cancelled from another thread.
class Context {
 public:
  using Clock = std::chrono::steady_clock;

  enum class State { Active, Cancelled, DeadlineExceeded };

  static Context Background();
  static Context WithCancel();
  static Context WithTimeout(std::chrono::milliseconds timeout);
  static Context WithDeadline(Clock::time_point deadline);

  /// Idempotent. Runs every subscribed callback exactly once.
  void Cancel();

  bool Done() const;
  State Err() const;
  std::optional<Clock::time_point> Deadline() const;

  // Callbacks run on the cancelling thread without the context lock held.
  // If the context is already cancelled the callback runs immediately and 0
  // is returned.
  std::size_t Subscribe(std::function<void()> fn) const;
  void Unsubscribe(std::size_t id) const;

 private:
  struct Shared {
    std::mutex m;
    bool cancelled{false};
    std::optional<Clock::time_point> deadline;
    std::size_t next_id{1};
    std::map<std::size_t, std::function<void()>> subscribers;
  };

  explicit Context(std::optional<Clock::time_point> deadline);

  std::shared_ptr<Shared> shared_;
};

const char* ToString(Context::State s);

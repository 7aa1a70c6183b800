#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "Context.hpp"

class GateError : public std::runtime_error {
 public:
  enum class Kind { Cancelled, DeadlineExceeded, Overweight };

  GateError(Kind kind, const std::string& what)
      : std::runtime_error(what), kind_{kind} {
  }

  Kind GetKind() const noexcept {
    return kind_;
  }

 private:
  Kind kind_;
};

// Weighted counting gate. Waiters are served in arrival order: a waiter that
// does not fit blocks everyone queued behind it.
class Gate {
 public:
  explicit Gate(std::int64_t capacity);
  Gate(const Gate&) = delete;
  Gate& operator=(const Gate&) = delete;

  /// Blocks until `weight` is granted. Throws GateError when the context is
  /// cancelled or past its deadline, or when `weight` exceeds the capacity.
  void Acquire(std::int64_t weight, const Context& ctx);

  /// Grants `weight` only if it fits now and nobody is queued.
  bool TryAcquire(std::int64_t weight);

  void Release(std::int64_t weight);

  std::int64_t Capacity() const noexcept {
    return capacity_;
  }

  std::int64_t Held() const;

  std::size_t Waiters() const;

 private:
  struct Waiter {
    std::int64_t weight;
    bool ready{false};
  };

  // Outlives the Gate while a cancellation callback may still touch it.
  struct State {
    std::mutex m;
    std::condition_variable cv;
    std::int64_t held{0};
    std::list<Waiter*> waiters;
  };

  void NotifyWaiters(State& st);  // caller holds st.m

  const std::int64_t capacity_;
  std::shared_ptr<State> state_;
};

// Returns a granted weight to the gate when it goes out of scope. A failed
// release is logged, never thrown.
class GateLease {
 public:
  GateLease(Gate& gate, std::int64_t weight) : gate_{gate}, weight_{weight} {
  }
  GateLease(const GateLease&) = delete;
  GateLease& operator=(const GateLease&) = delete;
  ~GateLease();

 private:
  Gate& gate_;
  std::int64_t weight_;
};

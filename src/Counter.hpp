#pragma once

#include <cstdint>
#include <shared_mutex>
#include <stdexcept>
#include <string>

class CounterError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Named bounded counter. Mutations are exclusive, reads are shared.
class Counter {
 public:
  enum class Policy {
    Saturate,  // throw and leave the count alone at either bound
    Rollover   // wrap to zero past max, ignore removals below zero
  };

  Counter(std::string name, std::int64_t maximum, Policy policy);
  Counter(const Counter&) = delete;
  Counter& operator=(const Counter&) = delete;

  /// Rollover past the maximum restarts from zero and still adds, so a
  /// counter at max reads `n` afterwards.
  void Add(std::int64_t n = 1);
  void Remove(std::int64_t n = 1);

  std::int64_t Read() const;

  std::int64_t Maximum() const noexcept {
    return max_;
  }
  const std::string& Name() const noexcept {
    return name_;
  }
  Policy GetPolicy() const noexcept {
    return policy_;
  }

 private:
  const std::string name_;
  const std::int64_t max_;
  const Policy policy_;
  mutable std::shared_mutex m_;
  std::int64_t count_{0};
};

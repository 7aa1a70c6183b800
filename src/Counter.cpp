#include "Counter.hpp"

#include <mutex>
#include <utility>

#include "Logger.hpp"

Counter::Counter(std::string name, std::int64_t maximum, Policy policy)
    : name_{std::move(name)}, max_{maximum}, policy_{policy} {
  if (max_ < 1) {
    throw std::invalid_argument("Counter " + name_ +
                                ": maximum must be at least 1");
  }
}

void Counter::Add(std::int64_t n) {
  if (n < 0 || n > max_) {
    throw std::invalid_argument("Counter " + name_ + ": bad increment " +
                                std::to_string(n));
  }
  std::unique_lock<std::shared_mutex> lk(m_);
  if (count_ > max_ - n) {
    if (policy_ == Policy::Saturate) {
      throw CounterError("counter " + name_ + " is at its maximum of " +
                         std::to_string(max_));
    }
    count_ = 0;
  }
  count_ += n;
}

void Counter::Remove(std::int64_t n) {
  if (n < 0) {
    throw std::invalid_argument("Counter " + name_ + ": bad decrement " +
                                std::to_string(n));
  }
  std::unique_lock<std::shared_mutex> lk(m_);
  if (count_ < n) {
    if (policy_ == Policy::Saturate) {
      throw CounterError("counter " + name_ + " cannot go below zero (at " +
                         std::to_string(count_) + ", removing " +
                         std::to_string(n) + ")");
    }
#ifndef NDEBUG
    logr::debug << "[Counter] " << name_ << ": ignored removal of " << n
                << " at " << count_;
#endif
    return;
  }
  count_ -= n;
}

std::int64_t Counter::Read() const {
  std::shared_lock<std::shared_mutex> lk(m_);
  return count_;
}

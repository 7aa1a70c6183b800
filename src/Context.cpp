#include "Context.hpp"

#include <utility>

Context::Context(std::optional<Clock::time_point> deadline)
    : shared_{std::make_shared<Shared>()} {
  shared_->deadline = deadline;
}

Context Context::Background() {
  return Context{std::nullopt};
}

Context Context::WithCancel() {
  return Context{std::nullopt};
}

Context Context::WithTimeout(std::chrono::milliseconds timeout) {
  return Context{Clock::now() + timeout};
}

Context Context::WithDeadline(Clock::time_point deadline) {
  return Context{deadline};
}

void Context::Cancel() {
  std::map<std::size_t, std::function<void()>> fire;
  {
    std::lock_guard<std::mutex> lk(shared_->m);
    if (shared_->cancelled)
      return;
    shared_->cancelled = true;
    fire.swap(shared_->subscribers);
  }
  for (auto& entry : fire) {
    entry.second();
  }
}

bool Context::Done() const {
  return Err() != State::Active;
}

Context::State Context::Err() const {
  std::lock_guard<std::mutex> lk(shared_->m);
  if (shared_->cancelled)
    return State::Cancelled;
  if (shared_->deadline && Clock::now() >= *shared_->deadline)
    return State::DeadlineExceeded;
  return State::Active;
}

std::optional<Context::Clock::time_point> Context::Deadline() const {
  std::lock_guard<std::mutex> lk(shared_->m);
  return shared_->deadline;
}

std::size_t Context::Subscribe(std::function<void()> fn) const {
  {
    std::lock_guard<std::mutex> lk(shared_->m);
    if (!shared_->cancelled) {
      std::size_t id = shared_->next_id++;
      shared_->subscribers.emplace(id, std::move(fn));
      return id;
    }
  }
  fn();
  return 0;
}

void Context::Unsubscribe(std::size_t id) const {
  if (id == 0)
    return;
  std::lock_guard<std::mutex> lk(shared_->m);
  shared_->subscribers.erase(id);
}

const char* ToString(Context::State s) {
  switch (s) {
    case Context::State::Active:
      return "active";
    case Context::State::Cancelled:
      return "context cancelled";
    case Context::State::DeadlineExceeded:
      return "context deadline exceeded";
  }
  return "unknown";
}

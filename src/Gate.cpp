#include "Gate.hpp"

#include "Logger.hpp"

namespace {
GateError::Kind KindFor(Context::State s) {
  return s == Context::State::DeadlineExceeded
           ? GateError::Kind::DeadlineExceeded
           : GateError::Kind::Cancelled;
}
}  // namespace

Gate::Gate(std::int64_t capacity)
    : capacity_{capacity}, state_{std::make_shared<State>()} {
  if (capacity_ < 1) {
    throw std::invalid_argument("Gate: capacity must be at least 1");
  }
}

void Gate::Acquire(std::int64_t weight, const Context& ctx) {
  if (weight < 1) {
    throw std::invalid_argument("Gate: weight must be at least 1");
  }
  if (weight > capacity_) {
    throw GateError(GateError::Kind::Overweight,
                    "Gate: weight " + std::to_string(weight) +
                      " exceeds capacity " + std::to_string(capacity_));
  }
  if (auto s = ctx.Err(); s != Context::State::Active) {
    throw GateError(KindFor(s), ToString(s));
  }

  std::shared_ptr<State> st = state_;

  // wake this waiter promptly when its context is cancelled
  std::size_t sub = ctx.Subscribe([st] {
    std::lock_guard<std::mutex> lk(st->m);
    st->cv.notify_all();
  });

  std::unique_lock<std::mutex> lk(st->m);

  if (capacity_ - st->held >= weight && st->waiters.empty()) {
    st->held += weight;
    lk.unlock();
    ctx.Unsubscribe(sub);
    return;
  }

  Waiter self{weight};
  auto it = st->waiters.insert(st->waiters.end(), &self);

  IF_DEBUG {
    logr::debug << "[Gate] queued weight " << weight << " behind "
                << st->waiters.size() - 1 << " waiter(s)";
  }

  auto settled = [&] { return self.ready || ctx.Done(); };
  if (auto deadline = ctx.Deadline(); deadline.has_value()) {
    st->cv.wait_until(lk, *deadline, settled);
  } else {
    st->cv.wait(lk, settled);
  }

  if (self.ready) {
    // granted, even if the context fired at the same moment
    lk.unlock();
    ctx.Unsubscribe(sub);
    return;
  }

  bool was_front = st->waiters.begin() == it;
  st->waiters.erase(it);
  if (was_front && capacity_ > st->held) {
    NotifyWaiters(*st);
  }
  lk.unlock();
  ctx.Unsubscribe(sub);

  auto s = ctx.Err();
  if (s == Context::State::Active) {
    // wait_until can return on the deadline a hair before Err() agrees
    s = Context::State::DeadlineExceeded;
  }
  throw GateError(KindFor(s), ToString(s));
}

bool Gate::TryAcquire(std::int64_t weight) {
  if (weight < 1) {
    throw std::invalid_argument("Gate: weight must be at least 1");
  }
  std::lock_guard<std::mutex> lk(state_->m);
  if (capacity_ - state_->held >= weight && state_->waiters.empty()) {
    state_->held += weight;
    return true;
  }
  return false;
}

void Gate::Release(std::int64_t weight) {
  std::lock_guard<std::mutex> lk(state_->m);
  if (weight < 1 || weight > state_->held) {
    throw std::logic_error("Gate: released " + std::to_string(weight) +
                           " but only " + std::to_string(state_->held) +
                           " is held");
  }
  state_->held -= weight;
  NotifyWaiters(*state_);
}

GateLease::~GateLease() {
  try {
    gate_.Release(weight_);
  } catch (const std::logic_error& e) {
    logr::error << "[Gate] lease release failed: " << e.what();
  }
}

std::int64_t Gate::Held() const {
  std::lock_guard<std::mutex> lk(state_->m);
  return state_->held;
}

std::size_t Gate::Waiters() const {
  std::lock_guard<std::mutex> lk(state_->m);
  return state_->waiters.size();
}

void Gate::NotifyWaiters(State& st) {
  bool granted = false;
  while (!st.waiters.empty()) {
    Waiter* w = st.waiters.front();
    if (capacity_ - st.held < w->weight) {
      // FIFO: do not let smaller waiters overtake the head
      break;
    }
    st.held += w->weight;
    w->ready = true;
    st.waiters.pop_front();
    granted = true;
  }
  if (granted) {
    st.cv.notify_all();
  }
}

#include "RequestHandler.hpp"
#include "CurlTransport.hpp"
#include "Logger.hpp"

#include <limits>
#include <string>
#include <utility>

namespace {
std::string Describe(const std::exception_ptr& ep) {
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

void Append(std::string& into, const std::string& msg) {
  if (!into.empty())
    into += "; ";
  into += msg;
}

AdmissionError::Kind KindFor(GateError::Kind k) {
  switch (k) {
    case GateError::Kind::DeadlineExceeded:
      return AdmissionError::Kind::AdmissionTimeout;
    case GateError::Kind::Overweight:
      return AdmissionError::Kind::OverweightRequest;
    case GateError::Kind::Cancelled:
      break;
  }
  return AdmissionError::Kind::AdmissionCancelled;
}
}  // namespace

RequestHandler::RequestHandler(std::int64_t total_weight,
                               std::chrono::milliseconds timeout,
                               ExecuteFn execute,
                               std::int64_t max_waiting_weight) {
  if (total_weight < 1) {
    logr::warning << "[RequestHandler] total weight " << total_weight
                  << " raised to 1";
    total_weight = 1;
  } else if (total_weight > kMaxTotalWeight) {
    logr::warning << "[RequestHandler] total weight " << total_weight
                  << " lowered to " << kMaxTotalWeight;
    total_weight = kMaxTotalWeight;
  }

  if (timeout < kMinTimeout || timeout > kMaxTimeout) {
    logr::warning << "[RequestHandler] timeout " << timeout.count()
                  << "ms out of range; using " << kDefaultTimeout.count()
                  << "ms";
    timeout = kDefaultTimeout;
  }
  timeout_ = timeout;

  // a single request of the full capacity must be able to queue
  if (max_waiting_weight < total_weight) {
    max_waiting_weight = total_weight;
  }

  constexpr auto kUnbounded = std::numeric_limits<std::int64_t>::max();

  gate_ = std::make_shared<Gate>(total_weight);
  waiting_ = std::make_shared<Counter>("waiting", max_waiting_weight,
                                       Counter::Policy::Saturate);
  in_flight_ = std::make_shared<Counter>("in-flight", total_weight,
                                         Counter::Policy::Saturate);
  completed_ = std::make_shared<Counter>("completed", kUnbounded,
                                         Counter::Policy::Rollover);
  errors_ =
    std::make_shared<Counter>("errors", kUnbounded, Counter::Policy::Rollover);

  if (execute) {
    execute_ = std::move(execute);
  } else {
    execute_ = CurlTransport{};
  }
}

RequestHandler RequestHandler::FromConfig(const Config& conf,
                                          ExecuteFn execute) {
  if (!execute) {
    execute = CurlTransport{conf.GetTransportOptions()};
  }
  return RequestHandler(conf.GetTotalWeight(), conf.GetTimeout(),
                        std::move(execute), conf.GetMaxWaitingWeight());
}

HttpResponse RequestHandler::Execute(
  const std::shared_ptr<const HttpRequest>& request) const {
  return ExecuteWeighted(request, 1);
}

HttpResponse RequestHandler::ExecuteWeighted(
  const std::shared_ptr<const HttpRequest>& request,
  std::int64_t weight) const {
  return ExecuteWeightedWithContext(request, weight,
                                    Context::WithTimeout(timeout_));
}

HttpResponse RequestHandler::ExecuteWeightedWithContext(
  const std::shared_ptr<const HttpRequest>& request, std::int64_t weight,
  const Context& ctx) const {
  if (!request) {
    throw AdmissionError(AdmissionError::Kind::InvalidRequest,
                         "Request is nil");
  }
  if (!request->IsValid()) {
    throw AdmissionError(AdmissionError::Kind::InvalidRequest,
                         "Request has no method or URL");
  }

  if (weight < 1)
    weight = 1;
  if (weight > kMaxTotalWeight) {
    throw AdmissionError(AdmissionError::Kind::OverweightRequest,
                         "weight " + std::to_string(weight) +
                           " exceeds the supported maximum of " +
                           std::to_string(kMaxTotalWeight));
  }

  CheckStruct();

  if (weight > gate_->Capacity()) {
    throw AdmissionError(AdmissionError::Kind::OverweightRequest,
                         "weight " + std::to_string(weight) +
                           " exceeds total weight " +
                           std::to_string(gate_->Capacity()));
  }

  // the call holds its gate and counters until it returns
  std::shared_ptr<Gate> gate = gate_;
  std::shared_ptr<Counter> waiting = waiting_;
  std::shared_ptr<Counter> in_flight = in_flight_;
  std::shared_ptr<Counter> completed = completed_;
  std::shared_ptr<Counter> errors = errors_;

  try {
    waiting->Add(weight);
  } catch (const CounterError& e) {
    throw AdmissionError(AdmissionError::Kind::TooManyWaiters, e.what());
  }

  try {
    gate->Acquire(weight, ctx);
  } catch (const GateError& e) {
    std::string msg = std::string("admission failed: ") + e.what();
    try {
      waiting->Remove(weight);
    } catch (const CounterError& ce) {
      Append(msg, ce.what());
    }
    IF_DEBUG {
      logr::debug << "[RequestHandler] " << msg;
    }
    throw AdmissionError(KindFor(e.GetKind()), msg);
  } catch (...) {
    waiting->Remove(weight);
    throw;
  }

  IF_DEBUG {
    logr::debug << "[RequestHandler] admitted " << request->method << " "
                << request->url << " weight " << weight;
  }

  std::string inconsistency;
  HttpResponse resp;
  std::exception_ptr failure;
  {
    // returns the weight on every path out of this block
    GateLease lease{*gate, weight};

    try {
      waiting->Remove(weight);
    } catch (const CounterError& e) {
      Append(inconsistency, e.what());
    }

    bool counted = false;
    try {
      in_flight->Add(weight);
      counted = true;
    } catch (const CounterError& e) {
      Append(inconsistency, e.what());
    }

    try {
      resp = execute_(*request);
    } catch (...) {
      failure = std::current_exception();
    }

    if (counted) {
      try {
        in_flight->Remove(weight);
      } catch (const CounterError& e) {
        Append(inconsistency, e.what());
      }
    }
  }

  if (!failure) {
    completed->Add();
    if (!inconsistency.empty()) {
      throw AdmissionError(AdmissionError::Kind::InternalConsistencyError,
                           "counter accounting failed: " + inconsistency);
    }
    return resp;
  }

  errors->Add();
  std::string what = "execution failed: " + Describe(failure);
  if (!inconsistency.empty()) {
    throw AdmissionError(AdmissionError::Kind::InternalConsistencyError,
                         what + "; counter accounting failed: " +
                           inconsistency,
                         failure);
  }
  throw AdmissionError(AdmissionError::Kind::ExecutionError, what, failure);
}

void RequestHandler::CheckStruct() const {
  auto missing = [](const char* what) {
    return AdmissionError(
      AdmissionError::Kind::NotInitialized,
      std::string("nil ") + what +
        ", use the RequestHandler constructor to build the handler");
  };
  if (!execute_)
    throw missing("execution capability");
  if (!gate_)
    throw missing("gate");
  if (!waiting_)
    throw missing("waiting counter");
  if (!in_flight_)
    throw missing("in-flight counter");
  if (!completed_)
    throw missing("completed counter");
  if (!errors_)
    throw missing("error counter");
}

std::int64_t RequestHandler::WaitingWeight() const {
  return waiting_ ? waiting_->Read() : 0;
}

std::int64_t RequestHandler::InFlightWeight() const {
  return in_flight_ ? in_flight_->Read() : 0;
}

std::int64_t RequestHandler::CompletedCount() const {
  return completed_ ? completed_->Read() : 0;
}

std::int64_t RequestHandler::ErrorCount() const {
  return errors_ ? errors_->Read() : 0;
}

std::int64_t RequestHandler::TotalWeight() const {
  return gate_ ? gate_->Capacity() : 0;
}

std::chrono::milliseconds RequestHandler::Timeout() const {
  return timeout_;
}

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "AdmissionError.hpp"
#include "Config.hpp"
#include "Context.hpp"
#include "Counter.hpp"
#include "Gate.hpp"
#include "HttpRequest.hpp"
#include "HttpResponse.hpp"

/*
  Weighted admission in front of an HTTP client.

  At most TotalWeight() units of request weight run through the execution
  capability at once. Callers that do not fit queue on the gate until
  weight is released, their context is cancelled, or its deadline passes.
  Light requests should use small weights, large uploads or downloads
  larger ones.

  Every failure is thrown as AdmissionError. A failed call never leaves
  weight behind in the waiting or in-flight counters.
*/
class RequestHandler {
 public:
  using ExecuteFn = std::function<HttpResponse(const HttpRequest&)>;

  static constexpr std::int64_t kMaxTotalWeight{1 << 20};
  static constexpr std::chrono::milliseconds kDefaultTimeout{
    std::chrono::minutes{1}};
  static constexpr std::chrono::milliseconds kMinTimeout{
    std::chrono::seconds{1}};
  static constexpr std::chrono::milliseconds kMaxTimeout{
    std::chrono::hours{1}};

  // Not initialized; every Execute call fails with NotInitialized.
  RequestHandler() = default;

  // total_weight is clamped to [1, kMaxTotalWeight]; a timeout outside
  // [1s, 1h] becomes kDefaultTimeout; an empty execute uses CurlTransport.
  RequestHandler(std::int64_t total_weight, std::chrono::milliseconds timeout,
                 ExecuteFn execute = {},
                 std::int64_t max_waiting_weight =
                   Config::kDefaultMaxWaitingWeight);

  static RequestHandler FromConfig(const Config& conf, ExecuteFn execute = {});

  RequestHandler(RequestHandler&&) = default;
  RequestHandler& operator=(RequestHandler&&) = default;
  RequestHandler(const RequestHandler&) = delete;
  RequestHandler& operator=(const RequestHandler&) = delete;

  /// Weight 1, admission bounded by the default timeout.
  HttpResponse Execute(const std::shared_ptr<const HttpRequest>& request) const;

  /// Admission bounded by the default timeout.
  HttpResponse ExecuteWeighted(
    const std::shared_ptr<const HttpRequest>& request,
    std::int64_t weight) const;

  /// Admission bounded by `ctx`. The context does not reach the execution
  /// capability; bound the transfer with HttpRequest::timeout.
  HttpResponse ExecuteWeightedWithContext(
    const std::shared_ptr<const HttpRequest>& request, std::int64_t weight,
    const Context& ctx) const;

  std::int64_t WaitingWeight() const;
  std::int64_t InFlightWeight() const;
  std::int64_t CompletedCount() const;
  std::int64_t ErrorCount() const;

  std::int64_t TotalWeight() const;
  std::chrono::milliseconds Timeout() const;

 private:
  void CheckStruct() const;

  std::shared_ptr<Gate> gate_;
  std::shared_ptr<Counter> waiting_;
  std::shared_ptr<Counter> in_flight_;
  std::shared_ptr<Counter> completed_;
  std::shared_ptr<Counter> errors_;
  std::chrono::milliseconds timeout_{kDefaultTimeout};
  ExecuteFn execute_;
};

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

class AdmissionError : public std::runtime_error {
 public:
  enum class Kind {
    InvalidRequest,
    NotInitialized,
    OverweightRequest,
    TooManyWaiters,
    AdmissionTimeout,
    AdmissionCancelled,
    ExecutionError,
    InternalConsistencyError
  };

  AdmissionError(Kind kind, const std::string& what,
                 std::exception_ptr cause = nullptr)
      : std::runtime_error(what), kind_{kind}, cause_{std::move(cause)} {
  }

  Kind GetKind() const noexcept {
    return kind_;
  }

  /// The execution capability's original exception, when there was one.
  std::exception_ptr GetCause() const noexcept {
    return cause_;
  }

 private:
  Kind kind_;
  std::exception_ptr cause_;
};

inline const char* ToString(AdmissionError::Kind k) {
  switch (k) {
    case AdmissionError::Kind::InvalidRequest:
      return "InvalidRequest";
    case AdmissionError::Kind::NotInitialized:
      return "NotInitialized";
    case AdmissionError::Kind::OverweightRequest:
      return "OverweightRequest";
    case AdmissionError::Kind::TooManyWaiters:
      return "TooManyWaiters";
    case AdmissionError::Kind::AdmissionTimeout:
      return "AdmissionTimeout";
    case AdmissionError::Kind::AdmissionCancelled:
      return "AdmissionCancelled";
    case AdmissionError::Kind::ExecutionError:
      return "ExecutionError";
    case AdmissionError::Kind::InternalConsistencyError:
      return "InternalConsistencyError";
  }
  return "Unknown";
}

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include "HttpRequest.hpp"
#include "HttpResponse.hpp"

class TransportError : public std::runtime_error {
 public:
  TransportError(const std::string& what, int curl_code)
      : std::runtime_error(what), curl_code_{curl_code} {
  }

  int GetCurlCode() const noexcept {
    return curl_code_;
  }

 private:
  int curl_code_;
};

struct TransportOptions {
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds timeout{45000};
  std::string user_agent{"reqgate/1.0"};
  std::string ca_info;  // empty: libcurl's built-in trust store
  bool follow_redirects{true};
  long max_redirects{10};
  bool verbose{false};
};

// Default execution capability: one libcurl easy handle per request.
// Safe to call from many threads at once.
class CurlTransport {
 public:
  CurlTransport();
  explicit CurlTransport(TransportOptions options);

  /// Throws TransportError when libcurl reports a failure. HTTP error
  /// statuses are not failures; check HttpResponse::IsOkay().
  HttpResponse operator()(const HttpRequest& request) const;

  /// GET and HEAD may be sent again over HTTP/1.1 after an HTTP/2 failure.
  static bool IsReplayable(const std::string& method);

  const TransportOptions& GetOptions() const noexcept {
    return options_;
  }

 private:
  static size_t WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                  void* userdata);
  static size_t WriteHeaderCallback(char* ptr, size_t size, size_t nmemb,
                                    void* userdata);

  TransportOptions options_;
};

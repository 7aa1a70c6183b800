#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

// Plain request value handed to the execution capability.
struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  // 0 leaves the transport's configured transfer timeout in place
  std::chrono::milliseconds timeout{0};

  HttpRequest() = default;
  explicit HttpRequest(std::string u, std::string m = "GET")
      : method{std::move(m)}, url{std::move(u)} {
  }

  bool IsValid() const {
    return !url.empty() && !method.empty();
  }
};

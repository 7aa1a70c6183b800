#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

class HttpResponse {
 public:
  HttpResponse() = default;

  /// Parse one raw header line (e.g. "Content-Type: text/html")
  void AddHeaderLine(const std::string& line);

  /// Append to the response body
  void AppendBody(const char* data, size_t len);

  /// Return the first header value matching `key` (case‑insensitive)
  std::optional<std::string> GetHeader(const std::string& key) const;

  /// Return all header values matching `key` (case‑insensitive)
  std::vector<std::string> GetHeaders(const std::string& key) const;

  /// All parsed header (name,value) pairs in order received
  const std::vector<std::pair<std::string, std::string>>& GetHeaders() const;

  const std::string& GetBody() const;

  void SetStatusCode(long http_status);
  long GetStatusCode() const;

  void SetRedirectCount(long c);
  long GetRedirectCount() const;

  /// The URL after any redirects
  void SetEffectiveUrl(std::string url);
  const std::string& GetEffectiveUrl() const;

  /// HTTP status code is 200 to 299
  bool IsOkay() const;

  /// HTTP status code is 300 to 399
  bool IsRedirect() const;

 private:
  std::vector<std::pair<std::string, std::string>> headers_;
  std::string body_;
  long status_code_{0};
  long redirect_count_{0};
  std::string effective_url_;
};

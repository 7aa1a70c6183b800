#include "CurlTransport.hpp"
#include "Logger.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <utility>

namespace {
void GlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
      throw TransportError(
        std::string("curl_global_init failed: ") + curl_easy_strerror(code),
        static_cast<int>(code));
    }
  });
}

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
}  // namespace

CurlTransport::CurlTransport() : CurlTransport(TransportOptions{}) {
}

CurlTransport::CurlTransport(TransportOptions options)
    : options_{std::move(options)} {
  GlobalInit();
}

HttpResponse CurlTransport::operator()(const HttpRequest& request) const {
  EasyHandle curl{curl_easy_init(), &curl_easy_cleanup};

  if (!curl) {
    throw TransportError("[CurlTransport] failed to init CURL",
                         static_cast<int>(CURLE_FAILED_INIT));
  }
  CURL* h = curl.get();

  auto timeout = request.timeout.count() > 0 ? request.timeout
                                             : options_.timeout;

  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);  // thread-safe timeouts on *nix
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(options_.connect_timeout.count()));
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
  curl_easy_setopt(h, CURLOPT_TCP_KEEPIDLE, 60L);
  curl_easy_setopt(h, CURLOPT_TCP_KEEPINTVL, 60L);

  if (!options_.user_agent.empty()) {
    curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
  }

  curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());

  if (options_.follow_redirects) {
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    // Cap the redirect chain to avoid loops
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(h, CURLOPT_AUTOREFERER, 1L);
  }

  curl_easy_setopt(h, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

  // Auto-decompress gzip/br (server dependent)
  curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");

  curl_easy_setopt(h, CURLOPT_VERBOSE, options_.verbose ? 1L : 0L);

  if (!options_.ca_info.empty()) {
    curl_easy_setopt(h, CURLOPT_CAINFO, options_.ca_info.c_str());
  }
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);

  // an empty POST still needs POSTFIELDS or libcurl reads stdin
  if (!request.body.empty() || request.method == "POST") {
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
  }
  if (request.method == "HEAD") {
    curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
  } else if (request.method != "GET" && request.method != "POST") {
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }

  HeaderList headers{nullptr, &curl_slist_free_all};
  for (const auto& [name, value] : request.headers) {
    std::string line = name + ": " + value;
    curl_slist* next = curl_slist_append(headers.get(), line.c_str());
    if (!next) {
      throw TransportError("[CurlTransport] failed to build header list",
                           static_cast<int>(CURLE_OUT_OF_MEMORY));
    }
    headers.release();
    headers.reset(next);
  }
  if (headers) {
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  }

  HttpResponse resp;

  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteBodyCallback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp);
  curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, WriteHeaderCallback);
  curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp);

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

  CURLcode code = curl_easy_perform(h);

  if ((code == CURLE_HTTP2_STREAM || code == CURLE_HTTP2) &&
      !IsReplayable(request.method)) {
    std::string msg = std::string("[CurlTransport] ") + request.method + " " +
                      request.url + ": " + curl_easy_strerror(code) +
                      "; not retried, the request may have been sent";
    logr::warning << msg;
    throw TransportError(msg, static_cast<int>(code));
  }
  if (code == CURLE_HTTP2_STREAM || code == CURLE_HTTP2) {
    logr::warning << "[CurlTransport] HTTP 2.0 error; retry HTTP 1.1 for: "
                  << request.url;
    resp = HttpResponse{};
    errbuf[0] = '\0';
    curl_easy_setopt(h, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    code = curl_easy_perform(h);
  }

  if (code != CURLE_OK) {
    std::string msg = std::string("[CurlTransport] ") + request.method + " " +
                      request.url + ": " + curl_easy_strerror(code);
    if (errbuf[0])
      msg += std::string(" (") + errbuf + ")";
    logr::warning << msg;
    throw TransportError(msg, static_cast<int>(code));
  }

  // Get response meta data
  {
    long http_code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_code);
    resp.SetStatusCode(http_code);

    long redirect_count = 0;
    curl_easy_getinfo(h, CURLINFO_REDIRECT_COUNT, &redirect_count);
    resp.SetRedirectCount(redirect_count);

    char* effective_url = nullptr;
    curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url)
      resp.SetEffectiveUrl(effective_url);
  }

  return resp;
}

bool CurlTransport::IsReplayable(const std::string& method) {
  return method == "GET" || method == "HEAD";
}

size_t CurlTransport::WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                        void* userdata) {
  auto* resp = static_cast<HttpResponse*>(userdata);
  resp->AppendBody(ptr, size * nmemb);
  return size * nmemb;
}

size_t CurlTransport::WriteHeaderCallback(char* ptr, size_t size,
                                          size_t nmemb, void* userdata) {
  auto* resp = static_cast<HttpResponse*>(userdata);
  // ptr may include the “\r\n” at the end
  std::string line(ptr, size * nmemb);
  resp->AddHeaderLine(line);
  return size * nmemb;
}

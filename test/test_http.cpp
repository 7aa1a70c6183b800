#include <gtest/gtest.h>
#include "CurlTransport.hpp"
#include "HttpResponse.hpp"
#include "RequestHandler.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

TEST(HttpResponseTest, ParsesHeaderLines) {
  SCOPED_TRACE("Raw header lines become trimmed name/value pairs.");
  RecordProperty("description",
                 "Status lines are skipped, whitespace is trimmed, lookups "
                 "are case-insensitive and repeated headers are kept.");

  HttpResponse r;
  r.AddHeaderLine("HTTP/1.1 200 OK\r\n");
  r.AddHeaderLine("Content-Type:  text/html \r\n");
  r.AddHeaderLine("Set-Cookie: a=1\r\n");
  r.AddHeaderLine("set-cookie: b=2\r\n");
  r.AddHeaderLine("\r\n");

  EXPECT_EQ(r.GetHeaders().size(), 3u);
  ASSERT_TRUE(r.GetHeader("content-type").has_value());
  EXPECT_EQ(*r.GetHeader("content-type"), "text/html");
  EXPECT_FALSE(r.GetHeader("X-Missing").has_value());

  auto cookies = r.GetHeaders("SET-COOKIE");
  ASSERT_EQ(cookies.size(), 2u);
  EXPECT_EQ(cookies[0], "a=1");
  EXPECT_EQ(cookies[1], "b=2");
}

TEST(HttpResponseTest, StatusClasses) {
  SCOPED_TRACE("Status helpers classify 2xx and 3xx.");
  RecordProperty("description",
                 "204 is okay, 302 is a redirect, 500 is neither.");

  HttpResponse r;
  r.SetStatusCode(204);
  EXPECT_TRUE(r.IsOkay());
  EXPECT_FALSE(r.IsRedirect());
  r.SetStatusCode(302);
  EXPECT_TRUE(r.IsRedirect());
  r.SetStatusCode(500);
  EXPECT_FALSE(r.IsOkay());
  EXPECT_FALSE(r.IsRedirect());
  EXPECT_EQ(r.GetStatusCode(), 500);
}

class CurlTransportTest : public ::testing::Test {
 protected:
  fs::path file_;

  void SetUp() override {
    file_ = fs::temp_directory_path() /
            ("reqgate_http_test_" + std::to_string(::getpid()) + ".txt");
    std::ofstream out(file_, std::ios::trunc);
    out << "hello from disk\n";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove(file_, ec);
  }

  std::string FileUrl() const {
    return "file://" + file_.string();
  }
};

TEST_F(CurlTransportTest, ReadsLocalFile) {
  SCOPED_TRACE("The transport performs a transfer and captures the body.");
  RecordProperty("description",
                 "A file:// request through CurlTransport returns the file "
                 "contents as the body.");

  CurlTransport transport;
  auto resp = transport(HttpRequest(FileUrl()));

  EXPECT_EQ(resp.GetBody(), "hello from disk\n");
  EXPECT_EQ(resp.GetRedirectCount(), 0);
}

TEST_F(CurlTransportTest, UnsupportedSchemeThrows) {
  SCOPED_TRACE("libcurl failures are thrown as TransportError.");
  RecordProperty("description",
                 "A URL with an unknown scheme throws TransportError with a "
                 "non-zero curl code.");

  CurlTransport transport;
  try {
    transport(HttpRequest("nosuchscheme://example.invalid/"));
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_NE(e.GetCurlCode(), 0);
    EXPECT_NE(std::string(e.what()).find("nosuchscheme"), std::string::npos);
  }
}

TEST_F(CurlTransportTest, HandlerUsesDefaultTransport) {
  SCOPED_TRACE("Without a capability the handler falls back to libcurl.");
  RecordProperty("description",
                 "A handler built without an execute function fetches a "
                 "file:// URL and wraps a curl failure as ExecutionError.");

  RequestHandler rh(2, 5s);

  auto resp = rh.Execute(std::make_shared<const HttpRequest>(FileUrl()));
  EXPECT_EQ(resp.GetBody(), "hello from disk\n");
  EXPECT_EQ(rh.CompletedCount(), 1);

  try {
    rh.Execute(
      std::make_shared<const HttpRequest>("nosuchscheme://example.invalid/"));
    FAIL() << "expected AdmissionError";
  } catch (const AdmissionError& e) {
    EXPECT_EQ(e.GetKind(), AdmissionError::Kind::ExecutionError);
    EXPECT_THROW(std::rethrow_exception(e.GetCause()), TransportError);
  }
  EXPECT_EQ(rh.ErrorCount(), 1);
  EXPECT_EQ(rh.InFlightWeight(), 0);
}

TEST(CurlTransportReplayTest, OnlySafeMethodsAreReplayable) {
  SCOPED_TRACE("The HTTP/1.1 fallback is limited to GET and HEAD.");
  RecordProperty("description",
                 "IsReplayable is true for GET and HEAD and false for methods "
                 "that may change server state.");

  EXPECT_TRUE(CurlTransport::IsReplayable("GET"));
  EXPECT_TRUE(CurlTransport::IsReplayable("HEAD"));
  EXPECT_FALSE(CurlTransport::IsReplayable("POST"));
  EXPECT_FALSE(CurlTransport::IsReplayable("PUT"));
  EXPECT_FALSE(CurlTransport::IsReplayable("PATCH"));
  EXPECT_FALSE(CurlTransport::IsReplayable("DELETE"));
  EXPECT_FALSE(CurlTransport::IsReplayable("get"));
}

// Minimal HTTP/1.1 server on 127.0.0.1 that records every request it reads
// and answers each with "ok".
class LoopbackServer {
 public:
  struct Seen {
    std::string method;
    std::string head;  // request line and headers, lowercased
    std::string body;
  };

  LoopbackServer() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0)
      throw std::runtime_error("socket failed");

    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd_, 8) != 0) {
      ::close(fd_);
      throw std::runtime_error("bind/listen failed");
    }

    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { Serve(); });
  }

  ~LoopbackServer() {
    ::shutdown(fd_, SHUT_RDWR);
    thread_.join();
    ::close(fd_);
  }

  std::string Url(const std::string& path = "/") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  std::vector<Seen> Requests() const {
    std::lock_guard<std::mutex> lk(m_);
    return seen_;
  }

 private:
  void Serve() {
    while (true) {
      int c = ::accept(fd_, nullptr, nullptr);
      if (c < 0) {
        if (errno == EINTR)
          continue;
        return;
      }
      Handle(c);
      ::close(c);
    }
  }

  void Handle(int c) {
    std::string data;
    char buf[4096];
    std::size_t end = std::string::npos;
    while ((end = data.find("\r\n\r\n")) == std::string::npos) {
      ssize_t n = ::recv(c, buf, sizeof(buf), 0);
      if (n <= 0)
        return;
      data.append(buf, static_cast<std::size_t>(n));
    }

    Seen req;
    req.head = data.substr(0, end);
    std::transform(req.head.begin(), req.head.end(), req.head.begin(),
                   [](unsigned char ch) { return std::tolower(ch); });
    req.method = data.substr(0, data.find(' '));

    std::size_t length = 0;
    auto cl = req.head.find("\r\ncontent-length:");
    if (cl != std::string::npos) {
      length = std::stoul(req.head.substr(cl + 17));
    }
    req.body = data.substr(end + 4);
    while (req.body.size() < length) {
      ssize_t n = ::recv(c, buf, sizeof(buf), 0);
      if (n <= 0)
        break;
      req.body.append(buf, static_cast<std::size_t>(n));
    }

    std::string reply =
      "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\n";
    if (req.method != "HEAD")
      reply += "ok";
    {
      // recorded before replying so the client never sees a reply first
      std::lock_guard<std::mutex> lk(m_);
      seen_.push_back(std::move(req));
    }
    ::send(c, reply.data(), reply.size(), MSG_NOSIGNAL);
  }

  int fd_{-1};
  unsigned short port_{0};
  std::thread thread_;
  mutable std::mutex m_;
  std::vector<Seen> seen_;
};

class CurlLoopbackTest : public ::testing::Test {
 protected:
  std::optional<std::string> no_proxy_;

  // keep any configured proxy away from the loopback server
  void SetUp() override {
    if (const char* v = std::getenv("no_proxy"))
      no_proxy_ = v;
    ::setenv("no_proxy", "*", 1);
  }

  void TearDown() override {
    if (no_proxy_)
      ::setenv("no_proxy", no_proxy_->c_str(), 1);
    else
      ::unsetenv("no_proxy");
  }
};

TEST_F(CurlLoopbackTest, PostSendsBodyAndHeadersOnce) {
  SCOPED_TRACE("A POST reaches the server exactly once with its payload.");
  RecordProperty("description",
                 "The server sees one POST carrying the body and the custom "
                 "header, and the transport returns the 200 reply.");

  LoopbackServer server;
  CurlTransport transport;

  HttpRequest req(server.Url("/submit"), "POST");
  req.body = "a=1&b=2";
  req.headers.emplace_back("X-Trace", "abc123");

  auto resp = transport(req);

  EXPECT_EQ(resp.GetStatusCode(), 200);
  EXPECT_EQ(resp.GetBody(), "ok");

  auto seen = server.Requests();
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].method, "POST");
  EXPECT_EQ(seen[0].body, "a=1&b=2");
  EXPECT_NE(seen[0].head.find("post /submit http/1.1"), std::string::npos);
  EXPECT_NE(seen[0].head.find("\r\nx-trace: abc123"), std::string::npos);
}

TEST_F(CurlLoopbackTest, EmptyPostDoesNotWaitForInput) {
  SCOPED_TRACE("A POST without a body is sent with a zero length.");
  RecordProperty("description",
                 "An empty-body POST completes with Content-Length 0 instead "
                 "of reading the body from stdin.");

  LoopbackServer server;
  CurlTransport transport;

  HttpRequest req(server.Url(), "POST");
  req.timeout = 5000ms;

  auto resp = transport(req);

  EXPECT_EQ(resp.GetBody(), "ok");
  auto seen = server.Requests();
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].method, "POST");
  EXPECT_TRUE(seen[0].body.empty());
  EXPECT_NE(seen[0].head.find("\r\ncontent-length: 0"), std::string::npos);
}

TEST_F(CurlLoopbackTest, HeadFetchesHeadersOnly) {
  SCOPED_TRACE("HEAD is sent as HEAD and no body is read.");
  RecordProperty("description",
                 "The server sees a HEAD request and the response carries the "
                 "status and headers with an empty body.");

  LoopbackServer server;
  CurlTransport transport;

  auto resp = transport(HttpRequest(server.Url("/status"), "HEAD"));

  EXPECT_EQ(resp.GetStatusCode(), 200);
  EXPECT_TRUE(resp.GetBody().empty());
  ASSERT_TRUE(resp.GetHeader("Content-Length").has_value());
  EXPECT_EQ(*resp.GetHeader("Content-Length"), "2");

  auto seen = server.Requests();
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].method, "HEAD");
  EXPECT_TRUE(seen[0].body.empty());
}

TEST_F(CurlLoopbackTest, CustomMethodCarriesBody) {
  SCOPED_TRACE("Methods other than GET, HEAD and POST are sent verbatim.");
  RecordProperty("description",
                 "A PUT with a body reaches the server as PUT with that body.");

  LoopbackServer server;
  CurlTransport transport;

  HttpRequest req(server.Url("/item/7"), "PUT");
  req.body = "payload";
  req.headers.emplace_back("Content-Type", "text/plain");

  auto resp = transport(req);

  EXPECT_EQ(resp.GetBody(), "ok");
  auto seen = server.Requests();
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].method, "PUT");
  EXPECT_EQ(seen[0].body, "payload");
  EXPECT_NE(seen[0].head.find("\r\ncontent-type: text/plain"),
            std::string::npos);
}

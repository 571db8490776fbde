#include "net/curl_http_client.hpp"
#include "testing.hpp"
#include "transfer/retry_executor.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <cerrno>
#include <curl/curl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>

namespace {

using namespace ovaup;
using namespace std::chrono_literals;

// Accepts one connection on 127.0.0.1, records the raw request and answers
// with `reply` once the announced body has arrived.
class LoopbackServer {
  public:
    explicit LoopbackServer(std::string reply) : reply_(std::move(reply)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 1) != 0 ||
            ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("cannot listen on loopback");
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { Serve(); });
    }

    ~LoopbackServer() {
        if (thread_.joinable()) thread_.join();
        ::close(listen_fd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    std::string Url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    // Request bytes as received. Waits for the connection to finish.
    std::string Request() {
        if (thread_.joinable()) thread_.join();
        return request_;
    }

  private:
    void Serve() {
        pollfd p{listen_fd_, POLLIN, 0};
        if (::poll(&p, 1, 10000) != 1) return;
        const int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) return;
        timeval tv{10, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        char buf[4096];
        std::size_t want = std::string::npos;
        while (want == std::string::npos || request_.size() < want) {
            const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            request_.append(buf, static_cast<std::size_t>(n));
            const std::size_t end = request_.find("\r\n\r\n");
            if (want == std::string::npos && end != std::string::npos)
                want = end + 4 + ContentLength(request_.substr(0, end));
        }
        if (want != std::string::npos && request_.size() >= want)
            (void)::send(fd, reply_.data(), reply_.size(), MSG_NOSIGNAL);
        ::close(fd);
    }

    static std::size_t ContentLength(const std::string& head) {
        const std::string key = "Content-Length: ";
        const std::size_t at = head.find(key);
        if (at == std::string::npos) return 0;
        return static_cast<std::size_t>(std::stoull(head.substr(at + key.size())));
    }

    std::string reply_;
    std::string request_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::thread thread_;
};

// A port with nothing listening on it.
int ClosedPort() {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

class FailingReader final : public IReader {
  public:
    ssize_t Read(std::span<std::uint8_t>) override {
        errno = EIO;
        return -1;
    }
};

RetryPolicy FastNetworkPolicy(int max_attempts) {
    RetryPolicy p = RetryPolicy::Network();
    p.max_attempts = max_attempts;
    p.base_delay = 1ms;
    p.max_delay = 2ms;
    p.jitter_fraction = 0.0;
    return p;
}

int AttemptsFor(const Result& failure) {
    const RetryExecutor exec(FastNetworkPolicy(5));
    CancelToken cancel;
    RetryStats stats;
    auto r = exec.Execute(cancel, [&] { return failure; }, {}, &stats);
    EXPECT_EQ(r.code, ErrorCode::Exhausted);
    return stats.attempts;
}

TEST(CurlHttpClientTest, PutSendsChunkWithHeadersAndAuth) {
    LoopbackServer server("HTTP/1.1 201 Created\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    CurlHttpClient client;

    HttpRequest req;
    req.url = server.Url("/folder/web01/disk.vmdk?dcPath=ha-datacenter&dsName=ds1");
    req.username = "root";
    req.password = "secret";
    req.timeout = 20s;

    MemoryReader body("hello world");
    HttpResponse resp;
    auto r = client.Put(req, body, 11, resp);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(resp.status, 201);

    const std::string raw = server.Request();
    EXPECT_EQ(raw.rfind("PUT /folder/web01/disk.vmdk?dcPath=ha-datacenter&dsName=ds1 HTTP/1.1\r\n", 0),
              0u)
        << raw;
    EXPECT_NE(raw.find("\r\nContent-Length: 11\r\n"), std::string::npos) << raw;
    EXPECT_NE(raw.find("\r\nContent-Type: application/octet-stream\r\n"), std::string::npos);
    EXPECT_NE(raw.find("\r\nAuthorization: Basic cm9vdDpzZWNyZXQ=\r\n"), std::string::npos);
    EXPECT_EQ(raw.find("Expect:"), std::string::npos);
    EXPECT_EQ(raw.substr(raw.find("\r\n\r\n") + 4), "hello world");
}

TEST(CurlHttpClientTest, ErrorStatusIsNotATransportFailure) {
    LoopbackServer server(
        "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 4\r\nConnection: close\r\n\r\nbusy");
    CurlHttpClient client;

    HttpRequest req;
    req.url = server.Url("/folder/a.vmdk");
    req.timeout = 20s;
    MemoryReader body("abc");
    HttpResponse resp;
    auto r = client.Put(req, body, 3, resp);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(resp.status, 503);
    EXPECT_EQ(resp.body, "busy");
}

TEST(CurlHttpClientTest, RefusedConnectionIsRetried) {
    CurlHttpClient client;
    HttpRequest req;
    req.url = "http://127.0.0.1:" + std::to_string(ClosedPort()) + "/folder/a.vmdk";
    req.timeout = 20s;

    MemoryReader body("abc");
    HttpResponse resp;
    auto r = client.Put(req, body, 3, resp);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::Network);
    EXPECT_NE(r.msg.find("connection refused"), std::string::npos) << r.msg;
    EXPECT_EQ(AttemptsFor(r), 5);
}

TEST(CurlHttpClientTest, UnreadableBodyIsNotRetried) {
    LoopbackServer server("HTTP/1.1 201 Created\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    CurlHttpClient client;

    HttpRequest req;
    req.url = server.Url("/folder/a.vmdk");
    req.timeout = 20s;
    FailingReader body;
    HttpResponse resp;
    auto r = client.Put(req, body, 1024, resp);
    (void)server.Request();

    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::Io);
    EXPECT_NE(r.msg.find("source read failed"), std::string::npos) << r.msg;
    EXPECT_EQ(AttemptsFor(r), 1);
}

TEST(CurlTransportErrorTest, TlsAndUrlFailuresAreTerminal) {
    const Result cert = CurlTransportError(
        "PUT", CURLE_PEER_FAILED_VERIFICATION,
        "SSL certificate problem: self-signed certificate");
    EXPECT_EQ(cert.code, ErrorCode::Network);
    EXPECT_EQ(AttemptsFor(cert), 1) << cert.msg;

    const Result url = CurlTransportError("PUT", CURLE_URL_MALFORMAT, "");
    EXPECT_EQ(AttemptsFor(url), 1) << url.msg;

    const Result ssl = CurlTransportError("GET", CURLE_SSL_CONNECT_ERROR, "");
    EXPECT_EQ(AttemptsFor(ssl), 1) << ssl.msg;
}

TEST(CurlTransportErrorTest, DroppedConnectionsAreRetried) {
    for (const CURLcode rc : {CURLE_COULDNT_CONNECT, CURLE_OPERATION_TIMEDOUT,
                              CURLE_COULDNT_RESOLVE_HOST, CURLE_SEND_ERROR, CURLE_RECV_ERROR,
                              CURLE_GOT_NOTHING}) {
        const Result r = CurlTransportError("PUT", rc, "");
        EXPECT_EQ(AttemptsFor(r), 5) << r.msg;
    }
}

} // namespace

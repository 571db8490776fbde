#include "net/curl_http_client.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <span>

namespace ovaup {

namespace {

constexpr std::size_t kMaxResponseBody = 64 * 1024;

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using CurlHeaders = std::unique_ptr<curl_slist, SlistDeleter>;

struct UploadCtx {
    IReader* reader = nullptr;
    std::uint64_t remaining = 0;
    std::string error;
};

size_t ReadCb(char* buf, size_t size, size_t nitems, void* userp) {
    auto* ctx = static_cast<UploadCtx*>(userp);
    if (g_cancel.load()) {
        ctx->error = "cancelled";
        return CURL_READFUNC_ABORT;
    }
    if (ctx->remaining == 0) return 0;

    const size_t cap = size * nitems;
    const size_t want = static_cast<size_t>(std::min<std::uint64_t>(cap, ctx->remaining));
    const ssize_t n = ctx->reader->Read(
        std::span<std::uint8_t>(reinterpret_cast<std::uint8_t*>(buf), want));
    if (n < 0) {
        ctx->error = std::string("source read failed: ") + std::strerror(errno);
        return CURL_READFUNC_ABORT;
    }
    if (n == 0) {
        ctx->error = "source ended early";
        return CURL_READFUNC_ABORT;
    }
    ctx->remaining -= static_cast<std::uint64_t>(n);
    return static_cast<size_t>(n);
}

size_t WriteCb(char* ptr, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    const size_t n = size * nmemb;
    if (body->size() < kMaxResponseBody) {
        body->append(ptr, std::min(n, kMaxResponseBody - body->size()));
    }
    return n;
}

void ApplyCommon(CURL* c, const HttpRequest& req, char* errbuf, std::string* body) {
    curl_easy_setopt(c, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, static_cast<long>(req.timeout.count()));
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, 60L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, &WriteCb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, body);

    if (!req.username.empty()) {
        curl_easy_setopt(c, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(c, CURLOPT_USERNAME, req.username.c_str());
        curl_easy_setopt(c, CURLOPT_PASSWORD, req.password.c_str());
    }
    if (req.insecure) {
        curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, 0L);
    }
}

// Lower-case cause for failures worth another attempt. TLS, URL and
// option errors have none and stay terminal.
const char* TransientCause(CURLcode rc) {
    switch (rc) {
        case CURLE_COULDNT_CONNECT:       return "connection refused";
        case CURLE_OPERATION_TIMEDOUT:    return "timeout";
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY: return "temporary failure in name resolution";
        case CURLE_SEND_ERROR:            return "broken pipe";
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:          return "unexpected EOF";
        default:                          return nullptr;
    }
}

} // namespace

Result CurlTransportError(const char* method, int curl_code, const std::string& detail) {
    const auto rc = static_cast<CURLcode>(curl_code);
    std::string msg = std::string(method) + ": ";
    if (const char* cause = TransientCause(rc)) msg += std::string(cause) + ": ";
    msg += curl_easy_strerror(rc);
    if (!detail.empty()) msg += " (" + detail + ")";
    return Result::Fail(ErrorCode::Network, msg);
}

bool IsUploadSuccessStatus(long status) {
    return status == 200 || status == 201 || status == 204 || status == 206;
}

CurlHttpClient::CurlHttpClient() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result CurlHttpClient::Put(const HttpRequest& req,
                           IReader& body,
                           std::uint64_t content_length,
                           HttpResponse& out) {
    out = HttpResponse{};

    CurlHandle c(curl_easy_init());
    if (!c) return Result::Fail(ErrorCode::InvalidArgument, "curl_easy_init failed");

    char errbuf[CURL_ERROR_SIZE] = {0};
    ApplyCommon(c.get(), req, errbuf, &out.body);

    UploadCtx ctx;
    ctx.reader = &body;
    ctx.remaining = content_length;

    CurlHeaders headers(curl_slist_append(nullptr, "Content-Type: application/octet-stream"));
    // No "Expect: 100-continue" round trip per chunk.
    headers.reset(curl_slist_append(headers.release(), "Expect:"));

    curl_easy_setopt(c.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(c.get(), CURLOPT_READFUNCTION, &ReadCb);
    curl_easy_setopt(c.get(), CURLOPT_READDATA, &ctx);
    curl_easy_setopt(c.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(content_length));
    curl_easy_setopt(c.get(), CURLOPT_HTTPHEADER, headers.get());

    const CURLcode rc = curl_easy_perform(c.get());
    if (rc != CURLE_OK) {
        if (ctx.error == "cancelled") {
            return Result::Fail(ErrorCode::Cancelled, "upload cancelled");
        }
        if (!ctx.error.empty()) {
            LogDebug("PUT %s aborted: %s", req.url.c_str(), ctx.error.c_str());
            return Result::Fail(ErrorCode::Io, "PUT body: " + ctx.error);
        }
        LogDebug("PUT %s failed: %s", req.url.c_str(), curl_easy_strerror(rc));
        return CurlTransportError("PUT", rc, errbuf);
    }

    curl_easy_getinfo(c.get(), CURLINFO_RESPONSE_CODE, &out.status);
    LogDebug("PUT %s -> %ld (%llu bytes)", req.url.c_str(), out.status,
             (unsigned long long)content_length);
    return Result::Ok();
}

Result CurlHttpClient::Get(const HttpRequest& req, HttpResponse& out) {
    out = HttpResponse{};

    CurlHandle c(curl_easy_init());
    if (!c) return Result::Fail(ErrorCode::InvalidArgument, "curl_easy_init failed");

    char errbuf[CURL_ERROR_SIZE] = {0};
    ApplyCommon(c.get(), req, errbuf, &out.body);
    curl_easy_setopt(c.get(), CURLOPT_HTTPGET, 1L);

    const CURLcode rc = curl_easy_perform(c.get());
    if (rc != CURLE_OK) {
        LogDebug("GET %s failed: %s", req.url.c_str(), curl_easy_strerror(rc));
        return CurlTransportError("GET", rc, errbuf);
    }

    curl_easy_getinfo(c.get(), CURLINFO_RESPONSE_CODE, &out.status);
    LogDebug("GET %s -> %ld", req.url.c_str(), out.status);
    return Result::Ok();
}

} // namespace ovaup

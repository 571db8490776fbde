#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ovaup {

struct HttpRequest {
    std::string url;
    std::string username;
    std::string password;
    bool insecure = true;
    std::chrono::seconds timeout{30 * 60};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Statuses accepted for an uploaded chunk.
bool IsUploadSuccessStatus(long status);

// Transport only: a non-2xx status is still an Ok Result with the status set.
// Transport failures are NetworkError; a body that cannot be read is Io.
class IHttpClient {
  public:
    virtual ~IHttpClient() = default;

    // Sends exactly `content_length` bytes read from `body`.
    virtual Result Put(const HttpRequest& req,
                       IReader& body,
                       std::uint64_t content_length,
                       HttpResponse& out) = 0;

    virtual Result Get(const HttpRequest& req, HttpResponse& out) = 0;
};

} // namespace ovaup

#pragma once

#include "net/http_client.hpp"

#include <string>

namespace ovaup {

// NetworkError for a failed transfer with CURLcode `curl_code`. Connect,
// resolve, timeout and dropped-connection failures name their cause in
// lower case ("connection refused", "timeout", "unexpected EOF", ...);
// every other code carries only curl's own text. The URL is left out so a
// host name cannot steer retry classification.
Result CurlTransportError(const char* method, int curl_code, const std::string& detail);

// libcurl easy interface. One handle per request, so one client may be used
// from several upload workers at once.
class CurlHttpClient final : public IHttpClient {
  public:
    CurlHttpClient();

    Result Put(const HttpRequest& req,
               IReader& body,
               std::uint64_t content_length,
               HttpResponse& out) override;

    Result Get(const HttpRequest& req, HttpResponse& out) override;
};

} // namespace ovaup

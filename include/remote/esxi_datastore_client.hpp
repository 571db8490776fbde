#pragma once

#include "net/http_client.hpp"
#include "remote/hypervisor_client.hpp"

#include <string>

namespace ovaup {

struct EsxiConfig {
    std::string host; // "host", "host:port" or "https://host[:port]"
    std::string username;
    std::string password;
    bool insecure = true;
};

// Talks to the ESXi "/folder" HTTP file service of a standalone host
// (datacenter "ha-datacenter").
class EsxiDatastoreClient final : public IHypervisorClient {
  public:
    EsxiDatastoreClient(EsxiConfig cfg, IHttpClient& http);

    Result Connect() override;
    Result LookupDestination(const std::string& name, DestinationHandle& out) override;
    std::string BuildUploadUrl(const DestinationHandle& dest,
                               const std::string& remote_path) const override;
    Result CreateItemFromDescriptor(const std::string& descriptor,
                                    const std::string& name,
                                    const DestinationHandle& dest,
                                    const std::string& network) override;
    Credentials GetCredentials() const override;

    const std::string& BaseUrl() const { return base_url_; }

  private:
    Result Probe(const std::string& url, const char* what);

    EsxiConfig cfg_;
    IHttpClient& http_;
    std::string base_url_;
    bool connected_ = false;
};

// "https://host" from any of the accepted host forms, without a trailing '/'.
std::string NormalizeHostUrl(const std::string& host);

// Percent-encodes everything but unreserved characters and '/'.
std::string EncodeUrlPath(const std::string& path);

} // namespace ovaup

#pragma once

#include "util/result.hpp"

#include <string>

namespace ovaup {

// Resolved upload destination (a datastore on the remote host).
struct DestinationHandle {
    std::string name;
    std::string base_url;
};

struct Credentials {
    std::string username;
    std::string password;
    bool insecure = true;
};

// Boundary to the remote hypervisor. The transfer core never authenticates
// by itself: it gets a destination handle, a URL builder and the
// credentials to attach to each PUT.
class IHypervisorClient {
  public:
    virtual ~IHypervisorClient() = default;

    virtual Result Connect() = 0;
    virtual Result LookupDestination(const std::string& name, DestinationHandle& out) = 0;
    virtual std::string BuildUploadUrl(const DestinationHandle& dest,
                                       const std::string& remote_path) const = 0;

    // Called once all payload bytes are on the destination.
    virtual Result CreateItemFromDescriptor(const std::string& descriptor,
                                            const std::string& name,
                                            const DestinationHandle& dest,
                                            const std::string& network) = 0;

    virtual Credentials GetCredentials() const = 0;
    virtual void Disconnect() {}
};

} // namespace ovaup

#pragma once

#include "io/range_reader.hpp"
#include "net/http_client.hpp"
#include "ova/archive_package.hpp"
#include "progress/progress.hpp"
#include "remote/hypervisor_client.hpp"
#include "system/cancel_token.hpp"
#include "transfer/chunked_uploader.hpp"
#include "transfer/retry_executor.hpp"
#include "util/result.hpp"

#include <string>

namespace ovaup {

class SessionTracker;

struct CoordinatorOptions {
    UploadOptions upload;
    RetryPolicy retry = RetryPolicy::Network();
    bool verify_checksums = true;
    std::string datastore;
    std::string vm_name;
    std::string network;
};

// Drives one upload run: registers the payloads, checks their digests,
// resolves the destination, uploads every incomplete payload under the
// retry executor and finally hands the descriptor to the hypervisor.
// The session file is removed only after the descriptor was accepted.
class TransferCoordinator {
  public:
    TransferCoordinator(IHypervisorClient& client,
                        IHttpClient& http,
                        const IRangeSource& source,
                        CoordinatorOptions opt,
                        IProgress* progress = nullptr);

    Result Run(const ArchivePackage& pkg, SessionTracker& tracker, const CancelToken& cancel);

    // Remote location of a payload: "<vm>/<payload name>".
    std::string RemotePathFor(const ArchiveEntry& entry) const;

  private:
    Result VerifyChecksums(const ArchivePackage& pkg,
                           const SessionTracker& tracker,
                           const CancelToken& cancel) const;

    Result UploadPayload(const ArchivePackage& pkg,
                         const ArchiveEntry& entry,
                         const DestinationHandle& dest,
                         SessionTracker& tracker,
                         const CancelToken& cancel);

    Result CreateFromDescriptor(const ArchivePackage& pkg, const DestinationHandle& dest);

    void Report(const SessionTracker& tracker,
                const std::string& item,
                std::uint64_t done,
                std::uint64_t total);

    IHypervisorClient& client_;
    IHttpClient& http_;
    const IRangeSource& source_;
    CoordinatorOptions opt_;
    IProgress* progress_ = nullptr;
};

} // namespace ovaup

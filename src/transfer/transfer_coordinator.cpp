#include "transfer/transfer_coordinator.hpp"

#include "ova/archive_indexer.hpp"
#include "session/session_tracker.hpp"
#include "util/format.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace ovaup {

TransferCoordinator::TransferCoordinator(IHypervisorClient& client,
                                         IHttpClient& http,
                                         const IRangeSource& source,
                                         CoordinatorOptions opt,
                                         IProgress* progress)
    : client_(client), http_(http), source_(source), opt_(std::move(opt)), progress_(progress) {}

std::string TransferCoordinator::RemotePathFor(const ArchiveEntry& entry) const {
    return opt_.vm_name + "/" + std::filesystem::path(entry.name).filename().string();
}

void TransferCoordinator::Report(const SessionTracker& tracker,
                                 const std::string& item,
                                 std::uint64_t done,
                                 std::uint64_t total) {
    if (!progress_) return;
    const OverallProgress overall = tracker.Overall();

    ProgressEvent e;
    e.item = item;
    e.item_done = done;
    e.item_total = total;
    e.overall_done = overall.uploaded;
    e.overall_total = overall.total;
    e.bytes_per_second = tracker.UploadSpeed();
    e.eta = tracker.Eta();
    progress_->OnProgress(e);
}

Result TransferCoordinator::VerifyChecksums(const ArchivePackage& pkg,
                                            const SessionTracker& tracker,
                                            const CancelToken& cancel) const {
    for (const auto& entry : pkg.payloads) {
        if (cancel.IsCancelled()) {
            return Result::Fail(ErrorCode::Cancelled, "checksum verification cancelled");
        }
        if (entry.checksum.empty()) {
            LogWarn("No manifest digest for %s, not verified", entry.name.c_str());
            continue;
        }
        if (tracker.IsItemComplete(entry.name)) continue;

        LogInfo("Verifying %s (%s)", entry.name.c_str(), FormatBytes(entry.size).c_str());
        auto r = ValidateChecksum(source_, pkg.path, entry);
        if (!r.ok) return r;
    }
    return Result::Ok();
}

Result TransferCoordinator::UploadPayload(const ArchivePackage& pkg,
                                          const ArchiveEntry& entry,
                                          const DestinationHandle& dest,
                                          SessionTracker& tracker,
                                          const CancelToken& cancel) {
    StreamRequest req;
    req.source_path = pkg.path;
    req.payload_offset = entry.offset;
    req.payload_size = entry.size;
    req.url = client_.BuildUploadUrl(dest, RemotePathFor(entry));
    req.item_name = entry.name;

    const ChunkedUploader uploader(http_, source_, opt_.upload);
    const RetryExecutor executor(opt_.retry);
    ChunkLedger ledger;

    auto on_progress = [&](const std::string& item, std::uint64_t uploaded) {
        Report(tracker, item, uploaded, entry.size);
    };
    auto on_failure = [&](int attempt, const Result& err, std::chrono::milliseconds delay) {
        tracker.IncrementRetryCount();
        LogWarn("Upload of %s failed (attempt %d, %zu chunk(s) acknowledged), retrying in %s: %s",
                entry.name.c_str(), attempt, ledger.Count(),
                FormatDuration(std::chrono::duration_cast<std::chrono::seconds>(delay)).c_str(),
                err.msg.c_str());
    };

    auto r = executor.Execute(
        cancel,
        [&] { return uploader.StreamItem(req, &tracker, &ledger, cancel, on_progress); },
        on_failure);
    if (!r.ok) return r;

    tracker.MarkItemComplete(entry.name);
    Report(tracker, entry.name, entry.size, entry.size);

    auto p = tracker.PersistNow();
    if (!p.ok) {
        LogError("Failed to save session: %s", p.msg.c_str());
    }
    LogInfo("Uploaded %s to [%s] %s", entry.name.c_str(), dest.name.c_str(),
            RemotePathFor(entry).c_str());
    return Result::Ok();
}

Result TransferCoordinator::CreateFromDescriptor(const ArchivePackage& pkg,
                                                 const DestinationHandle& dest) {
    std::string descriptor;
    auto r = ReadRangeToString(source_, pkg.path, pkg.descriptor.offset, pkg.descriptor.size,
                               descriptor);
    if (!r.ok) return r;

    LogInfo("Creating %s from %s", opt_.vm_name.c_str(), pkg.descriptor.name.c_str());
    return client_.CreateItemFromDescriptor(descriptor, opt_.vm_name, dest, opt_.network);
}

Result TransferCoordinator::Run(const ArchivePackage& pkg,
                                SessionTracker& tracker,
                                const CancelToken& cancel) {
    for (const auto& entry : pkg.payloads) {
        tracker.RegisterItem(entry.name, entry.size, entry.checksum);
    }
    if (auto p = tracker.PersistNow(); !p.ok) {
        LogError("Failed to save session: %s", p.msg.c_str());
    }

    if (opt_.verify_checksums) {
        auto r = VerifyChecksums(pkg, tracker, cancel);
        if (!r.ok) return r;
    }

    const Credentials creds = client_.GetCredentials();
    opt_.upload.username = creds.username;
    opt_.upload.password = creds.password;
    opt_.upload.insecure = creds.insecure;

    auto r = client_.Connect();
    if (!r.ok) return r;

    DestinationHandle dest;
    r = client_.LookupDestination(opt_.datastore, dest);
    if (!r.ok) {
        client_.Disconnect();
        return r;
    }

    for (const auto& entry : pkg.payloads) {
        if (tracker.IsItemComplete(entry.name)) {
            LogInfo("%s already uploaded, skipping", entry.name.c_str());
            continue;
        }
        if (cancel.IsCancelled()) {
            client_.Disconnect();
            return Result::Fail(ErrorCode::Cancelled, "upload cancelled before " + entry.name);
        }

        r = UploadPayload(pkg, entry, dest, tracker, cancel);
        if (!r.ok) {
            if (auto p = tracker.PersistNow(); !p.ok) {
                LogError("Failed to save session: %s", p.msg.c_str());
            }
            client_.Disconnect();
            return Result::Fail(r.code, "failed to upload " + entry.name + ": " + r.msg);
        }
    }

    r = CreateFromDescriptor(pkg, dest);
    client_.Disconnect();
    if (!r.ok) {
        return Result::Fail(r.code, "failed to create " + opt_.vm_name + ": " + r.msg);
    }

    r = tracker.Delete();
    if (!r.ok) {
        LogWarn("Upload finished but the session file was not removed: %s", r.msg.c_str());
    }
    return Result::Ok();
}

} // namespace ovaup

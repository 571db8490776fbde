#include "transfer/chunked_uploader.hpp"

#include "session/session_tracker.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>

namespace ovaup {

std::vector<ChunkRange> PlanChunks(std::uint64_t size, std::uint64_t chunk_size) {
    std::vector<ChunkRange> out;
    if (chunk_size == 0) chunk_size = kDefaultChunkSize;
    if (size == 0) {
        out.push_back(ChunkRange{0, 0, 0});
        return out;
    }

    out.reserve(static_cast<size_t>((size + chunk_size - 1) / chunk_size));
    std::uint64_t index = 0;
    for (std::uint64_t off = 0; off < size; off += chunk_size) {
        out.push_back(ChunkRange{index++, off, std::min(chunk_size, size - off)});
    }
    return out;
}

bool ChunkLedger::IsDone(std::uint64_t index) const {
    std::lock_guard<std::mutex> lk(mu_);
    return done_.count(index) != 0;
}

void ChunkLedger::MarkDone(std::uint64_t index) {
    std::lock_guard<std::mutex> lk(mu_);
    done_.insert(index);
}

std::size_t ChunkLedger::Count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return done_.size();
}

ChunkedUploader::ChunkedUploader(IHttpClient& http, const IRangeSource& source, UploadOptions opt)
    : http_(http), source_(source), opt_(std::move(opt)) {
    if (opt_.chunk_size == 0) opt_.chunk_size = kDefaultChunkSize;
    opt_.workers = std::clamp(opt_.workers, 1, kMaxWorkers);
}

Result ChunkedUploader::UploadChunk(const StreamRequest& req, const ChunkRange& chunk) const {
    // Each chunk gets its own reader so parallel workers never share a position.
    std::unique_ptr<IReader> body;
    auto r = source_.OpenRange(req.source_path, req.payload_offset + chunk.offset, chunk.length, body);
    if (!r.ok) return r;

    HttpRequest http_req;
    http_req.url = req.url;
    http_req.username = opt_.username;
    http_req.password = opt_.password;
    http_req.insecure = opt_.insecure;
    http_req.timeout = opt_.timeout;

    HttpResponse resp;
    r = http_.Put(http_req, *body, chunk.length, resp);
    if (!r.ok) return r;

    if (!IsUploadSuccessStatus(resp.status)) {
        LogDebug("chunk %llu of %s rejected: %ld %s", (unsigned long long)chunk.index,
                 req.item_name.c_str(), resp.status, resp.body.c_str());
        return Result::Fail(ErrorCode::Network, "upload failed with status " +
                                                    std::to_string(resp.status) + ": " + resp.body);
    }
    return Result::Ok();
}

Result ChunkedUploader::StreamItem(const StreamRequest& req,
                                   SessionTracker* tracker,
                                   ChunkLedger* ledger,
                                   const CancelToken& cancel,
                                   const UploadProgressFn& progress) const {
    if (tracker && tracker->IsItemComplete(req.item_name)) {
        LogInfo("%s already uploaded, skipping", req.item_name.c_str());
        return Result::Ok();
    }

    const auto chunks = PlanChunks(req.payload_size, opt_.chunk_size);

    ChunkLedger local;
    ChunkLedger& acked = ledger ? *ledger : local;

    const int workers = std::min<int>(opt_.workers, static_cast<int>(chunks.size()));
    LogInfo("Uploading %s: %llu bytes in %zu chunk(s), %d worker(s)", req.item_name.c_str(),
            (unsigned long long)req.payload_size, chunks.size(), workers);

    if (opt_.workers <= 1) {
        return StreamSequential(req, chunks, tracker, acked, cancel, progress);
    }
    return StreamParallel(req, chunks, workers, tracker, acked, cancel, progress);
}

Result ChunkedUploader::StreamSequential(const StreamRequest& req,
                                         const std::vector<ChunkRange>& chunks,
                                         SessionTracker* tracker,
                                         ChunkLedger& ledger,
                                         const CancelToken& cancel,
                                         const UploadProgressFn& progress) const {
    std::uint64_t cursor = 0;
    for (const auto& chunk : chunks) {
        if (ledger.IsDone(chunk.index)) {
            cursor += chunk.length;
            continue;
        }
        if (cancel.IsCancelled()) {
            return Result::Fail(ErrorCode::Cancelled, "upload of " + req.item_name + " cancelled");
        }

        auto r = UploadChunk(req, chunk);
        if (!r.ok) {
            LogWarn("Chunk %llu/%zu of %s failed: %s", (unsigned long long)chunk.index + 1,
                    chunks.size(), req.item_name.c_str(), r.msg.c_str());
            return r;
        }

        ledger.MarkDone(chunk.index);
        cursor += chunk.length;
        if (tracker) tracker->RecordProgress(req.item_name, cursor);
        if (progress) progress(req.item_name, cursor);
        LogDebug("Chunk %llu/%zu of %s done (%llu/%llu bytes)",
                 (unsigned long long)chunk.index + 1, chunks.size(), req.item_name.c_str(),
                 (unsigned long long)cursor, (unsigned long long)req.payload_size);
    }
    return Result::Ok();
}

Result ChunkedUploader::StreamParallel(const StreamRequest& req,
                                       const std::vector<ChunkRange>& chunks,
                                       int workers,
                                       SessionTracker* tracker,
                                       ChunkLedger& ledger,
                                       const CancelToken& cancel,
                                       const UploadProgressFn& progress) const {
    std::vector<ChunkRange> pending;
    std::uint64_t completed = 0;
    for (const auto& chunk : chunks) {
        if (ledger.IsDone(chunk.index)) {
            completed += chunk.length;
        } else {
            pending.push_back(chunk);
        }
    }
    if (pending.empty()) return Result::Ok();

    std::atomic<std::size_t> next{0};
    std::mutex mu; // guards completed, first_error, failures
    std::optional<Result> first_error;
    std::size_t failures = 0;

    auto worker = [&](int id) {
        for (;;) {
            const std::size_t i = next.fetch_add(1);
            if (i >= pending.size()) return;
            if (cancel.IsCancelled()) {
                std::lock_guard<std::mutex> lk(mu);
                if (!first_error) {
                    first_error = Result::Fail(ErrorCode::Cancelled,
                                               "upload of " + req.item_name + " cancelled");
                }
                return;
            }

            const ChunkRange& chunk = pending[i];
            auto r = UploadChunk(req, chunk);

            std::lock_guard<std::mutex> lk(mu);
            if (!r.ok) {
                ++failures;
                LogWarn("Worker %d: chunk %llu/%zu of %s failed: %s", id,
                        (unsigned long long)chunk.index + 1, chunks.size(),
                        req.item_name.c_str(), r.msg.c_str());
                if (!first_error) {
                    r.msg = "chunk " + std::to_string(chunk.index + 1) + " failed: " + r.msg;
                    first_error = std::move(r);
                }
                continue;
            }

            ledger.MarkDone(chunk.index);
            completed += chunk.length;
            if (tracker) tracker->RecordProgress(req.item_name, completed);
            if (progress) progress(req.item_name, completed);
            LogDebug("Worker %d: chunk %llu/%zu of %s done", id,
                     (unsigned long long)chunk.index + 1, chunks.size(), req.item_name.c_str());
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(workers));
    for (int i = 0; i < workers; ++i) {
        pool.emplace_back(worker, i + 1);
    }
    for (auto& t : pool) {
        t.join();
    }

    if (first_error) {
        if (failures > 1) {
            first_error->msg += " (" + std::to_string(failures) + " of " +
                                std::to_string(pending.size()) + " chunks failed)";
        }
        return *first_error;
    }
    return Result::Ok();
}

} // namespace ovaup

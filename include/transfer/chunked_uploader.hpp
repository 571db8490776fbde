#pragma once

#include "io/range_reader.hpp"
#include "net/http_client.hpp"
#include "system/cancel_token.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ovaup {

class SessionTracker;

constexpr std::uint64_t kDefaultChunkSize = 32ULL * 1024 * 1024;
constexpr int kDefaultWorkers = 3;
constexpr int kMaxWorkers = 10;

struct UploadOptions {
    std::uint64_t chunk_size = kDefaultChunkSize;
    // 1 streams chunks in order on the calling thread; more uses a pool.
    int workers = kDefaultWorkers;
    std::string username;
    std::string password;
    bool insecure = true;
    std::chrono::seconds timeout{30 * 60};
};

struct ChunkRange {
    std::uint64_t index = 0;
    std::uint64_t offset = 0; // relative to the payload start
    std::uint64_t length = 0;
};

// Ascending, non-overlapping ranges covering [0, size). A zero-sized payload
// yields one empty range so the remote file still gets created.
std::vector<ChunkRange> PlanChunks(std::uint64_t size, std::uint64_t chunk_size);

// Chunk indices the remote end has acknowledged during this process. Shared
// by the attempts of one item so a retry does not resend them.
class ChunkLedger {
  public:
    bool IsDone(std::uint64_t index) const;
    void MarkDone(std::uint64_t index);
    std::size_t Count() const;

  private:
    mutable std::mutex mu_;
    std::set<std::uint64_t> done_;
};

struct StreamRequest {
    std::string source_path;
    std::uint64_t payload_offset = 0;
    std::uint64_t payload_size = 0;
    std::string url;
    // Key in the session tracker and name passed to the progress callback.
    std::string item_name;
};

// Receives the cumulative number of bytes of the item acknowledged so far.
using UploadProgressFn = std::function<void(const std::string& item, std::uint64_t uploaded)>;

class ChunkedUploader {
  public:
    ChunkedUploader(IHttpClient& http, const IRangeSource& source, UploadOptions opt);

    // One attempt at transferring an item. `tracker` and `ledger` may be null.
    Result StreamItem(const StreamRequest& req,
                      SessionTracker* tracker,
                      ChunkLedger* ledger,
                      const CancelToken& cancel,
                      const UploadProgressFn& progress = {}) const;

    const UploadOptions& Options() const { return opt_; }

  private:
    Result UploadChunk(const StreamRequest& req, const ChunkRange& chunk) const;

    Result StreamSequential(const StreamRequest& req,
                            const std::vector<ChunkRange>& chunks,
                            SessionTracker* tracker,
                            ChunkLedger& ledger,
                            const CancelToken& cancel,
                            const UploadProgressFn& progress) const;

    Result StreamParallel(const StreamRequest& req,
                          const std::vector<ChunkRange>& chunks,
                          int workers,
                          SessionTracker* tracker,
                          ChunkLedger& ledger,
                          const CancelToken& cancel,
                          const UploadProgressFn& progress) const;

    IHttpClient& http_;
    const IRangeSource& source_;
    UploadOptions opt_;
};

} // namespace ovaup

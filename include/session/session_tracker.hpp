#pragma once

#include "session/session_types.hpp"
#include "util/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>

namespace ovaup {

struct TrackerOptions {
    std::string session_dir = ".";
    std::chrono::milliseconds save_interval{5000};
    // Chunk size used for the chunksTotal/chunksUploaded bookkeeping. Should
    // match the uploader's chunk size.
    std::uint64_t chunk_size = 32ULL * 1024 * 1024;
    bool auto_save = true;
};

struct SessionIdentity {
    std::string session_id;
    std::string ova_file;
    std::string esxi_host;
    std::string datastore;
    std::string vm_name;
};

struct OverallProgress {
    double percent = 0.0;
    std::uint64_t uploaded = 0;
    std::uint64_t total = 0;
};

// Owns the UploadSession of one run. Every mutation takes the session lock
// exclusively and every read takes it shared, so concurrent upload workers
// never race on the item map. A background thread persists the session
// every save_interval until Close() or Delete().
class SessionTracker {
  public:
    static std::unique_ptr<SessionTracker> Create(const SessionIdentity& id,
                                                  const TrackerOptions& opt);
    // Reloads a persisted session; the tracker keeps writing to `path`.
    // Item progress is clamped to item sizes, an item flagged complete short
    // of its size is reopened, and the session totals are recomputed.
    static Result Load(const std::string& path,
                       const TrackerOptions& opt,
                       std::unique_ptr<SessionTracker>& out);

    SessionTracker(const SessionTracker&) = delete;
    SessionTracker& operator=(const SessionTracker&) = delete;
    ~SessionTracker();

    // Adds an item. An item that is already present keeps its progress
    // unless its size changed, in which case it starts over.
    void RegisterItem(const std::string& name, std::uint64_t size, const std::string& checksum);

    // Absolute byte count for an item. Values below the recorded count are
    // ignored; values above the item size are clamped.
    void RecordProgress(const std::string& name, std::uint64_t uploaded_size);

    // Idempotent. Forces uploaded == total and recomputes session completion.
    void MarkItemComplete(const std::string& name);

    void IncrementRetryCount();

    UploadSession SnapshotSession() const;
    std::optional<ItemProgress> Item(const std::string& name) const;
    bool IsItemComplete(const std::string& name) const;
    OverallProgress Overall() const;

    // Throughput of this run in bytes per second, and the time left at that rate.
    double UploadSpeed() const;
    std::chrono::seconds Eta() const;

    Result PersistNow();

    // Stops background persistence (once) and writes the final state.
    void Close();

    // Stops background persistence without a final write and removes the file.
    Result Delete();

    const std::string& SessionFile() const { return session_file_; }

  private:
    SessionTracker(UploadSession session, std::string session_file, const TrackerOptions& opt);

    void StartPersister();
    bool StopPersister();
    void PersistLoop();

    void RepairLoaded();
    std::uint64_t ChunksFor(std::uint64_t bytes) const;
    void RecomputeCompletionLocked();

    TrackerOptions opt_;
    const std::string session_file_;

    mutable std::shared_mutex mu_;
    UploadSession session_;
    std::uint64_t uploaded_at_open_ = 0;
    const std::chrono::steady_clock::time_point opened_at_;

    // Taken before mu_.
    std::mutex persist_mu_;
    bool deleted_ = false;

    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;
    std::atomic_bool stopped_{false};
    std::thread persister_;
};

} // namespace ovaup

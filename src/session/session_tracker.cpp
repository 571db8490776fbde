#include "session/session_tracker.hpp"

#include "session/session_store.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace ovaup {

std::unique_ptr<SessionTracker> SessionTracker::Create(const SessionIdentity& id,
                                                       const TrackerOptions& opt) {
    UploadSession s;
    s.session_id = id.session_id.empty() ? NewSessionId(opt.session_dir) : id.session_id;
    s.ova_file = id.ova_file;
    s.esxi_host = id.esxi_host;
    s.datastore = id.datastore;
    s.vm_name = id.vm_name;
    s.start_time = SessionNow();
    s.last_update = s.start_time;

    std::string file = SessionFilePath(opt.session_dir, s.session_id);
    std::unique_ptr<SessionTracker> t(new SessionTracker(std::move(s), std::move(file), opt));
    t->StartPersister();
    return t;
}

Result SessionTracker::Load(const std::string& path,
                            const TrackerOptions& opt,
                            std::unique_ptr<SessionTracker>& out) {
    UploadSession s;
    auto r = LoadSessionFile(path, s);
    if (!r.ok) return r;

    out.reset(new SessionTracker(std::move(s), path, opt));
    out->RepairLoaded();
    out->StartPersister();
    return Result::Ok();
}

SessionTracker::SessionTracker(UploadSession session,
                               std::string session_file,
                               const TrackerOptions& opt)
    : opt_(opt),
      session_file_(std::move(session_file)),
      session_(std::move(session)),
      opened_at_(std::chrono::steady_clock::now()) {
    if (opt_.chunk_size == 0) opt_.chunk_size = 32ULL * 1024 * 1024;
    uploaded_at_open_ = session_.uploaded_size;
}

SessionTracker::~SessionTracker() { Close(); }

std::uint64_t SessionTracker::ChunksFor(std::uint64_t bytes) const {
    return (bytes + opt_.chunk_size - 1) / opt_.chunk_size;
}

void SessionTracker::RecomputeCompletionLocked() {
    bool all = !session_.files.empty();
    for (const auto& [name, item] : session_.files) {
        if (!item.is_completed) {
            all = false;
            break;
        }
    }
    session_.is_completed = all;
}

void SessionTracker::RepairLoaded() {
    std::unique_lock lk(mu_);
    std::uint64_t total = 0;
    std::uint64_t uploaded = 0;
    for (auto& [name, item] : session_.files) {
        if (item.uploaded_size > item.total_size) {
            LogWarn("session %s: %s records %llu of %llu bytes, clamping", session_.session_id.c_str(),
                    name.c_str(), (unsigned long long)item.uploaded_size,
                    (unsigned long long)item.total_size);
            item.uploaded_size = item.total_size;
            item.chunks_uploaded = ChunksFor(item.uploaded_size);
        }
        if (item.is_completed && item.uploaded_size != item.total_size) {
            LogWarn("session %s: %s is marked complete at %llu of %llu bytes, sending it again",
                    session_.session_id.c_str(), name.c_str(),
                    (unsigned long long)item.uploaded_size, (unsigned long long)item.total_size);
            item.is_completed = false;
            item.chunks_uploaded = ChunksFor(item.uploaded_size);
        }
        total += item.total_size;
        uploaded += item.uploaded_size;
    }
    session_.total_size = total;
    session_.uploaded_size = uploaded;
    RecomputeCompletionLocked();
    uploaded_at_open_ = uploaded;
}

void SessionTracker::RegisterItem(const std::string& name,
                                  std::uint64_t size,
                                  const std::string& checksum) {
    std::unique_lock lk(mu_);
    const auto now = SessionNow();

    auto it = session_.files.find(name);
    if (it != session_.files.end()) {
        ItemProgress& item = it->second;
        if (item.total_size == size) {
            if (item.sha1_hash.empty()) item.sha1_hash = checksum;
            return;
        }
        LogWarn("item %s changed size (%llu -> %llu), restarting its progress",
                name.c_str(), (unsigned long long)item.total_size, (unsigned long long)size);
        session_.total_size -= item.total_size;
        session_.uploaded_size -= item.uploaded_size;
        session_.files.erase(it);
    }

    ItemProgress item;
    item.file_name = name;
    item.total_size = size;
    item.chunks_total = ChunksFor(size);
    item.start_time = now;
    item.last_update = now;
    item.sha1_hash = checksum;
    session_.files.emplace(name, std::move(item));

    session_.total_size += size;
    session_.last_update = now;
    session_.is_completed = false;
}

void SessionTracker::RecordProgress(const std::string& name, std::uint64_t uploaded_size) {
    std::unique_lock lk(mu_);
    auto it = session_.files.find(name);
    if (it == session_.files.end()) {
        LogDebug("progress for unregistered item %s ignored", name.c_str());
        return;
    }

    ItemProgress& item = it->second;
    if (uploaded_size > item.total_size) uploaded_size = item.total_size;
    if (uploaded_size <= item.uploaded_size) return;

    const auto now = SessionNow();
    session_.uploaded_size += uploaded_size - item.uploaded_size;
    item.uploaded_size = uploaded_size;
    item.chunks_uploaded = ChunksFor(uploaded_size);
    item.last_update = now;
    session_.last_update = now;

    if (item.uploaded_size == item.total_size) {
        item.is_completed = true;
        item.chunks_uploaded = item.chunks_total;
        RecomputeCompletionLocked();
    }
}

void SessionTracker::MarkItemComplete(const std::string& name) {
    std::unique_lock lk(mu_);
    auto it = session_.files.find(name);
    if (it == session_.files.end()) {
        LogWarn("cannot mark unregistered item %s complete", name.c_str());
        return;
    }

    ItemProgress& item = it->second;
    const auto now = SessionNow();
    if (!item.is_completed) {
        session_.uploaded_size += item.total_size - item.uploaded_size;
        item.uploaded_size = item.total_size;
        item.is_completed = true;
        item.last_update = now;
        session_.last_update = now;
    }
    item.chunks_uploaded = item.chunks_total;
    RecomputeCompletionLocked();
}

void SessionTracker::IncrementRetryCount() {
    std::unique_lock lk(mu_);
    ++session_.retry_attempts;
    session_.last_update = SessionNow();
}

UploadSession SessionTracker::SnapshotSession() const {
    std::shared_lock lk(mu_);
    return session_;
}

std::optional<ItemProgress> SessionTracker::Item(const std::string& name) const {
    std::shared_lock lk(mu_);
    auto it = session_.files.find(name);
    if (it == session_.files.end()) return std::nullopt;
    return it->second;
}

bool SessionTracker::IsItemComplete(const std::string& name) const {
    std::shared_lock lk(mu_);
    auto it = session_.files.find(name);
    return it != session_.files.end() && it->second.is_completed;
}

OverallProgress SessionTracker::Overall() const {
    std::shared_lock lk(mu_);
    OverallProgress p;
    p.uploaded = session_.uploaded_size;
    p.total = session_.total_size;
    if (p.total > 0) {
        p.percent = static_cast<double>(p.uploaded) * 100.0 / static_cast<double>(p.total);
    }
    return p;
}

double SessionTracker::UploadSpeed() const {
    std::uint64_t uploaded = 0;
    {
        std::shared_lock lk(mu_);
        uploaded = session_.uploaded_size;
    }
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - opened_at_).count();
    if (elapsed <= 0.0 || uploaded <= uploaded_at_open_) return 0.0;
    return static_cast<double>(uploaded - uploaded_at_open_) / elapsed;
}

std::chrono::seconds SessionTracker::Eta() const {
    const double speed = UploadSpeed();
    if (speed <= 0.0) return std::chrono::seconds{0};
    const OverallProgress p = Overall();
    const std::uint64_t remaining = p.total > p.uploaded ? p.total - p.uploaded : 0;
    return std::chrono::seconds(static_cast<long long>(static_cast<double>(remaining) / speed));
}

Result SessionTracker::PersistNow() {
    // Snapshot under persist_mu_ so files land in snapshot order.
    std::lock_guard<std::mutex> lk(persist_mu_);
    if (deleted_) return Result::Ok();
    return WriteSessionFile(session_file_, SnapshotSession());
}

void SessionTracker::StartPersister() {
    if (!opt_.auto_save || opt_.save_interval.count() <= 0) return;
    persister_ = std::thread([this] { PersistLoop(); });
}

void SessionTracker::PersistLoop() {
    std::unique_lock<std::mutex> lk(stop_mu_);
    while (!stop_requested_) {
        if (stop_cv_.wait_for(lk, opt_.save_interval, [this] { return stop_requested_; })) {
            break;
        }
        lk.unlock();
        auto r = PersistNow();
        if (!r.ok) {
            LogError("Failed to auto-save session: %s", r.msg.c_str());
        }
        lk.lock();
    }
}

bool SessionTracker::StopPersister() {
    if (stopped_.exchange(true)) return false;
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (persister_.joinable()) persister_.join();
    return true;
}

void SessionTracker::Close() {
    if (!StopPersister()) return;
    auto r = PersistNow();
    if (!r.ok) {
        LogError("Failed to save session %s: %s", session_file_.c_str(), r.msg.c_str());
    }
}

Result SessionTracker::Delete() {
    StopPersister();

    std::lock_guard<std::mutex> lk(persist_mu_);
    deleted_ = true;
    if (std::remove(session_file_.c_str()) != 0 && errno != ENOENT) {
        const int e = errno;
        return Result::FailErrno(e, "failed to remove session file " + session_file_ + " (" +
                                        std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace ovaup

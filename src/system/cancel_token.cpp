#include "system/cancel_token.hpp"

#include <algorithm>

namespace ovaup {

void CancelToken::Cancel() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancelToken::IsCancelled() const {
    if (cancelled_.load(std::memory_order_acquire)) return true;
    return linked_ && linked_->load(std::memory_order_relaxed);
}

bool CancelToken::WaitFor(std::chrono::milliseconds d) const {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + d;

    std::unique_lock<std::mutex> lk(mu_);
    while (true) {
        if (IsCancelled()) return true;

        const auto now = clock::now();
        if (now >= deadline) return false;

        auto slice = deadline - now;
        if (linked_) slice = std::min<clock::duration>(slice, kLinkedPoll);
        cv_.wait_for(lk, slice);
    }
}

} // namespace ovaup

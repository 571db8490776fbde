#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ovaup {

// Cancellation signal threaded through a run. Cancel() wakes every waiter.
// A token may be linked to an external flag (the signal handler's g_cancel);
// waits poll that flag because a signal handler cannot notify a condvar.
class CancelToken {
  public:
    CancelToken() = default;
    explicit CancelToken(const std::atomic_bool* linked) : linked_(linked) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void Cancel();
    bool IsCancelled() const;

    // Sleeps for `d` unless cancelled first. Returns true if cancelled.
    bool WaitFor(std::chrono::milliseconds d) const;

  private:
    static constexpr std::chrono::milliseconds kLinkedPoll{100};

    const std::atomic_bool* linked_ = nullptr;
    std::atomic_bool cancelled_{false};
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
};

} // namespace ovaup

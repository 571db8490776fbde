#pragma once

#include "system/cancel_token.hpp"
#include "util/result.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace ovaup {

struct RetryPolicy {
    static constexpr int kUnbounded = 0;

    int max_attempts = kUnbounded;
    std::chrono::milliseconds base_delay{2000};
    std::chrono::milliseconds max_delay{120000};
    double backoff_factor = 1.5;
    double jitter_fraction = 0.2; // [0, 1]
    // Substrings of the error message that make a failure retryable.
    // Empty means every failure is retryable.
    std::vector<std::string> retryable_patterns;

    static RetryPolicy Network();
    static std::vector<std::string> DefaultNetworkPatterns();
};

struct RetryStats {
    int attempts = 0;
    Result last_error;
    std::chrono::milliseconds current_delay{0};
    std::chrono::steady_clock::duration elapsed{};
};

// Runs an operation until it succeeds, fails terminally, or is cancelled.
// Holds no state between Execute() calls; one executor may serve many
// threads concurrently.
class RetryExecutor {
  public:
    using Operation = std::function<Result()>;
    // (attempt, error of that attempt, delay before the next attempt)
    using FailureCallback =
        std::function<void(int attempt, const Result& error, std::chrono::milliseconds delay)>;

    explicit RetryExecutor(RetryPolicy policy);

    // Returns Ok, or a Result with ErrorCode::Exhausted carrying the last
    // error text, or ErrorCode::Cancelled if the cancel token fired while
    // waiting for the next attempt.
    Result Execute(const CancelToken& cancel,
                   const Operation& op,
                   const FailureCallback& on_failure = {},
                   RetryStats* stats = nullptr) const;

    bool IsRetryable(const Result& error) const;
    bool ShouldRetry(const Result& error, int attempt) const;

    // Backoff before attempt `attempt + 1`, jitter included, in [0, max_delay].
    std::chrono::milliseconds ComputeDelay(int attempt) const;

    const RetryPolicy& Policy() const { return policy_; }

  private:
    RetryPolicy policy_;
};

} // namespace ovaup

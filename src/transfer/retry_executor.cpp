#include "transfer/retry_executor.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace ovaup {

namespace {

double UniformSigned() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    return dist(rng);
}

long long ElapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

} // namespace

std::vector<std::string> RetryPolicy::DefaultNetworkPatterns() {
    return {
        "connection refused",
        "timeout",
        "network",
        "temporary failure",
        "503",
        "502",
        "504",
        "EOF",
        "broken pipe",
    };
}

RetryPolicy RetryPolicy::Network() {
    RetryPolicy p;
    p.retryable_patterns = DefaultNetworkPatterns();
    return p;
}

RetryExecutor::RetryExecutor(RetryPolicy policy) : policy_(std::move(policy)) {
    policy_.jitter_fraction = std::clamp(policy_.jitter_fraction, 0.0, 1.0);
    if (policy_.backoff_factor < 1.0) policy_.backoff_factor = 1.0;
    if (policy_.base_delay.count() < 0) policy_.base_delay = std::chrono::milliseconds{0};
    if (policy_.max_delay < policy_.base_delay) policy_.max_delay = policy_.base_delay;
    if (policy_.max_attempts < 0) policy_.max_attempts = RetryPolicy::kUnbounded;
}

bool RetryExecutor::IsRetryable(const Result& error) const {
    if (policy_.retryable_patterns.empty()) return true;
    for (const auto& pattern : policy_.retryable_patterns) {
        if (error.msg.find(pattern) != std::string::npos) return true;
    }
    return false;
}

bool RetryExecutor::ShouldRetry(const Result& error, int attempt) const {
    if (policy_.max_attempts != RetryPolicy::kUnbounded && attempt >= policy_.max_attempts) {
        return false;
    }
    return IsRetryable(error);
}

std::chrono::milliseconds RetryExecutor::ComputeDelay(int attempt) const {
    const double base = static_cast<double>(policy_.base_delay.count());
    const double cap = static_cast<double>(policy_.max_delay.count());

    double delay = base * std::pow(policy_.backoff_factor, static_cast<double>(std::max(attempt, 1) - 1));
    if (!std::isfinite(delay) || delay > cap) delay = cap;

    if (policy_.jitter_fraction > 0.0) {
        delay += delay * policy_.jitter_fraction * UniformSigned();
    }
    delay = std::clamp(delay, 0.0, cap);

    return std::chrono::milliseconds(static_cast<long long>(delay));
}

Result RetryExecutor::Execute(const CancelToken& cancel,
                              const Operation& op,
                              const FailureCallback& on_failure,
                              RetryStats* stats) const {
    RetryStats local;
    RetryStats& st = stats ? *stats : local;
    st = RetryStats{};

    const auto start = std::chrono::steady_clock::now();

    for (int attempt = 1;; ++attempt) {
        st.attempts = attempt;
        LogDebug("attempt %d (elapsed %lld ms)", attempt, ElapsedMs(start));

        Result r = op();
        st.elapsed = std::chrono::steady_clock::now() - start;
        if (r.ok) {
            if (attempt > 1) {
                LogInfo("operation succeeded after %d attempts (%lld ms)", attempt, ElapsedMs(start));
            }
            return r;
        }

        st.last_error = r;

        // The operation observed the cancellation itself.
        if (r.code == ErrorCode::Cancelled) {
            return Result::Fail(ErrorCode::Cancelled,
                                "operation cancelled after " + std::to_string(attempt) +
                                    " attempts: " + r.msg);
        }

        if (!ShouldRetry(r, attempt)) {
            LogError("operation failed after %d attempt(s), no more retries: %s",
                     attempt, r.msg.c_str());
            return Result::Fail(ErrorCode::Exhausted,
                                "operation failed after " + std::to_string(attempt) +
                                    " attempts: " + r.msg);
        }

        const auto delay = ComputeDelay(attempt);
        st.current_delay = delay;

        LogWarn("attempt %d failed, retrying in %lld ms: %s",
                attempt, (long long)delay.count(), r.msg.c_str());

        if (on_failure) on_failure(attempt, r, delay);

        if (cancel.WaitFor(delay)) {
            return Result::Fail(ErrorCode::Cancelled,
                                "operation cancelled after " + std::to_string(attempt) +
                                    " attempts: " + r.msg);
        }
    }
}

} // namespace ovaup

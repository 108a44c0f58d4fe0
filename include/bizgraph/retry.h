#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/retry.h - Bounded retry with jittered exponential backoff
// ═══════════════════════════════════════════════════════════════════
//
//  Only retryable errors (transient store failures) are retried. Every
//  other error propagates on the first attempt. Sleeping never runs
//  past the caller's deadline.
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "deadline.h"
#include "errors.h"
#include "json_utils.h"
#include <algorithm>
#include <chrono>
#include <random>
#include <string>
#include <thread>

namespace bizgraph {

struct RetryPolicy {
    int maxAttempts = 3;
    int baseDelayMs = 5;
    int maxDelayMs = 40;

    BIZGRAPH_SERIALIZE_DEFAULTS(RetryPolicy, maxAttempts, baseDelayMs, maxDelayMs)
};

namespace detail {
// Full jitter: uniform in [0, min(maxDelay, base * 2^attempt)].
inline std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int attempt) {
    thread_local std::mt19937 rng{std::random_device{}()};
    long long ceiling = static_cast<long long>(policy.baseDelayMs) << std::min(attempt, 20);
    ceiling = std::min<long long>(ceiling, policy.maxDelayMs);
    std::uniform_int_distribution<long long> dist(0, std::max<long long>(ceiling, 0));
    return std::chrono::milliseconds(dist(rng));
}
} // namespace detail

template <typename Func>
auto withRetry(const std::string& operation, const RetryPolicy& policy,
               const Deadline& deadline, Func&& fn) -> decltype(fn()) {
    int attempts = std::max(policy.maxAttempts, 1);
    for (int attempt = 0;; ++attempt) {
        if (deadline.expired()) throw timeoutError(operation);
        try {
            return fn();
        } catch (const Error& e) {
            if (!e.retryable() || attempt + 1 >= attempts) throw;
            auto delay = std::min(detail::backoffDelay(policy, attempt), deadline.remaining());
            console::debug("retrying", operation, "after", delay.count(), "ms:", e.what());
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace bizgraph

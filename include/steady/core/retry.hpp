// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/outcome.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>

namespace steady::core {

// Delay to wait after `failed_attempts` consecutive failures
using BackoffFn = std::function<std::chrono::milliseconds(std::uint32_t failed_attempts)>;

// Decides whether a failed result is worth another whole attempt
using RetryPredicate = std::function<bool(const DownloadResult&)>;

using AttemptFn = std::function<DownloadResult(std::uint32_t attempt)>;

struct RetryPolicy {
    std::uint32_t max_attempts{1};
    BackoffFn backoff;
    RetryPredicate should_retry;
};

// base * 2^(n-1), capped at max_delay
[[nodiscard]] BackoffFn exponential_backoff(std::chrono::milliseconds base,
                                            std::chrono::milliseconds max_delay);

// Retries transient and integrity failures, but stops when a failure
// repeats identically: the same rejected probe status, or the same
// mismatching digest twice in a row. Stateful; use one per download.
[[nodiscard]] RetryPredicate default_retry_predicate();

// Sleep unless stoken fires first. Returns false when interrupted.
bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stoken);

// Run attempt() until it succeeds, the predicate declines, attempts run out
// or cancellation is requested while backing off. Returns the last result
// with `attempts` filled in.
[[nodiscard]] DownloadResult run_with_retry(const RetryPolicy& policy,
                                            const AttemptFn& attempt,
                                            std::stop_token stoken);

} // namespace steady::core

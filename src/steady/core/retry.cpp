// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/retry.hpp>
#include <steady/core/log.hpp>
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace steady::core {

BackoffFn exponential_backoff(std::chrono::milliseconds base, std::chrono::milliseconds max_delay) {
    return [base, max_delay](std::uint32_t failed_attempts) {
        if (failed_attempts == 0 || base.count() <= 0) {
            return std::chrono::milliseconds{0};
        }
        auto delay = base;
        for (std::uint32_t i = 1; i < failed_attempts && delay < max_delay; ++i) {
            delay *= 2;
        }
        return std::min(delay, max_delay);
    };
}

RetryPredicate default_retry_predicate() {
    std::optional<std::int32_t> last_rejected_status;
    std::optional<Digest> last_mismatch;

    return [last_rejected_status, last_mismatch](const DownloadResult& r) mutable {
        switch (r.outcome) {
            case DownloadOutcome::success:
            case DownloadOutcome::cancelled:
                return false;

            case DownloadOutcome::transient_failure:
                // Same input, same answer
                if (r.error == DownloadErrc::invalid_url || r.error == DownloadErrc::invalid_config) {
                    return false;
                }
                if (r.error == DownloadErrc::probe_rejected) {
                    if (last_rejected_status == r.http_status) {
                        logger()->warn("retry: probe rejected with {} again, giving up", r.http_status);
                        return false;
                    }
                    last_rejected_status = r.http_status;
                } else {
                    last_rejected_status.reset();
                }
                return true;

            case DownloadOutcome::integrity_failure:
                if (r.computed_hash && last_mismatch == r.computed_hash) {
                    logger()->warn("retry: same corrupt digest {} twice, giving up", to_hex(*r.computed_hash));
                    return false;
                }
                last_mismatch = r.computed_hash;
                return true;
        }
        return false;
    };
}

bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stoken) {
    if (delay.count() <= 0) {
        return !stoken.stop_requested();
    }
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    // Nothing notifies cv; only the timeout or a stop request ends the wait
    (void)cv.wait_for(lock, stoken, delay, [] { return false; });
    return !stoken.stop_requested();
}

DownloadResult run_with_retry(const RetryPolicy& policy, const AttemptFn& attempt,
                              std::stop_token stoken) {
    const std::uint32_t max_attempts = std::max<std::uint32_t>(policy.max_attempts, 1);
    DownloadResult result;

    for (std::uint32_t n = 1; n <= max_attempts; ++n) {
        result = attempt(n);
        result.attempts = n;

        if (result.ok()) {
            return result;
        }
        if (n == max_attempts) {
            logger()->error("retry: giving up after {} attempts: {}", n, result.error.message());
            break;
        }
        if (policy.should_retry && !policy.should_retry(result)) {
            break;
        }

        auto delay = policy.backoff ? policy.backoff(n) : std::chrono::milliseconds{0};
        logger()->info("retry: attempt {}/{} ended with {} ({}), next in {} ms",
                       n, max_attempts, to_string(result.outcome), result.error.message(), delay.count());
        if (!interruptible_sleep(delay, stoken)) {
            result.outcome = DownloadOutcome::cancelled;
            result.error = make_error_code(DownloadErrc::cancelled);
            break;
        }
    }
    return result;
}

} // namespace steady::core

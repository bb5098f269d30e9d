// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/downloader.hpp>
#include <steady/core/capabilities.hpp>
#include <steady/core/log.hpp>
#include <steady/core/segment.hpp>
#include <exception>

namespace steady::core {

Downloader::Downloader(HttpClient& client, EngineConfig config)
    : client_(client)
    , config_(std::move(config)) {}

DownloadResult Downloader::download(const std::string& url,
                                    const std::string& destination,
                                    const ProgressSink& on_progress,
                                    std::stop_token stoken) noexcept {
    DownloadResult result;
    try {
        if (auto ec = config_.validate()) {
            logger()->error("download: {}", ec.message());
            result.error = ec;
            return result;
        }

        RetryPolicy policy;
        policy.max_attempts = config_.max_attempts;
        policy.backoff = backoff_ ? backoff_
                                  : exponential_backoff(config_.retry_base_delay, config_.retry_max_delay);
        policy.should_retry = predicate_ ? predicate_ : default_retry_predicate();

        const TransferRequest request{url, destination};
        logger()->info("download: {} -> {}", url, destination);

        result = run_with_retry(policy,
            [&](std::uint32_t n) { return attempt(request, on_progress, stoken, n); },
            stoken);

        if (result.ok()) {
            logger()->info("download: {} complete, {} bytes in {} attempt(s)",
                           destination, result.bytes_transferred, result.attempts);
        } else {
            logger()->error("download: {} ended with {}: {}",
                            url, to_string(result.outcome), result.error.message());
        }
        return result;
    } catch (const std::exception& e) {
        logger()->error("download: {} raised: {}", url, e.what());
        result.outcome = DownloadOutcome::transient_failure;
        result.error = make_error_code(DownloadErrc::network_error);
        return result;
    } catch (...) {
        logger()->error("download: {} raised an unknown exception", url);
        result.outcome = DownloadOutcome::transient_failure;
        result.error = make_error_code(DownloadErrc::network_error);
        return result;
    }
}

DownloadResult Downloader::attempt(const TransferRequest& request,
                                   const ProgressSink& on_progress,
                                   std::stop_token stoken,
                                   std::uint32_t number) noexcept {
    DownloadResult result;

    if (stoken.stop_requested()) {
        result.outcome = DownloadOutcome::cancelled;
        result.error = make_error_code(DownloadErrc::cancelled);
        return result;
    }

    try {
        if (number > 1) {
            emit_progress(on_progress, make_progress(std::nullopt, 0,
                "retrying, attempt " + std::to_string(number) + " of " + std::to_string(config_.max_attempts)));
        }

        std::int32_t rejected_status = 0;
        auto caps = probe_capabilities(client_, request.url, stoken, &rejected_status);
        if (!caps) {
            result.error = caps.error();
            result.http_status = rejected_status;
            result.outcome = (caps.error() == DownloadErrc::cancelled || stoken.stop_requested())
                ? DownloadOutcome::cancelled
                : DownloadOutcome::transient_failure;
            return result;
        }

        auto plan = plan_transfer(*caps, config_.chunk_size);
        logger()->info("download: attempt {} using {} transfer, {} request(s)",
                       number, to_string(plan.strategy), plan.request_count());

        TransferEngine engine(client_, config_.buffer_size, config_.remove_partial_on_cancel);
        return engine.run(request, *caps, plan, on_progress, stoken);
    } catch (const std::exception& e) {
        logger()->warn("download: attempt {} raised: {}", number, e.what());
        result.outcome = DownloadOutcome::transient_failure;
        result.error = make_error_code(DownloadErrc::network_error);
        return result;
    } catch (...) {
        logger()->warn("download: attempt {} raised an unknown exception", number);
        result.outcome = DownloadOutcome::transient_failure;
        result.error = make_error_code(DownloadErrc::network_error);
        return result;
    }
}

} // namespace steady::core

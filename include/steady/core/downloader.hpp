// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/config.hpp>
#include <steady/core/http_client.hpp>
#include <steady/core/outcome.hpp>
#include <steady/core/progress.hpp>
#include <steady/core/retry.hpp>
#include <steady/core/transfer.hpp>
#include <stop_token>
#include <string>

namespace steady::core {

// Caller-facing engine: probe, select strategy, transfer, verify, all
// wrapped in whole-attempt retries. Every retry starts again from byte zero.
class Downloader {
public:
    explicit Downloader(HttpClient& client, EngineConfig config = {});

    // Non-copyable, non-movable (holds a reference to the client)
    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    // Download url into destination. on_progress runs synchronously on the
    // calling thread. Never throws; the outcome says what happened.
    [[nodiscard]] DownloadResult download(const std::string& url,
                                          const std::string& destination,
                                          const ProgressSink& on_progress = {},
                                          std::stop_token stoken = {}) noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    // Replace the exponential backoff derived from the config
    void backoff(BackoffFn fn) noexcept { backoff_ = std::move(fn); }

    // Replace the default retriability rule; applies to later downloads
    void retry_predicate(RetryPredicate fn) noexcept { predicate_ = std::move(fn); }

private:
    // One probe→select→transfer→verify pass
    [[nodiscard]] DownloadResult attempt(const TransferRequest& request,
                                         const ProgressSink& on_progress,
                                         std::stop_token stoken,
                                         std::uint32_t number) noexcept;

    HttpClient& client_;
    EngineConfig config_;
    BackoffFn backoff_;
    RetryPredicate predicate_;
};

} // namespace steady::core

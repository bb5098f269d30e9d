// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/capabilities.hpp>
#include <steady/core/http_client.hpp>
#include <steady/core/outcome.hpp>
#include <steady/core/progress.hpp>
#include <steady/core/segment.hpp>
#include <cstddef>
#include <stop_token>
#include <string>

namespace steady::core {

struct TransferRequest {
    std::string url;
    std::string destination;
};

// Streams a TransferPlan into the destination file. Every buffer read is
// written, hashed, counted and reported, in that order. Cancellation is
// observed before each request and each buffer read, so it takes effect
// within one buffer's worth of I/O.
class TransferEngine {
public:
    TransferEngine(HttpClient& client, std::size_t buffer_size, bool remove_partial_on_cancel) noexcept
        : client_(client)
        , buffer_size_(buffer_size)
        , remove_partial_on_cancel_(remove_partial_on_cancel) {}

    // Runs one attempt, then verifies integrity. Failed attempts never leave
    // the destination behind; a cancelled one keeps it only when configured to.
    [[nodiscard]] DownloadResult run(const TransferRequest& request,
                                     const ServerCapabilities& caps,
                                     const TransferPlan& plan,
                                     const ProgressSink& on_progress,
                                     std::stop_token stoken) noexcept;

private:
    [[nodiscard]] std::expected<BodyStreamPtr, std::error_code>
    open_request(const std::string& url, const TransferPlan& plan, std::size_t index,
                 std::stop_token stoken);

    HttpClient& client_;
    std::size_t buffer_size_;
    bool remove_partial_on_cancel_;
};

} // namespace steady::core

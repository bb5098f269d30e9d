// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/hasher.hpp>
#include <steady/core/http_client.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

namespace steady::core {

// What the server told us about the resource, once per attempt
struct ServerCapabilities {
    std::int32_t http_status{0};
    std::optional<std::uint64_t> declared_content_length;
    bool supports_range_requests{false};
    std::optional<Digest> declared_content_hash;
};

// Extract capabilities from probe headers (Content-Length, Accept-Ranges, Content-MD5)
[[nodiscard]] ServerCapabilities parse_capabilities(const HttpResponse& response);

// Issue the metadata request. A non-200 status yields probe_rejected;
// the status is still reported through `rejected_status` when given.
[[nodiscard]] std::expected<ServerCapabilities, std::error_code>
probe_capabilities(HttpClient& client, const std::string& url, std::stop_token stoken,
                   std::int32_t* rejected_status = nullptr);

} // namespace steady::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <span>
#include <stop_token>
#include <string>

namespace steady::core {

// Status line and headers of a metadata (HEAD) request.
// Header names are stored lower-case.
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;

    [[nodiscard]] const std::string* header(const std::string& lower_name) const noexcept {
        auto it = headers.find(lower_name);
        return it == headers.end() ? nullptr : &it->second;
    }
};

// A response body consumed in caller-sized pieces
class BodyStream {
public:
    virtual ~BodyStream() = default;

    // Fill up to buffer.size() bytes. Returns 0 once the body is exhausted.
    [[nodiscard]] virtual std::expected<std::size_t, std::error_code>
    read(std::span<std::byte> buffer) = 0;
};

using BodyStreamPtr = std::unique_ptr<BodyStream>;

// Network collaborator used by the download engine.
// Implementations hold no state shared between calls.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Metadata-only request
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    probe(const std::string& url, std::stop_token stoken) = 0;

    // Unranged GET
    [[nodiscard]] virtual std::expected<BodyStreamPtr, std::error_code>
    fetch_all(const std::string& url, std::stop_token stoken) = 0;

    // GET of the inclusive span [start, end]
    [[nodiscard]] virtual std::expected<BodyStreamPtr, std::error_code>
    fetch_range(const std::string& url, std::uint64_t start, std::uint64_t end,
                std::stop_token stoken) = 0;
};

} // namespace steady::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/http_client.hpp>
#include <steady/core/config.hpp>
#include <cstdint>
#include <string>
#include <expected>

namespace steady::core {

// libcurl-backed HttpClient. Each call uses a fresh easy handle.
class HttpSession final : public HttpClient {
public:
    explicit HttpSession(const EngineConfig& cfg = {});
    ~HttpSession() override = default;

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept = default;
    HttpSession& operator=(HttpSession&&) noexcept = default;

    // HEAD request. Any HTTP status is returned as a response; only
    // transport failures are errors.
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    probe(const std::string& url, std::stop_token stoken) override;

    // GET expecting 200
    [[nodiscard]] std::expected<BodyStreamPtr, std::error_code>
    fetch_all(const std::string& url, std::stop_token stoken) override;

    // GET with Range header expecting 206
    [[nodiscard]] std::expected<BodyStreamPtr, std::error_code>
    fetch_range(const std::string& url, std::uint64_t start, std::uint64_t end,
                std::stop_token stoken) override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    [[nodiscard]] std::expected<BodyStreamPtr, std::error_code>
    open_body(const std::string& url, std::string range,
              std::int32_t expected_status, std::stop_token stoken);

    std::uint32_t connect_timeout_sec_;
    std::uint32_t stall_timeout_sec_;
    std::uint32_t max_redirects_;
    bool verify_tls_;
};

} // namespace steady::core

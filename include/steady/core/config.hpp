// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/error.hpp>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <expected>
#include <string_view>

namespace steady::core {

constexpr std::size_t DEFAULT_BUFFER_SIZE = 8 * 1024;               // 8 KB per read
constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;           // 1 MB per range request
constexpr std::uint32_t DEFAULT_MAX_ATTEMPTS = 4;                   // first try + 3 retries

constexpr std::chrono::milliseconds DEFAULT_RETRY_BASE_DELAY{500};
constexpr std::chrono::milliseconds DEFAULT_RETRY_MAX_DELAY{8000};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

// Runtime knobs for one Downloader
struct EngineConfig {
    std::size_t buffer_size{DEFAULT_BUFFER_SIZE};
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_attempts{DEFAULT_MAX_ATTEMPTS};
    std::chrono::milliseconds retry_base_delay{DEFAULT_RETRY_BASE_DELAY};
    std::chrono::milliseconds retry_max_delay{DEFAULT_RETRY_MAX_DELAY};
    bool remove_partial_on_cancel{true};

    // Transport settings, read by HttpSession
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
    bool verify_tls{true};

    // Rejects zero-sized buffers, chunks or attempt counts
    [[nodiscard]] std::error_code validate() const noexcept;

    // Parse a JSON document. Missing keys keep their defaults.
    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    from_json(std::string_view text) noexcept;

    // Read and parse a JSON file
    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    load(std::string_view path) noexcept;
};

} // namespace steady::core

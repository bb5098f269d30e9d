// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/hasher.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace steady::core {

// Terminal value of one attempt (and of a whole download)
enum class DownloadOutcome : std::uint8_t {
    success,
    integrity_failure,  // complete body, digest differs from Content-MD5
    transient_failure,  // probe rejected, transport or disk error; retriable
    cancelled
};

[[nodiscard]] std::string_view to_string(DownloadOutcome outcome) noexcept;

struct DownloadResult {
    DownloadOutcome outcome{DownloadOutcome::transient_failure};
    std::error_code error;
    std::int32_t http_status{0};
    std::uint64_t bytes_transferred{0};
    std::optional<Digest> computed_hash;
    std::uint32_t attempts{0};

    [[nodiscard]] bool ok() const noexcept { return outcome == DownloadOutcome::success; }
};

} // namespace steady::core

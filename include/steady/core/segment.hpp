// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/capabilities.hpp>
#include <cstdint>
#include <string_view>
#include <vector>

namespace steady::core {

// Inclusive byte span [start, end] of the remote resource
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start + 1; }

    bool operator==(const ByteRange&) const = default;
};

enum class TransferStrategy : std::uint8_t {
    chunked,     // sequence of ranged GETs
    full_stream  // one unranged GET
};

[[nodiscard]] std::string_view to_string(TransferStrategy strategy) noexcept;

// What the transfer loop fetches, in order. A full-stream plan has no
// ranges and issues a single unranged request.
struct TransferPlan {
    TransferStrategy strategy{TransferStrategy::full_stream};
    std::vector<ByteRange> ranges;

    [[nodiscard]] std::size_t request_count() const noexcept {
        return strategy == TransferStrategy::chunked ? ranges.size() : 1;
    }
};

// Ranged only when the server advertises byte ranges and declares a
// non-zero length; the chunk loop cannot terminate otherwise
[[nodiscard]] TransferStrategy select_strategy(const ServerCapabilities& caps) noexcept;

// Split [0, total_length) into chunk_size ranges, the last clipped to total_length - 1
[[nodiscard]] std::vector<ByteRange> plan_ranges(std::uint64_t total_length,
                                                 std::uint64_t chunk_size);

[[nodiscard]] TransferPlan plan_transfer(const ServerCapabilities& caps,
                                         std::uint64_t chunk_size);

} // namespace steady::core

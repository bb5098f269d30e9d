// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/segment.hpp>
#include <algorithm>

namespace steady::core {

std::string_view to_string(TransferStrategy strategy) noexcept {
    switch (strategy) {
        case TransferStrategy::chunked:     return "chunked";
        case TransferStrategy::full_stream: return "full-stream";
    }
    return "unknown";
}

TransferStrategy select_strategy(const ServerCapabilities& caps) noexcept {
    if (caps.supports_range_requests &&
        caps.declared_content_length && *caps.declared_content_length > 0) {
        return TransferStrategy::chunked;
    }
    return TransferStrategy::full_stream;
}

std::vector<ByteRange> plan_ranges(std::uint64_t total_length, std::uint64_t chunk_size) {
    std::vector<ByteRange> ranges;
    if (total_length == 0 || chunk_size == 0) {
        return ranges;
    }

    ranges.reserve(static_cast<std::size_t>(total_length / chunk_size + (total_length % chunk_size != 0)));

    std::uint64_t start = 0;
    while (start < total_length) {
        std::uint64_t remaining = total_length - start;
        std::uint64_t end = start + std::min(chunk_size, remaining) - 1;
        ranges.push_back({start, end});
        start = end + 1;
    }
    return ranges;
}

TransferPlan plan_transfer(const ServerCapabilities& caps, std::uint64_t chunk_size) {
    TransferPlan plan;
    plan.strategy = select_strategy(caps);
    if (plan.strategy == TransferStrategy::chunked) {
        plan.ranges = plan_ranges(*caps.declared_content_length, chunk_size);
    }
    return plan;
}

} // namespace steady::core

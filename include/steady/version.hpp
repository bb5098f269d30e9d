// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <format>
#include <string>

namespace steady {

constexpr struct Version {
    std::uint32_t major = 1;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;

    constexpr auto operator<=>(const Version&) const = default;

    [[nodiscard]] std::string to_string() const {
        return std::format("{}.{}.{}", major, minor, patch);
    }
} version;

// Sent with every HTTP request
[[nodiscard]] inline std::string user_agent() {
    return "steady/" + version.to_string();
}

} // namespace steady

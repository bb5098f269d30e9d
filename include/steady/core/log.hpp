// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace steady::core {

constexpr const char* LOGGER_NAME = "steady";

// Shared "steady" logger, created on first use (stderr, colour)
[[nodiscard]] std::shared_ptr<spdlog::logger> logger() noexcept;

// Adjust the shared logger's threshold
void set_log_level(spdlog::level::level_enum level) noexcept;

} // namespace steady::core

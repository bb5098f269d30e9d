// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/null_sink.h>
#include <mutex>

namespace steady::core {

std::shared_ptr<spdlog::logger> logger() noexcept {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once, [] {
        try {
            instance = spdlog::get(LOGGER_NAME);
            if (!instance) {
                instance = spdlog::stderr_color_mt(LOGGER_NAME);
                instance->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
                instance->set_level(spdlog::level::info);
            }
        } catch (const spdlog::spdlog_ex&) {
            // Sink creation failed; fall back to a silent logger
            instance = std::make_shared<spdlog::logger>(LOGGER_NAME,
                std::make_shared<spdlog::sinks::null_sink_mt>());
        }
    });
    return instance;
}

void set_log_level(spdlog::level::level_enum level) noexcept {
    logger()->set_level(level);
}

} // namespace steady::core

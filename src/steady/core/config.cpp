// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/config.hpp>
#include <steady/core/log.hpp>
#include <steady/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <string>

namespace steady::core {

namespace {

template<typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end()) {
        out = it->get<T>();
    }
}

void read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it != j.end()) {
        out = std::chrono::milliseconds{it->get<std::int64_t>()};
    }
}

} // namespace

std::error_code EngineConfig::validate() const noexcept {
    if (buffer_size == 0 || chunk_size == 0 || max_attempts == 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (retry_base_delay.count() < 0 || retry_max_delay < retry_base_delay) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    return {};
}

std::expected<EngineConfig, std::error_code>
EngineConfig::from_json(std::string_view text) noexcept {
    EngineConfig cfg;
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        read_field(j, "buffer_size", cfg.buffer_size);
        read_field(j, "chunk_size", cfg.chunk_size);
        read_field(j, "max_attempts", cfg.max_attempts);
        read_millis(j, "retry_base_delay_ms", cfg.retry_base_delay);
        read_millis(j, "retry_max_delay_ms", cfg.retry_max_delay);
        read_field(j, "remove_partial_on_cancel", cfg.remove_partial_on_cancel);
        read_field(j, "connect_timeout_sec", cfg.connect_timeout_sec);
        read_field(j, "stall_timeout_sec", cfg.stall_timeout_sec);
        read_field(j, "max_redirects", cfg.max_redirects);
        read_field(j, "verify_tls", cfg.verify_tls);
    } catch (const nlohmann::json::exception& e) {
        logger()->error("config: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }

    if (auto ec = cfg.validate()) {
        return std::unexpected(ec);
    }
    return cfg;
}

std::expected<EngineConfig, std::error_code>
EngineConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            logger()->error("config: cannot open {}", path);
            return std::unexpected(make_error_code(disk::DiskErrc::open_failed));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return from_json(ss.str());
    } catch (const std::exception& e) {
        logger()->error("config: reading {} failed: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::open_failed));
    }
}

} // namespace steady::core

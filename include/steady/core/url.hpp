// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace steady::core {

class Url {
public:
    // Accepts scheme://[userinfo@]host[:port][/path][?query][#fragment]
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    // The string that was parsed
    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path segment, "index.html" for directory URLs
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace steady::core

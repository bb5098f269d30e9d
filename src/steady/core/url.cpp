// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace steady::core {

namespace {

bool all_digits(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        Url url;
        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }

        auto rest = url_str.substr(scheme_end + 3);

        // Authority ends at the first of '/', '?', '#'
        auto authority_end = std::min(rest.find_first_of("/?#"), rest.size());
        auto authority = rest.substr(0, authority_end);
        auto tail = rest.substr(authority_end);

        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal: [::1]:8080
            auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, close + 1));
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return std::unexpected(make_error_code(DownloadErrc::invalid_url));
                }
                url.port_ = std::string(after.substr(1));
            }
        } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        if (!url.port_.empty() && !all_digits(url.port_)) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        if (auto hash = tail.find('#'); hash != std::string_view::npos) {
            url.fragment_ = std::string(tail.substr(hash + 1));
            tail = tail.substr(0, hash);
        }
        if (auto q = tail.find('?'); q != std::string_view::npos) {
            url.query_ = std::string(tail.substr(q + 1));
            tail = tail.substr(0, q);
        }
        url.path_ = tail.empty() ? "/" : std::string(tail);

        url.str_ = std::string(url_str);
        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    return name.empty() ? "index.html" : name;
}

} // namespace steady::core

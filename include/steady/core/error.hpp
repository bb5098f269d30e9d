// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace steady::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    server_error,
    permission_denied,
    probe_rejected,
    invalid_url,
    invalid_range,
    connection_lost,
    checksum_mismatch,
    hash_error,
    cancelled,
    too_many_redirects,
    ssl_error,
    dns_error,
    invalid_config,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "steady::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:            return "Success";
            case DownloadErrc::network_error:      return "Network error";
            case DownloadErrc::timeout:            return "Operation timed out";
            case DownloadErrc::not_found:          return "Resource not found (404)";
            case DownloadErrc::server_error:       return "Server error (5xx)";
            case DownloadErrc::permission_denied:  return "Permission denied";
            case DownloadErrc::probe_rejected:     return "Metadata request was not answered with 200 OK";
            case DownloadErrc::invalid_url:        return "Invalid URL";
            case DownloadErrc::invalid_range:      return "Invalid byte range";
            case DownloadErrc::connection_lost:    return "Connection lost before the body was complete";
            case DownloadErrc::checksum_mismatch:  return "Checksum mismatch";
            case DownloadErrc::hash_error:         return "Digest computation failed";
            case DownloadErrc::cancelled:          return "Download cancelled";
            case DownloadErrc::too_many_redirects: return "Too many redirects";
            case DownloadErrc::ssl_error:          return "SSL/TLS error";
            case DownloadErrc::dns_error:          return "DNS resolution failed";
            case DownloadErrc::invalid_config:     return "Invalid configuration";
            default:                               return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace steady::core

namespace std {

template<>
struct is_error_code_enum<steady::core::DownloadErrc> : true_type {};

} // namespace std

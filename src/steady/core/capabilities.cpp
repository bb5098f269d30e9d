// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/capabilities.hpp>
#include <steady/core/log.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>

namespace steady::core {

namespace {

std::optional<std::uint64_t> parse_length(std::string_view value) noexcept {
    std::uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
        return std::nullopt;
    }
    return result;
}

// Accept-Ranges is a comma separated list of range units
bool lists_bytes_unit(std::string_view value) noexcept {
    while (!value.empty()) {
        auto comma = value.find(',');
        auto token = value.substr(0, comma);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front()))) token.remove_prefix(1);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) token.remove_suffix(1);

        if (token.size() == 5 &&
            std::equal(token.begin(), token.end(), "bytes",
                       [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == b; })) {
            return true;
        }
        if (comma == std::string_view::npos) break;
        value.remove_prefix(comma + 1);
    }
    return false;
}

} // namespace

ServerCapabilities parse_capabilities(const HttpResponse& response) {
    ServerCapabilities caps;
    caps.http_status = response.status_code;

    if (const auto* cl = response.header("content-length")) {
        caps.declared_content_length = parse_length(*cl);
    }

    if (const auto* ar = response.header("accept-ranges")) {
        caps.supports_range_requests = lists_bytes_unit(*ar);
    }

    if (const auto* md5_header = response.header("content-md5")) {
        if (auto digest = decode_base64(*md5_header)) {
            if (digest->size() != MD5_DIGEST_SIZE) {
                logger()->warn("probe: Content-MD5 is {} bytes, expected {}", digest->size(), MD5_DIGEST_SIZE);
            }
            caps.declared_content_hash = std::move(*digest);
        } else {
            logger()->warn("probe: ignoring malformed Content-MD5 '{}'", *md5_header);
        }
    }

    return caps;
}

std::expected<ServerCapabilities, std::error_code>
probe_capabilities(HttpClient& client, const std::string& url, std::stop_token stoken,
                   std::int32_t* rejected_status) {
    auto response = client.probe(url, stoken);
    if (!response) {
        logger()->warn("probe: {} failed: {}", url, response.error().message());
        return std::unexpected(response.error());
    }

    if (response->status_code != 200) {
        logger()->error("probe: {} answered {}", url, response->status_code);
        if (rejected_status) *rejected_status = response->status_code;
        return std::unexpected(make_error_code(DownloadErrc::probe_rejected));
    }

    auto caps = parse_capabilities(*response);
    logger()->debug("probe: length={} ranges={} md5={}",
                    caps.declared_content_length ? std::to_string(*caps.declared_content_length) : "unknown",
                    caps.supports_range_requests,
                    caps.declared_content_hash ? to_hex(*caps.declared_content_hash) : "none");
    return caps;
}

} // namespace steady::core

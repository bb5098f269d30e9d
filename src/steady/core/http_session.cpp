// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/http_session.hpp>
#include <steady/core/log.hpp>
#include <steady/version.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <string_view>
#include <vector>

namespace steady::core {

namespace {

// Unconsumed body bytes buffered before the transfer is paused
constexpr std::size_t PENDING_HIGH_WATER = 256 * 1024;  // 256 KB
constexpr int POLL_INTERVAL_MS = 100;

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(other.ptr) { other.ptr = nullptr; }
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = other.ptr;
            other.ptr = nullptr;
        }
        return *this;
    }
};

std::error_code map_curl_error(CURLcode code, CURL* curl) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        case CURLE_PARTIAL_FILE:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_HTTP_RETURNED_ERROR: {
            long http_code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
            if (http_code == 404) return make_error_code(DownloadErrc::not_found);
            if (http_code == 401 || http_code == 403) return make_error_code(DownloadErrc::permission_denied);
            if (http_code == 416) return make_error_code(DownloadErrc::invalid_range);
            if (http_code >= 500) return make_error_code(DownloadErrc::server_error);
            return make_error_code(DownloadErrc::network_error);
        }
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

// Header callback: collects lower-cased names, restarting on every status
// line so only the final response of a redirect chain is kept
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// Aborts the transfer once cancellation is requested
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stoken = static_cast<std::stop_token*>(userdata);
    return (stoken && stoken->stop_requested()) ? 1 : 0;
}

void apply_common_options(CURL* curl, const std::string& url,
                          std::uint32_t connect_timeout, std::uint32_t stall_timeout,
                          std::uint32_t max_redirects, bool verify_tls) {
    static const std::string agent = user_agent();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, agent.c_str());
    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(max_redirects));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(stall_timeout));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Bytes must reach the hasher exactly as the server declared them
    curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 0L);
}

//=============================================================================
// CurlBodyStream
//=============================================================================

// Pull-based body: read() drives curl_multi_perform until bytes arrive
class CurlBodyStream final : public BodyStream {
public:
    CurlBodyStream(CurlHandle easy, std::stop_token stoken)
        : easy_(std::move(easy))
        , multi_(curl_multi_init())
        , stoken_(std::move(stoken)) {}

    ~CurlBodyStream() override {
        if (multi_) {
            if (attached_) curl_multi_remove_handle(multi_, easy_.ptr);
            curl_multi_cleanup(multi_);
        }
    }

    CurlBodyStream(const CurlBodyStream&) = delete;
    CurlBodyStream& operator=(const CurlBodyStream&) = delete;

    // Attach to the multi handle and wait for the first body bytes so the
    // final status code can be checked before any data is handed out
    [[nodiscard]] std::error_code start(std::int32_t expected_status) {
        if (!multi_) {
            return make_error_code(DownloadErrc::network_error);
        }

        curl_easy_setopt(easy_.ptr, CURLOPT_WRITEFUNCTION, &CurlBodyStream::write_callback);
        curl_easy_setopt(easy_.ptr, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_.ptr, CURLOPT_XFERINFOFUNCTION, &xferinfo_callback);
        curl_easy_setopt(easy_.ptr, CURLOPT_XFERINFODATA, &stoken_);
        curl_easy_setopt(easy_.ptr, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(easy_.ptr, CURLOPT_FAILONERROR, 1L);

        if (curl_multi_add_handle(multi_, easy_.ptr) != CURLM_OK) {
            return make_error_code(DownloadErrc::network_error);
        }
        attached_ = true;

        if (auto ec = fill()) {
            return ec;
        }

        long http_code = 0;
        curl_easy_getinfo(easy_.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        if (http_code != expected_status) {
            logger()->warn("http: expected status {}, got {}", expected_status, http_code);
            return make_error_code(expected_status == 206 ? DownloadErrc::invalid_range
                                                          : DownloadErrc::network_error);
        }
        return {};
    }

    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::span<std::byte> buffer) override {
        if (auto ec = fill()) {
            return std::unexpected(ec);
        }

        std::size_t available = pending_.size() - consumed_;
        if (available == 0) {
            return 0;  // finished
        }

        std::size_t n = std::min(available, buffer.size());
        std::memcpy(buffer.data(), pending_.data() + consumed_, n);
        consumed_ += n;

        if (consumed_ == pending_.size()) {
            pending_.clear();
            consumed_ = 0;
            if (paused_) {
                paused_ = false;
                curl_easy_pause(easy_.ptr, CURLPAUSE_CONT);
            }
        }
        return n;
    }

private:
    static std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlBodyStream*>(userdata);
        std::size_t bytes = size * nmemb;

        if (self->pending_.size() - self->consumed_ >= PENDING_HIGH_WATER) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }

        const auto* first = reinterpret_cast<const std::byte*>(ptr);
        self->pending_.insert(self->pending_.end(), first, first + bytes);
        return bytes;
    }

    // Run the transfer until there are unread bytes or it has finished
    [[nodiscard]] std::error_code fill() {
        while (pending_.size() == consumed_ && !done_) {
            if (stoken_.stop_requested()) {
                return make_error_code(DownloadErrc::cancelled);
            }

            int running = 0;
            if (curl_multi_perform(multi_, &running) != CURLM_OK) {
                return make_error_code(DownloadErrc::network_error);
            }

            if (running == 0) {
                int queued = 0;
                while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
                    if (msg->msg == CURLMSG_DONE) {
                        result_ = msg->data.result;
                    }
                }
                done_ = true;
                break;
            }

            if (pending_.size() == consumed_) {
                curl_multi_poll(multi_, nullptr, 0, POLL_INTERVAL_MS, nullptr);
            }
        }

        // Body bytes already buffered are still handed out before the error
        if (done_ && pending_.size() == consumed_ && result_ != CURLE_OK) {
            return map_curl_error(result_, easy_.ptr);
        }
        return {};
    }

    CurlHandle easy_;
    CURLM* multi_{nullptr};
    std::stop_token stoken_;
    std::vector<std::byte> pending_;
    std::size_t consumed_{0};
    bool attached_{false};
    bool paused_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};
};

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(const EngineConfig& cfg)
    : connect_timeout_sec_(cfg.connect_timeout_sec)
    , stall_timeout_sec_(cfg.stall_timeout_sec)
    , max_redirects_(cfg.max_redirects)
    , verify_tls_(cfg.verify_tls) {}

std::expected<HttpResponse, std::error_code>
HttpSession::probe(const std::string& url, std::stop_token stoken) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};

    apply_common_options(curl.ptr, url, connect_timeout_sec_, stall_timeout_sec_,
                         max_redirects_, verify_tls_);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, &header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, &xferinfo_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stoken);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        logger()->debug("http: HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(map_curl_error(result, curl.ptr));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);
    return response;
}

std::expected<BodyStreamPtr, std::error_code>
HttpSession::fetch_all(const std::string& url, std::stop_token stoken) {
    return open_body(url, {}, 200, std::move(stoken));
}

std::expected<BodyStreamPtr, std::error_code>
HttpSession::fetch_range(const std::string& url, std::uint64_t start, std::uint64_t end,
                         std::stop_token stoken) {
    if (end < start) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }
    std::string range = std::to_string(start) + "-" + std::to_string(end);
    return open_body(url, std::move(range), 206, std::move(stoken));
}

std::expected<BodyStreamPtr, std::error_code>
HttpSession::open_body(const std::string& url, std::string range,
                       std::int32_t expected_status, std::stop_token stoken) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    apply_common_options(curl.ptr, url, connect_timeout_sec_, stall_timeout_sec_,
                         max_redirects_, verify_tls_);
    if (!range.empty()) {
        // CURLOPT_RANGE copies the string
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    auto stream = std::make_unique<CurlBodyStream>(std::move(curl), std::move(stoken));
    if (auto ec = stream->start(expected_status)) {
        logger()->debug("http: GET {} {} failed: {}", url, range, ec.message());
        return std::unexpected(ec);
    }
    return stream;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace steady::core

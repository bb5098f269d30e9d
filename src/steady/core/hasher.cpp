// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/hasher.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>

namespace steady::core {

//=============================================================================
// Md5Hasher
//=============================================================================

std::expected<Md5Hasher, std::error_code> Md5Hasher::create() noexcept {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return std::unexpected(make_error_code(DownloadErrc::hash_error));
    }
    if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return std::unexpected(make_error_code(DownloadErrc::hash_error));
    }
    return Md5Hasher(ctx);
}

Md5Hasher::~Md5Hasher() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

Md5Hasher::Md5Hasher(Md5Hasher&& other) noexcept
    : ctx_(other.ctx_)
    , finished_(other.finished_) {
    other.ctx_ = nullptr;
}

Md5Hasher& Md5Hasher::operator=(Md5Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) EVP_MD_CTX_free(ctx_);
        ctx_ = other.ctx_;
        finished_ = other.finished_;
        other.ctx_ = nullptr;
    }
    return *this;
}

std::error_code Md5Hasher::update(std::span<const std::byte> data) noexcept {
    if (!ctx_ || finished_) {
        return make_error_code(DownloadErrc::hash_error);
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        return make_error_code(DownloadErrc::hash_error);
    }
    return {};
}

std::expected<Digest, std::error_code> Md5Hasher::finish() noexcept {
    if (!ctx_ || finished_) {
        return std::unexpected(make_error_code(DownloadErrc::hash_error));
    }
    finished_ = true;

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out, &len) != 1) {
        return std::unexpected(make_error_code(DownloadErrc::hash_error));
    }
    try {
        return Digest(out, out + len);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<Digest, std::error_code> md5(std::span<const std::byte> data) noexcept {
    auto hasher = Md5Hasher::create();
    if (!hasher) {
        return std::unexpected(hasher.error());
    }
    if (auto ec = hasher->update(data)) {
        return std::unexpected(ec);
    }
    return hasher->finish();
}

//=============================================================================
// Encoding helpers
//=============================================================================

std::string to_hex(const Digest& digest) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t b : digest) {
        out += HEX[b >> 4];
        out += HEX[b & 0x0f];
    }
    return out;
}

std::optional<Digest> decode_base64(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    if (text.empty() || text.size() % 4 != 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as output bytes
    std::size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;

    Digest out(text.size() / 4 * 3);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (len < 0 || static_cast<std::size_t>(len) < padding) {
        return std::nullopt;
    }
    out.resize(static_cast<std::size_t>(len) - padding);
    return out;
}

} // namespace steady::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Forward-declared so OpenSSL headers stay out of the public interface
struct evp_md_ctx_st;

namespace steady::core {

using Digest = std::vector<std::uint8_t>;

constexpr std::size_t MD5_DIGEST_SIZE = 16;

// Incremental MD5 over one transfer attempt
class Md5Hasher {
public:
    [[nodiscard]] static std::expected<Md5Hasher, std::error_code> create() noexcept;

    ~Md5Hasher();

    // Non-copyable, movable
    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;
    Md5Hasher(Md5Hasher&&) noexcept;
    Md5Hasher& operator=(Md5Hasher&&) noexcept;

    [[nodiscard]] std::error_code update(std::span<const std::byte> data) noexcept;

    // Finalizes the context; further updates are invalid
    [[nodiscard]] std::expected<Digest, std::error_code> finish() noexcept;

private:
    explicit Md5Hasher(evp_md_ctx_st* ctx) noexcept : ctx_(ctx) {}

    evp_md_ctx_st* ctx_{nullptr};
    bool finished_{false};
};

// One-shot MD5, used for tests and small payloads
[[nodiscard]] std::expected<Digest, std::error_code> md5(std::span<const std::byte> data) noexcept;

// Lower-case hex for logs
[[nodiscard]] std::string to_hex(const Digest& digest);

// Standard (RFC 4648) base64, padding required. nullopt on malformed input.
[[nodiscard]] std::optional<Digest> decode_base64(std::string_view text);

} // namespace steady::core

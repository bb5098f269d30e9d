// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace steady::disk {

// Sequential writer owning the destination file of one attempt
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter() { close(); }

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&&) noexcept = default;
    FileWriter& operator=(FileWriter&&) noexcept = default;

    // Create or truncate path, creating parent directories as needed
    [[nodiscard]] std::error_code open(std::string_view path) noexcept;

    // Append data at the current end of file
    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    // Flush and release the handle. Idempotent.
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

    // Best-effort delete; true when the file is gone afterwards
    static bool remove(std::string_view path) noexcept;

private:
    struct FileCloser {
        void operator()(std::FILE* f) const noexcept { std::fclose(f); }
    };

    std::unique_ptr<std::FILE, FileCloser> file_;
    std::string path_;
    std::uint64_t bytes_written_{0};
};

} // namespace steady::disk

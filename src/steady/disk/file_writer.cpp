// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/disk/file_writer.hpp>
#include <cerrno>
#include <filesystem>

namespace steady::disk {

namespace {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return make_error_code(DiskErrc::disk_full);
        case EACCES:
        case EPERM:
        case EROFS:
            return make_error_code(DiskErrc::access_denied);
        case ENOENT:
        case ENOTDIR:
        case EISDIR:
        case ENAMETOOLONG:
            return make_error_code(DiskErrc::invalid_path);
        default:
            return make_error_code(fallback);
    }
}

} // namespace

std::error_code FileWriter::open(std::string_view path) noexcept {
    close();
    bytes_written_ = 0;

    if (path.empty()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    try {
        path_ = std::string(path);

        std::filesystem::path p(path_);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                return make_error_code(DiskErrc::invalid_path);
            }
        }
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::invalid_path);
    }

    errno = 0;
    file_.reset(std::fopen(path_.c_str(), "wb"));
    if (!file_) {
        return from_errno(errno, DiskErrc::open_failed);
    }
    return {};
}

std::error_code FileWriter::write(std::span<const std::byte> data) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (data.empty()) {
        return {};
    }

    errno = 0;
    std::size_t written = std::fwrite(data.data(), 1, data.size(), file_.get());
    bytes_written_ += written;
    if (written != data.size()) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    errno = 0;
    if (std::fflush(file_.get()) != 0) {
        return from_errno(errno, DiskErrc::flush_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    file_.reset();
}

bool FileWriter::remove(std::string_view path) noexcept {
    try {
        const std::filesystem::path p(path);
        std::error_code ec;
        std::filesystem::remove(p, ec);
        // Judge by what is left. A failed lookup reports file_type::none, which is not gone
        return std::filesystem::symlink_status(p, ec).type() == std::filesystem::file_type::not_found;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace steady::disk

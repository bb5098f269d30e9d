// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/integrity.hpp>
#include <steady/core/log.hpp>
#include <steady/disk/file_writer.hpp>

namespace steady::core {

std::string_view to_string(DownloadOutcome outcome) noexcept {
    switch (outcome) {
        case DownloadOutcome::success:           return "success";
        case DownloadOutcome::integrity_failure: return "integrity failure";
        case DownloadOutcome::transient_failure: return "transient failure";
        case DownloadOutcome::cancelled:         return "cancelled";
    }
    return "unknown";
}

DownloadOutcome verify_integrity(const Digest& computed,
                                 const std::optional<Digest>& declared,
                                 std::string_view path) noexcept {
    if (!declared) {
        return DownloadOutcome::success;
    }
    if (computed == *declared) {
        return DownloadOutcome::success;
    }

    logger()->error("integrity: {} md5 {} does not match declared {}",
                    path, to_hex(computed), to_hex(*declared));

    if (!disk::FileWriter::remove(path)) {
        logger()->warn("integrity: could not delete {}", path);
    }
    return DownloadOutcome::integrity_failure;
}

} // namespace steady::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/transfer.hpp>
#include <steady/core/integrity.hpp>
#include <steady/core/log.hpp>
#include <steady/disk/file_writer.hpp>
#include <exception>
#include <vector>

namespace steady::core {

namespace {

bool is_cancellation(const std::error_code& ec, const std::stop_token& stoken) noexcept {
    return ec == DownloadErrc::cancelled || stoken.stop_requested();
}

} // namespace

std::expected<BodyStreamPtr, std::error_code>
TransferEngine::open_request(const std::string& url, const TransferPlan& plan, std::size_t index,
                             std::stop_token stoken) {
    if (plan.strategy == TransferStrategy::chunked) {
        const auto& range = plan.ranges[index];
        logger()->debug("transfer: range {}/{} bytes={}-{}",
                        index + 1, plan.ranges.size(), range.start, range.end);
        return client_.fetch_range(url, range.start, range.end, stoken);
    }
    return client_.fetch_all(url, stoken);
}

DownloadResult TransferEngine::run(const TransferRequest& request,
                                   const ServerCapabilities& caps,
                                   const TransferPlan& plan,
                                   const ProgressSink& on_progress,
                                   std::stop_token stoken) noexcept {
    DownloadResult result;
    result.http_status = caps.http_status;

    disk::FileWriter writer;
    // Set once this attempt owns the destination; a path that failed to open
    // is left untouched
    bool created = false;

    // Transport, disk and hashing errors all end the attempt the same way
    auto fail = [&](std::error_code ec) {
        logger()->warn("transfer: {} failed after {} bytes: {}",
                       request.url, result.bytes_transferred, ec.message());
        writer.close();
        if (created && !disk::FileWriter::remove(request.destination)) {
            logger()->warn("transfer: could not delete {}", request.destination);
        }
        result.outcome = DownloadOutcome::transient_failure;
        result.error = ec;
        return result;
    };

    auto cancel = [&]() {
        logger()->info("transfer: {} cancelled after {} bytes", request.url, result.bytes_transferred);
        writer.close();
        if (created && remove_partial_on_cancel_) {
            disk::FileWriter::remove(request.destination);
        }
        result.outcome = DownloadOutcome::cancelled;
        result.error = make_error_code(DownloadErrc::cancelled);
        return result;
    };

    try {
        if (buffer_size_ == 0) {
            return fail(make_error_code(DownloadErrc::invalid_config));
        }

        auto hasher = Md5Hasher::create();
        if (!hasher) {
            return fail(hasher.error());
        }

        if (auto ec = writer.open(request.destination)) {
            return fail(ec);
        }
        created = true;

        std::vector<std::byte> buffer(buffer_size_);
        const bool ranged = plan.strategy == TransferStrategy::chunked;

        for (std::size_t i = 0; i < plan.request_count(); ++i) {
            if (stoken.stop_requested()) {
                return cancel();
            }

            auto body = open_request(request.url, plan, i, stoken);
            if (!body) {
                return is_cancellation(body.error(), stoken) ? cancel() : fail(body.error());
            }

            std::uint64_t request_bytes = 0;
            while (true) {
                if (stoken.stop_requested()) {
                    return cancel();
                }

                auto n = (*body)->read(buffer);
                if (!n) {
                    return is_cancellation(n.error(), stoken) ? cancel() : fail(n.error());
                }
                if (*n == 0) {
                    break;
                }

                std::span<const std::byte> chunk(buffer.data(), *n);
                if (ranged && request_bytes + *n > plan.ranges[i].size()) {
                    return fail(make_error_code(DownloadErrc::invalid_range));
                }
                if (!ranged && caps.declared_content_length &&
                    result.bytes_transferred + *n > *caps.declared_content_length) {
                    return fail(make_error_code(DownloadErrc::connection_lost));
                }
                if (auto ec = writer.write(chunk)) {
                    return fail(ec);
                }
                if (auto ec = hasher->update(chunk)) {
                    return fail(ec);
                }

                request_bytes += *n;
                result.bytes_transferred += *n;
                emit_progress(on_progress,
                              make_progress(caps.declared_content_length, result.bytes_transferred));
            }

            if (ranged && request_bytes != plan.ranges[i].size()) {
                return fail(make_error_code(DownloadErrc::invalid_range));
            }
        }

        if (!ranged && caps.declared_content_length &&
            result.bytes_transferred != *caps.declared_content_length) {
            return fail(make_error_code(DownloadErrc::connection_lost));
        }

        if (auto ec = writer.flush()) {
            return fail(ec);
        }
        writer.close();

        auto digest = hasher->finish();
        if (!digest) {
            return fail(digest.error());
        }
        result.computed_hash = *digest;

        result.outcome = verify_integrity(*digest, caps.declared_content_hash, request.destination);
        if (result.outcome == DownloadOutcome::integrity_failure) {
            result.error = make_error_code(DownloadErrc::checksum_mismatch);
        } else {
            result.error.clear();
        }
        return result;
    } catch (const std::exception& e) {
        logger()->error("transfer: {} raised: {}", request.url, e.what());
        return fail(make_error_code(DownloadErrc::network_error));
    } catch (...) {
        logger()->error("transfer: {} raised an unknown exception", request.url);
        return fail(make_error_code(DownloadErrc::network_error));
    }
}

} // namespace steady::core

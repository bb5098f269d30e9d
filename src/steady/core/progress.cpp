// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/core/progress.hpp>
#include <steady/core/log.hpp>
#include <exception>

namespace steady::core {

TransferProgress make_progress(std::optional<std::uint64_t> total,
                               std::uint64_t transferred,
                               std::optional<std::string> note) {
    TransferProgress p;
    p.total_bytes = total;
    p.bytes_transferred = transferred;
    if (total && *total > 0) {
        p.percent_complete = static_cast<double>(transferred) / static_cast<double>(*total);
    }
    p.status_note = std::move(note);
    return p;
}

void emit_progress(const ProgressSink& sink, const TransferProgress& progress) noexcept {
    if (!sink) return;
    try {
        sink(progress);
    } catch (const std::exception& e) {
        logger()->warn("progress sink threw: {}", e.what());
    } catch (...) {
        logger()->warn("progress sink threw an unknown exception");
    }
}

//=============================================================================
// ProgressChannel
//=============================================================================

ProgressSink ProgressChannel::sink() {
    return [this](const TransferProgress& p) { push(p); };
}

void ProgressChannel::push(TransferProgress progress) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        queue_.push_back(std::move(progress));
    }
    cv_.notify_one();
}

void ProgressChannel::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<TransferProgress> ProgressChannel::next(std::stop_token stoken) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, stoken, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto p = std::move(queue_.front());
    queue_.pop_front();
    return p;
}

std::optional<TransferProgress> ProgressChannel::try_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto p = std::move(queue_.front());
    queue_.pop_front();
    return p;
}

bool ProgressChannel::closed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace steady::core

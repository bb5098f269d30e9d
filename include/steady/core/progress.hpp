// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace steady::core {

// Snapshot emitted after every buffer written to disk
struct TransferProgress {
    std::optional<std::uint64_t> total_bytes;
    std::uint64_t bytes_transferred{0};
    std::optional<double> percent_complete;  // in [0, 1]
    std::optional<std::string> status_note;
};

using ProgressSink = std::function<void(const TransferProgress&)>;

// percent_complete is left empty when the total is unknown or zero
[[nodiscard]] TransferProgress make_progress(std::optional<std::uint64_t> total,
                                             std::uint64_t transferred,
                                             std::optional<std::string> note = std::nullopt);

// Deliver to sink if one is set. Exceptions thrown by the sink are logged
// and swallowed so a faulty observer cannot fail the transfer.
void emit_progress(const ProgressSink& sink, const TransferProgress& progress) noexcept;

// Closable queue of progress values. The engine pushes through sink();
// consumers pull at their own pace from another thread.
class ProgressChannel {
public:
    ProgressChannel() = default;

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    // Sink that forwards into this channel. The channel must outlive it.
    [[nodiscard]] ProgressSink sink();

    void push(TransferProgress progress);

    // No more values will be pushed; wakes blocked readers
    void close() noexcept;

    // Blocks until a value is available, the channel is closed and drained,
    // or stoken is signalled
    [[nodiscard]] std::optional<TransferProgress> next(std::stop_token stoken = {});

    [[nodiscard]] std::optional<TransferProgress> try_next();

    [[nodiscard]] bool closed() const noexcept;

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<TransferProgress> queue_;
    bool closed_{false};
};

} // namespace steady::core

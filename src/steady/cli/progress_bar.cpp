// Copyright (c) 2026 changcheng967. All rights reserved.

#include <steady/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace steady::cli {

namespace {

constexpr int BAR_WIDTH = 30;
constexpr std::uint64_t UNKNOWN_TOTAL_STEP = 64 * 1024;

} // namespace

ProgressBar::ProgressBar(std::ostream& out, std::string_view label)
    : out_(out)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::optional<std::uint64_t> total) noexcept {
    current_ = current;
    total_ = total;

    std::int64_t step = 0;
    if (total_ && *total_ > 0) {
        step = static_cast<std::int64_t>(static_cast<double>(current_) * 100.0 / static_cast<double>(*total_));
    } else {
        step = static_cast<std::int64_t>(current_ / UNKNOWN_TOTAL_STEP);
    }

    // Only redraw on visible change; a restart (retry) resets the counter
    if (step == last_drawn_step_) return;
    last_drawn_step_ = step;
    draw();
}

void ProgressBar::note(std::string_view text) noexcept {
    clear();
    out_ << text << '\n' << std::flush;
    last_drawn_step_ = -1;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    draw();
    out_ << std::endl;
}

void ProgressBar::clear() noexcept {
    out_ << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

void ProgressBar::draw() noexcept {
    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total_ && *total_ > 0) {
        double fraction = std::clamp(static_cast<double>(current_) / static_cast<double>(*total_), 0.0, 1.0);
        line += render_bar(fraction, BAR_WIDTH);

        int pct = static_cast<int>(fraction * 100.0);
        line += " ";
        if (pct < 100) line += " ";
        if (pct < 10) line += " ";
        line += std::to_string(pct) + "%";

        line += " (";
        line += format_bytes(current_);
        line += "/";
        line += format_bytes(*total_);
        line += ")";
    } else {
        line += format_bytes(current_);
        line += " received";
    }

    line += std::string(8, ' ');
    out_ << line << std::flush;
}

std::string ProgressBar::render_bar(double fraction, int width) {
    const int filled = static_cast<int>(std::round(width * std::clamp(fraction, 0.0, 1.0)));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(width - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    std::ostringstream ss;
    if (bytes >= GB) {
        ss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << std::fixed << std::setprecision(0) << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        ss << bytes << " B";
    }
    return ss.str();
}

} // namespace steady::cli

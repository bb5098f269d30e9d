// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace steady::cli {

// Single-line terminal progress bar. Falls back to a byte counter when
// the total size is unknown.
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::string_view label = {});

    // Redraws at most once per whole percent (or per 64 KB when the total is unknown)
    void update(std::uint64_t current, std::optional<std::uint64_t> total) noexcept;

    // Print a note (e.g. retry notice) on its own line
    void note(std::string_view text) noexcept;

    // Final redraw and newline
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string render_bar(double fraction, int width);

private:
    void draw() noexcept;

    std::ostream& out_;
    std::string label_;
    std::uint64_t current_{0};
    std::optional<std::uint64_t> total_;
    std::int64_t last_drawn_step_{-1};
    bool finished_{false};
};

} // namespace steady::cli

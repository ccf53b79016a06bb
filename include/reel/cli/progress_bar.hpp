// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/progress_tracker.hpp>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

namespace reel::cli {

// Single-line progress display driven by ProgressView samples
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {}, std::ostream& out = std::cout);

    // Redraw in place; a final view also ends the line
    void update(const core::ProgressView& view) noexcept;

    // Draw the view and end the line
    void finish(const core::ProgressView& view) noexcept;

    // End the current line without drawing, so other output starts clean
    void interrupt() noexcept;

    // The line as drawn, without the leading carriage return
    [[nodiscard]] std::string render(const core::ProgressView& view) const;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    std::string label_;
    std::ostream& out_;
    std::size_t last_width_{0};
    bool active_{false};
};

// Shorten to max characters with a trailing "..."
[[nodiscard]] std::string truncate(std::string_view text, std::size_t max);

} // namespace reel::cli

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/progress_bar.hpp>
#include <algorithm>

namespace reel::cli {

namespace {

constexpr std::size_t LABEL_WIDTH = 80;

} // namespace

ProgressBar::ProgressBar(std::string_view label, std::ostream& out)
    : label_(label)
    , out_(out) {}

std::string ProgressBar::render(const core::ProgressView& view) const {
    std::string line = "  [";
    line += view.bar;
    line += "] ";
    line += view.percent;
    line += "  ";
    line += view.size;
    line += "  ";
    line += view.speed;

    if (view.eta_seconds && !view.final && *view.eta_seconds > 0) {
        line += "  ETA ";
        line += core::format_duration(*view.eta_seconds);
    }

    if (!label_.empty()) {
        line += "  -  ";
        line += truncate(label_, LABEL_WIDTH);
    }
    return line;
}

void ProgressBar::update(const core::ProgressView& view) noexcept {
    if (view.final) {
        finish(view);
        return;
    }

    try {
        auto line = render(view);

        // Pad over the tail of a longer previous line
        auto width = line.size();
        if (width < last_width_) {
            line.append(last_width_ - width, ' ');
        }
        last_width_ = width;

        out_ << '\r' << line << std::flush;
        active_ = true;
    } catch (const std::exception&) {
        active_ = false;
    }
}

void ProgressBar::finish(const core::ProgressView& view) noexcept {
    try {
        auto line = render(view);
        if (line.size() < last_width_) {
            line.append(last_width_ - line.size(), ' ');
        }
        out_ << '\r' << line << '\n' << std::flush;
    } catch (const std::exception&) {
        out_ << '\n' << std::flush;
    }
    active_ = false;
    last_width_ = 0;
}

void ProgressBar::interrupt() noexcept {
    if (!active_) return;
    out_ << '\n' << std::flush;
    active_ = false;
    last_width_ = 0;
}

std::string truncate(std::string_view text, std::size_t max) {
    if (text.size() <= max) return std::string(text);
    if (max <= 3) return std::string(text.substr(0, max));
    return std::string(text.substr(0, max - 3)) + "...";
}

} // namespace reel::cli

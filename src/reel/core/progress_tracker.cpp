// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/progress_tracker.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace reel::core {

//=============================================================================
// ProgressTracker
//=============================================================================

ProgressTracker::ProgressTracker(std::uint64_t resume_offset,
                                 std::optional<std::uint64_t> expected_total,
                                 Clock::time_point start,
                                 std::chrono::milliseconds interval) noexcept
    : resume_offset_(resume_offset)
    , total_(expected_total)
    , start_(start)
    , interval_(interval) {}

std::optional<ProgressView> ProgressTracker::add(std::uint64_t bytes, Clock::time_point now) {
    transferred_ += bytes;

    if (last_emit_ && now - *last_emit_ < interval_) {
        return std::nullopt;
    }
    last_emit_ = now;
    return make_view(now, false);
}

ProgressView ProgressTracker::finish(Clock::time_point now) {
    last_emit_ = now;
    return make_view(now, true);
}

ProgressView ProgressTracker::make_view(Clock::time_point now, bool final) {
    ProgressView view;
    view.total = total_;
    view.final = final;

    std::uint64_t observed = resume_offset_ + transferred_;
    std::uint64_t shown = observed;

    if (total_) {
        // Small overflow from framing is displayed as the total
        if ((final || observed > *total_) && observed <= *total_ + PROGRESS_OVERFLOW_SLACK) {
            shown = *total_;
        }

        double ratio = 1.0;
        if (*total_ > 0) {
            ratio = static_cast<double>(shown) / static_cast<double>(*total_);
        }
        ratio = std::clamp(ratio, 0.0, 1.0);
        if (final) ratio = 1.0;

        ratio = std::max(ratio, last_ratio_);
        last_ratio_ = ratio;
        view.ratio = ratio;

        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << (ratio * 100.0) << "%";
        view.percent = ss.str();
    } else {
        view.percent = "--%";
    }
    view.shown_bytes = shown;

    double elapsed = std::chrono::duration<double>(now - start_).count();
    elapsed = std::max(elapsed, 0.001);
    view.speed_bps = static_cast<std::uint64_t>(static_cast<double>(transferred_) / elapsed);

    if (total_ && view.speed_bps > 0) {
        std::uint64_t remaining = *total_ > shown ? *total_ - shown : 0;
        view.eta_seconds = remaining / view.speed_bps;
    }

    view.bar = build_bar(view.ratio);
    view.size = format_bytes(shown);
    if (total_) {
        view.size += " / ";
        view.size += format_bytes(*total_);
    }
    view.speed = format_speed(view.speed_bps);
    return view;
}

//=============================================================================
// ProgressSink
//=============================================================================

ProgressSink::ProgressSink(disk::ByteSink& downstream, ProgressTracker& tracker, ProgressCallback callback)
    : downstream_(downstream)
    , tracker_(tracker)
    , callback_(std::move(callback)) {}

std::error_code ProgressSink::write(std::span<const std::byte> data) noexcept {
    if (auto ec = downstream_.write(data)) {
        return ec;
    }

    try {
        auto view = tracker_.add(data.size(), ProgressTracker::Clock::now());
        if (view && callback_) {
            callback_(*view);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Progress reporting failed: {}", e.what());
    }
    return {};
}

//=============================================================================
// Formatting
//=============================================================================

std::string format_bytes(std::uint64_t bytes) {
    static constexpr const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr std::size_t UNIT_COUNT = sizeof(UNITS) / sizeof(UNITS[0]);

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit < UNIT_COUNT - 1) {
        value /= 1024.0;
        ++unit;
    }

    int decimals = value >= 100.0 ? 0 : value >= 10.0 ? 1 : 2;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value << " " << UNITS[unit];
    return ss.str();
}

std::string format_speed(std::uint64_t bytes_per_sec) {
    if (bytes_per_sec == 0) return "-";
    return format_bytes(bytes_per_sec) + "/s";
}

std::string format_duration(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes;
        return ss.str() + "m " + std::to_string(secs) + "s";
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

std::string build_bar(double ratio, std::size_t width) {
    ratio = std::clamp(std::isnan(ratio) ? 0.0 : ratio, 0.0, 1.0);
    auto filled = static_cast<std::size_t>(std::round(ratio * static_cast<double>(width)));
    filled = std::min(filled, width);

    std::string bar(filled, '=');
    bar.append(width - filled, '-');
    return bar;
}

} // namespace reel::core

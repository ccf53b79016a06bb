// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/disk/file_writer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace reel::core {

// One rendered progress sample
struct ProgressView {
    std::uint64_t shown_bytes{0};               // Including the resume offset, clamped near the total
    std::optional<std::uint64_t> total;
    double ratio{0.0};                          // [0, 1]; 0 while the total is unknown
    std::uint64_t speed_bps{0};                 // This attempt only
    std::optional<std::uint64_t> eta_seconds;

    std::string bar;        // PROGRESS_BAR_WIDTH cells
    std::string percent;    // "42.0%" or "--%"
    std::string size;       // "12.3 MB / 45.0 MB"
    std::string speed;      // "1.20 MB/s" or "-"
    bool final{false};
};

using ProgressCallback = std::function<void(const ProgressView&)>;

// Turns raw byte counts into throttled, monotonic progress views
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    ProgressTracker(std::uint64_t resume_offset,
                    std::optional<std::uint64_t> expected_total,
                    Clock::time_point start,
                    std::chrono::milliseconds interval = PROGRESS_SAMPLE_INTERVAL) noexcept;

    // Count bytes; returns a view on the first call and then at most once per interval
    [[nodiscard]] std::optional<ProgressView> add(std::uint64_t bytes, Clock::time_point now);

    // Final view, always produced; ratio is 1.0 when the total is known
    [[nodiscard]] ProgressView finish(Clock::time_point now);

    [[nodiscard]] std::uint64_t transferred() const noexcept { return transferred_; }
    [[nodiscard]] std::uint64_t observed() const noexcept { return resume_offset_ + transferred_; }
    [[nodiscard]] const std::optional<std::uint64_t>& expected_total() const noexcept { return total_; }

private:
    [[nodiscard]] ProgressView make_view(Clock::time_point now, bool final);

    std::uint64_t resume_offset_;
    std::optional<std::uint64_t> total_;
    Clock::time_point start_;
    std::chrono::milliseconds interval_;

    std::uint64_t transferred_{0};
    double last_ratio_{0.0};
    std::optional<Clock::time_point> last_emit_;
};

// Counts bytes on their way downstream and reports views to a callback
class ProgressSink final : public disk::ByteSink {
public:
    ProgressSink(disk::ByteSink& downstream, ProgressTracker& tracker, ProgressCallback callback);

    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept override;
    [[nodiscard]] std::error_code flush() noexcept override { return downstream_.flush(); }

private:
    disk::ByteSink& downstream_;
    ProgressTracker& tracker_;
    ProgressCallback callback_;
};

// 1024-based units; two decimals below 10, one below 100, none above
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

// "<size>/s", or "-" for zero
[[nodiscard]] std::string format_speed(std::uint64_t bytes_per_sec);

[[nodiscard]] std::string format_duration(std::uint64_t seconds);

// '=' for filled cells, '-' for the rest
[[nodiscard]] std::string build_bar(double ratio, std::size_t width = PROGRESS_BAR_WIDTH);

} // namespace reel::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace reel::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;                     // No bytes for this long aborts the attempt
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::chrono::milliseconds PROBE_TIMEOUT{20'000};
constexpr std::chrono::milliseconds TRANSFER_TIMEOUT{10 * 60 * 1000};
constexpr std::chrono::milliseconds BACKOFF_UNIT{1000};             // Delay before retry N is N units
constexpr std::chrono::milliseconds POLITE_PAUSE{400};              // Between consecutive tasks of a batch

constexpr std::chrono::milliseconds PROGRESS_SAMPLE_INTERVAL{100};
constexpr std::uint64_t PROGRESS_OVERFLOW_SLACK = 64 * 1024;        // Header/framing slack shown as 100%
constexpr std::size_t PROGRESS_BAR_WIDTH = 24;

constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;               // 256 KB
constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;                // 256 KB

constexpr std::string_view PART_SUFFIX = ".part";
constexpr std::string_view PROMOTE_SUFFIX = ".promote";
constexpr std::string_view SAMPLE_MARKER = ".sample";

constexpr std::string_view DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/125 Safari/537.36";
constexpr std::string_view DEFAULT_ACCEPT = "video/mp4,application/octet-stream,*/*";

// Environment lookup, replaceable in tests
using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

[[nodiscard]] std::optional<std::string> process_env(std::string_view name);

// Session-wide settings, built once at startup and passed by reference to the
// transport, prober and transfer engine
struct SessionConfig {
    std::string cookie;
    std::string user_agent{DEFAULT_USER_AGENT};
    std::string accept{DEFAULT_ACCEPT};
    std::map<std::string, std::string> headers;     // Extra request headers

    std::uint32_t max_retries{RETRY_COUNT};
    std::uint64_t sample_bytes{0};                   // 0 = full download

    std::chrono::milliseconds probe_timeout{PROBE_TIMEOUT};
    std::chrono::milliseconds transfer_timeout{TRANSFER_TIMEOUT};
    std::chrono::milliseconds backoff_unit{BACKOFF_UNIT};
    std::chrono::milliseconds polite_pause{POLITE_PAUSE};

    // Parse a JSON config document; unknown keys are ignored
    [[nodiscard]] static std::expected<SessionConfig, std::error_code>
    from_json(std::string_view text) noexcept;

    // Read and parse a JSON config file
    [[nodiscard]] static std::expected<SessionConfig, std::error_code>
    load(std::string_view path) noexcept;

    // Overlay REEL_COOKIE, REEL_COOKIE_FILE and REEL_SAMPLE_BYTES
    void apply_environment(const EnvLookup& lookup = process_env) noexcept;
};

// Read a cookie file, trimming surrounding whitespace
[[nodiscard]] std::expected<std::string, std::error_code>
read_cookie_file(std::string_view path) noexcept;

} // namespace reel::core

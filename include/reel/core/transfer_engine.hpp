// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/capability_prober.hpp>
#include <reel/core/progress_tracker.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace reel::core {

enum class TransferStatus : std::uint8_t {
    already_complete,   // Final file already whole, nothing streamed
    downloaded          // Streamed and promoted
};

[[nodiscard]] std::string_view to_string(TransferStatus status) noexcept;

// One resource to fetch; immutable for the duration of run()
struct TransferTask {
    std::string source_url;
    std::string destination_path;
    std::string referer;
    std::uint32_t max_retries{RETRY_COUNT};     // Attempts, at least 1
    std::uint64_t sample_bytes{0};              // 0 = whole resource
    std::string label;                          // Display name only
};

// Per-attempt bookkeeping
struct TransferState {
    std::uint64_t resume_offset{0};
    std::optional<std::uint64_t> expected_total;
    std::uint64_t transferred_this_attempt{0};
    std::chrono::steady_clock::time_point attempt_start;
};

// Called before each back-off wait
using RetryCallback = std::function<void(std::uint32_t attempt,
                                         std::chrono::milliseconds delay,
                                         const std::error_code& error)>;

// Resumable single-stream transfer. Blocking; one engine per thread.
//
// Partial data lives in "<destination>.part" and is promoted to the
// destination only after a successful stream. A failed or cancelled run
// leaves the temp file in place for the next invocation.
class TransferEngine {
public:
    TransferEngine(HttpTransport& transport, const SessionConfig& session) noexcept
        : transport_(transport)
        , session_(session)
        , prober_(transport, session) {}

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    [[nodiscard]] std::expected<TransferStatus, std::error_code>
    run(const TransferTask& task, std::stop_token stop = {}) noexcept;

    void callback(ProgressCallback cb) noexcept { progress_cb_ = std::move(cb); }
    void retry_callback(RetryCallback cb) noexcept { retry_cb_ = std::move(cb); }

    // invalid_url / invalid_task, or empty when the task is runnable
    [[nodiscard]] static std::error_code validate(const TransferTask& task) noexcept;

private:
    // true when the destination is already complete
    [[nodiscard]] bool resolve_existing(const TransferTask& task, const std::string& temp, std::stop_token stop);

    [[nodiscard]] std::error_code attempt(const TransferTask& task,
                                          const std::string& temp,
                                          TransferState& state,
                                          std::stop_token stop);

    // false when interrupted by a stop request
    [[nodiscard]] static bool wait_backoff(std::chrono::milliseconds delay, std::stop_token stop);

    HttpTransport& transport_;
    const SessionConfig& session_;
    CapabilityProber prober_;
    ProgressCallback progress_cb_;
    RetryCallback retry_cb_;
};

} // namespace reel::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/transfer_engine.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace reel::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string referer;
    std::string manifest;
    std::string config_file;
    std::optional<std::uint64_t> sample_bytes;
    std::optional<std::uint32_t> retries;
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::vector<std::string> errors;    // Unknown flags and bad values
};

// Per-batch outcome counts
struct BatchSummary {
    std::uint32_t downloaded{0};
    std::uint32_t skipped{0};       // Already complete
    std::uint32_t failed{0};

    [[nodiscard]] std::uint32_t total() const noexcept { return downloaded + skipped + failed; }
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Tasks from a JSON array of {url, output, referer, label}
[[nodiscard]] std::expected<std::vector<core::TransferTask>, std::error_code>
parse_manifest(std::string_view json) noexcept;

[[nodiscard]] std::expected<std::vector<core::TransferTask>, std::error_code>
load_manifest(std::string_view path) noexcept;

// Manifest tasks followed by URL tasks, with destinations, sample naming,
// retries and referer filled in from the arguments and session
[[nodiscard]] std::expected<std::vector<core::TransferTask>, std::error_code>
build_tasks(const CliArgs& args, const core::SessionConfig& session) noexcept;

// Run tasks one after another; a failed task never stops the batch
[[nodiscard]] BatchSummary run_batch(core::TransferEngine& engine,
                                     const std::vector<core::TransferTask>& tasks,
                                     const core::SessionConfig& session,
                                     bool show_progress,
                                     std::stop_token stop = {}) noexcept;

void print_summary(const BatchSummary& summary) noexcept;

// Show remote size and range support without downloading
[[nodiscard]] CliResult info(core::HttpTransport& transport,
                             const core::SessionConfig& session,
                             const std::string& url,
                             std::string_view referer) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace reel::cli

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/transfer_engine.hpp>
#include <reel/core/byte_limiter.hpp>
#include <reel/core/url.hpp>
#include <reel/disk/file_writer.hpp>
#include <reel/disk/finalizer.hpp>
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <mutex>

namespace reel::core {

std::string_view to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::already_complete: return "already_complete";
        case TransferStatus::downloaded:       return "downloaded";
    }
    return "unknown";
}

std::error_code TransferEngine::validate(const TransferTask& task) noexcept {
    auto url = Url::parse(task.source_url);
    if (!url || !url->is_http()) {
        return make_error_code(TransferErrc::invalid_url);
    }
    if (task.destination_path.empty() || task.max_retries == 0) {
        return make_error_code(TransferErrc::invalid_task);
    }
    return {};
}

std::expected<TransferStatus, std::error_code>
TransferEngine::run(const TransferTask& task, std::stop_token stop) noexcept {
    if (auto ec = validate(task)) {
        spdlog::error("Rejected task {} -> {}: {}", task.source_url, task.destination_path, ec.message());
        return std::unexpected(ec);
    }

    try {
        const auto temp = disk::part_path(task.destination_path);

        if (resolve_existing(task, temp, stop)) {
            spdlog::info("{} already complete", task.destination_path);
            return TransferStatus::already_complete;
        }

        std::error_code last_error;
        for (std::uint32_t attempt_no = 1; attempt_no <= task.max_retries; ++attempt_no) {
            if (stop.stop_requested()) {
                return std::unexpected(make_error_code(TransferErrc::cancelled));
            }

            // The temp file is the only source of truth for the offset
            TransferState state;
            state.resume_offset = task.sample_bytes > 0 ? 0 : disk::existing_size(temp);
            state.attempt_start = std::chrono::steady_clock::now();

            auto ec = attempt(task, temp, state, stop);
            if (!ec) {
                if (auto promote_ec = disk::promote(temp, task.destination_path)) {
                    spdlog::error("Finalize of {} failed: {}", task.destination_path, promote_ec.message());
                    return std::unexpected(make_error_code(TransferErrc::finalize_failed));
                }
                spdlog::info("Saved {}", task.destination_path);
                return TransferStatus::downloaded;
            }

            if (stop.stop_requested() || ec == TransferErrc::cancelled) {
                spdlog::info("Transfer of {} cancelled, partial data kept", task.destination_path);
                return std::unexpected(make_error_code(TransferErrc::cancelled));
            }
            if (!is_retryable(ec)) {
                spdlog::error("Transfer of {} failed: {}", task.destination_path, ec.message());
                return std::unexpected(ec);
            }

            last_error = ec;
            if (attempt_no == task.max_retries) break;

            auto delay = session_.backoff_unit * attempt_no;
            spdlog::warn("Attempt {}/{} for {} failed: {}; retrying in {} ms",
                         attempt_no, task.max_retries, task.destination_path,
                         ec.message(), delay.count());
            if (retry_cb_) {
                retry_cb_(attempt_no, delay, ec);
            }
            if (!wait_backoff(delay, stop)) {
                return std::unexpected(make_error_code(TransferErrc::cancelled));
            }
        }

        spdlog::error("Giving up on {} after {} attempts: {}",
                      task.destination_path, task.max_retries, last_error.message());
        return std::unexpected(last_error);
    } catch (const std::exception& e) {
        spdlog::error("Transfer of {} aborted: {}", task.destination_path, e.what());
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
}

bool TransferEngine::resolve_existing(const TransferTask& task, const std::string& temp, std::stop_token stop) {
    const auto& dest = task.destination_path;
    auto final_size = disk::existing_size(dest);
    if (final_size == 0) return false;

    // Samples never resume; a wrong-sized sample is fetched again
    if (task.sample_bytes > 0) {
        return final_size == task.sample_bytes;
    }

    auto cap = prober_.probe(task.source_url, task.referer, stop);
    if (cap.size && final_size >= *cap.size) {
        return true;
    }

    if (disk::exists(temp)) return false;

    if (cap.accepts_ranges) {
        spdlog::info("{} is incomplete ({} bytes), resuming", dest, final_size);
        if (auto ec = disk::promote(dest, temp)) {
            spdlog::warn("Cannot move {} aside: {}; restarting from zero", dest, ec.message());
        }
    } else {
        spdlog::info("{} is incomplete and the server has no range support; restarting", dest);
    }
    return false;
}

std::error_code TransferEngine::attempt(const TransferTask& task,
                                        const std::string& temp,
                                        TransferState& state,
                                        std::stop_token stop) {
    const bool sample = task.sample_bytes > 0;

    auto request = make_request(session_, task.source_url, task.referer, session_.transfer_timeout);
    if (sample) {
        request.headers["Range"] = range_header(0, task.sample_bytes - 1);
    } else if (state.resume_offset > 0) {
        request.headers["Range"] = range_header(state.resume_offset);
    }

    if (state.resume_offset > 0) {
        spdlog::info("Resuming {} at {}", task.destination_path, format_bytes(state.resume_offset));
    } else {
        spdlog::info("Fetching {}", task.source_url);
    }

    if (auto ec = disk::ensure_parent(temp)) {
        return ec;
    }

    disk::FileWriter writer;
    std::optional<ProgressTracker> tracker;
    std::optional<ProgressSink> progress;
    std::optional<ByteLimiter> limiter;
    disk::ByteSink* head = nullptr;

    std::error_code failure;
    bool whole_on_disk = false;
    bool cap_reached = false;

    auto on_response = [&](const HttpResponse& response) {
        spdlog::debug("{} answered {}", task.source_url, response.status_code);

        if (!sample && state.resume_offset > 0) {
            // Range past the end of a temp that already holds everything
            if (response.status_code == 416 && response.content_range_total == state.resume_offset) {
                whole_on_disk = true;
                return StreamAction::stop;
            }
            // A full-body success means the range was ignored; error statuses keep the temp
            if (response.ok() && !response.partial()) {
                spdlog::warn("Server ignored the range for {} (status {}), restarting from zero",
                             task.source_url, response.status_code);
                disk::remove_quietly(temp);
                failure = make_error_code(TransferErrc::range_not_honored);
                return StreamAction::stop;
            }
        }

        if (!response.ok()) {
            failure = status_error(response.status_code);
            return StreamAction::stop;
        }

        if (sample) {
            state.expected_total = task.sample_bytes;
        } else if (response.content_range_total) {
            state.expected_total = response.content_range_total;
        } else if (response.content_length && state.resume_offset > 0) {
            state.expected_total = state.resume_offset + *response.content_length;
        } else {
            state.expected_total = response.content_length;
        }

        auto mode = state.resume_offset > 0 ? disk::OpenMode::append : disk::OpenMode::truncate;
        if (auto ec = writer.open(temp, mode)) {
            failure = ec;
            return StreamAction::stop;
        }

        tracker.emplace(state.resume_offset, state.expected_total, state.attempt_start);
        progress.emplace(writer, *tracker, progress_cb_);
        head = &*progress;
        if (sample) {
            limiter.emplace(*progress, task.sample_bytes, [&cap_reached] { cap_reached = true; });
            head = &*limiter;
        }
        return StreamAction::proceed;
    };

    auto on_data = [&](std::span<const std::byte> chunk) {
        if (!head) return StreamAction::stop;

        if (auto ec = head->write(chunk)) {
            failure = ec;
            return StreamAction::stop;
        }
        state.transferred_this_attempt = tracker->transferred();
        return cap_reached ? StreamAction::stop : StreamAction::proceed;
    };

    auto result = transport_.get(request, on_response, on_data, stop);

    // Keep whatever arrived, even on failure; it is the next resume point
    auto close_ec = writer.close();

    if (!result) return result.error();
    if (failure) return failure;
    if (whole_on_disk) {
        spdlog::info("{} already holds the whole resource", temp);
        return {};
    }
    if (close_ec) return close_ec;
    if (!tracker) {
        return make_error_code(TransferErrc::network_error);
    }

    if (!sample && state.expected_total && tracker->observed() < *state.expected_total) {
        spdlog::warn("{} ended early: {} of {} bytes", task.source_url,
                     tracker->observed(), *state.expected_total);
        return make_error_code(TransferErrc::connection_lost);
    }
    if (sample && !cap_reached) {
        spdlog::warn("{} is shorter than the {} byte sample", task.source_url, task.sample_bytes);
    }

    if (progress_cb_) {
        progress_cb_(tracker->finish(std::chrono::steady_clock::now()));
    }
    return {};
}

bool TransferEngine::wait_backoff(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    return !cv.wait_for(lock, stop, delay, [&stop] { return stop.stop_requested(); });
}

} // namespace reel::core

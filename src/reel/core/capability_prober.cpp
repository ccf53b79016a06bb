// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/capability_prober.hpp>
#include <spdlog/spdlog.h>

namespace reel::core {

RemoteCapability CapabilityProber::probe(std::string_view url,
                                         std::string_view referer,
                                         std::stop_token stop) noexcept {
    try {
        auto head = probe_head(url, referer, stop);
        if (head && head->size && head->accepts_ranges) {
            return *head;
        }
        if (auto cap = probe_range(url, referer, stop)) {
            if (!cap->size && head) cap->size = head->size;
            return *cap;
        }
        // Keep a length learned from HEAD, but never claim unconfirmed ranges
        if (head && head->size) {
            spdlog::debug("Probe of {} kept the HEAD size, assuming no range support", url);
            return RemoteCapability{head->size, false};
        }
    } catch (const std::exception& e) {
        spdlog::debug("Probe of {} failed: {}", url, e.what());
    }

    spdlog::debug("Probe of {} inconclusive, assuming no range support", url);
    return {};
}

std::optional<RemoteCapability> CapabilityProber::probe_head(std::string_view url,
                                                             std::string_view referer,
                                                             std::stop_token stop) {
    auto request = make_request(session_, std::string(url), referer, session_.probe_timeout);

    auto response = transport_.head(request, stop);
    if (!response) {
        spdlog::debug("HEAD {}: {}", url, response.error().message());
        return std::nullopt;
    }
    if (!response->ok()) {
        spdlog::debug("HEAD {}: status {}", url, response->status_code);
        return std::nullopt;
    }

    RemoteCapability cap;
    cap.size = response->content_length;
    cap.accepts_ranges = response->accepts_ranges;
    spdlog::debug("HEAD {}: size {}, ranges {}", url,
                  cap.size ? std::to_string(*cap.size) : std::string("unknown"),
                  cap.accepts_ranges);
    return cap;
}

std::optional<RemoteCapability> CapabilityProber::probe_range(std::string_view url,
                                                              std::string_view referer,
                                                              std::stop_token stop) {
    auto request = make_request(session_, std::string(url), referer, session_.probe_timeout);
    request.headers["Range"] = range_header(0, 0);

    std::optional<RemoteCapability> cap;

    // Only the head matters; the probing byte is never read
    auto on_response = [&](const HttpResponse& response) {
        if (response.partial()) {
            cap = RemoteCapability{response.content_range_total, true};
        } else if (response.ok()) {
            cap = RemoteCapability{response.content_length, false};
        } else {
            spdlog::debug("Ranged probe {}: status {}", url, response.status_code);
        }
        return StreamAction::stop;
    };
    auto on_data = [](std::span<const std::byte>) { return StreamAction::stop; };

    auto result = transport_.get(request, on_response, on_data, stop);
    if (!result) {
        spdlog::debug("Ranged probe {}: {}", url, result.error().message());
        return std::nullopt;
    }
    return cap;
}

} // namespace reel::core

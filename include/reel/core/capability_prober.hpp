// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string_view>

namespace reel::core {

// What the server told us about a resource. Conservative when unknown.
struct RemoteCapability {
    std::optional<std::uint64_t> size;
    bool accepts_ranges{false};
};

// Learns remote size and range support. HEAD settles it only with a definite
// length and an advertised "Accept-Ranges: bytes"; otherwise a one-byte ranged
// GET decides. Never fails; problems degrade to an unknown capability.
class CapabilityProber {
public:
    CapabilityProber(HttpTransport& transport, const SessionConfig& session) noexcept
        : transport_(transport)
        , session_(session) {}

    [[nodiscard]] RemoteCapability probe(std::string_view url,
                                         std::string_view referer,
                                         std::stop_token stop = {}) noexcept;

private:
    [[nodiscard]] std::optional<RemoteCapability> probe_head(std::string_view url,
                                                             std::string_view referer,
                                                             std::stop_token stop);
    [[nodiscard]] std::optional<RemoteCapability> probe_range(std::string_view url,
                                                              std::string_view referer,
                                                              std::stop_token stop);

    HttpTransport& transport_;
    const SessionConfig& session_;
};

} // namespace reel::core

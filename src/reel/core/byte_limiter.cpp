// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/byte_limiter.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace reel::core {

ByteLimiter::ByteLimiter(disk::ByteSink& downstream, std::uint64_t cap, LimitHandler on_limit)
    : downstream_(downstream)
    , cap_(cap)
    , on_limit_(std::move(on_limit)) {}

std::error_code ByteLimiter::write(std::span<const std::byte> data) noexcept {
    if (cap_ == 0) {
        auto ec = downstream_.write(data);
        if (!ec) forwarded_ += data.size();
        return ec;
    }

    if (satisfied()) return {};

    auto remaining = cap_ - forwarded_;
    auto n = static_cast<std::size_t>(std::min<std::uint64_t>(data.size(), remaining));

    if (auto ec = downstream_.write(data.first(n))) {
        return ec;
    }
    forwarded_ += n;

    if (satisfied() && !signalled_) {
        signalled_ = true;
        spdlog::debug("Byte cap of {} reached", cap_);
        if (on_limit_) {
            try {
                on_limit_();
            } catch (const std::exception& e) {
                spdlog::error("Limit handler threw: {}", e.what());
            }
        }
    }
    return {};
}

} // namespace reel::core

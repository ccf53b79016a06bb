// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/file_writer.hpp>
#include <cstdint>
#include <functional>

namespace reel::core {

// Forwards at most cap bytes downstream, cutting the last chunk exactly at
// the boundary. on_limit fires once when the cap is reached; later bytes are
// dropped. A cap of 0 forwards everything.
class ByteLimiter final : public disk::ByteSink {
public:
    using LimitHandler = std::function<void()>;

    ByteLimiter(disk::ByteSink& downstream, std::uint64_t cap, LimitHandler on_limit = {});

    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept override;
    [[nodiscard]] std::error_code flush() noexcept override { return downstream_.flush(); }

    [[nodiscard]] bool satisfied() const noexcept { return cap_ > 0 && forwarded_ >= cap_; }
    [[nodiscard]] std::uint64_t forwarded() const noexcept { return forwarded_; }
    [[nodiscard]] std::uint64_t cap() const noexcept { return cap_; }

private:
    disk::ByteSink& downstream_;
    std::uint64_t cap_;
    std::uint64_t forwarded_{0};
    LimitHandler on_limit_;
    bool signalled_{false};
};

} // namespace reel::core

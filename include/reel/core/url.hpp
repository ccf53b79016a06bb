// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace reel::core {

// Absolute source URL, validated once before a transfer starts
class Url {
public:
    // invalid_url for a missing scheme, an empty host, a non-numeric port or
    // an unterminated IPv6 literal
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    // Last path segment, percent-decoded; "download" when the path has none
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string path_;      // Without query or fragment
};

// Decode %XX escapes; malformed escapes are kept verbatim
[[nodiscard]] std::string percent_decode(std::string_view text);

} // namespace reel::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace reel::core {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool all_digits(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    auto invalid = [] { return std::unexpected(make_error_code(TransferErrc::invalid_url)); };

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return invalid();
    }

    try {
        Url url;
        for (char c : url_str.substr(0, scheme_end)) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        // Authority runs up to the first of '/', '?' or '#'
        auto rest = url_str.substr(scheme_end + 3);
        auto authority_end = std::min(rest.find_first_of("/?#"), rest.size());
        auto authority = rest.substr(0, authority_end);
        auto tail = rest.substr(authority_end);

        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }

        std::string_view host = authority;
        std::string_view port;
        if (authority.starts_with('[')) {
            auto close = authority.find(']');
            if (close == std::string_view::npos) return invalid();
            host = authority.substr(0, close + 1);
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') return invalid();
                port = after.substr(1);
            }
        } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }

        if (host.empty() || !all_digits(port)) {
            return invalid();
        }
        url.host_ = std::string(host);

        auto path = tail.substr(0, std::min(tail.find_first_of("?#"), tail.size()));
        url.path_ = path.empty() ? std::string("/") : std::string(path);
        return url;
    } catch (const std::bad_alloc&) {
        return invalid();
    }
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    if (name.empty()) {
        return "download";
    }
    return percent_decode(name);
}

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

} // namespace reel::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace reel::core {

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{TRANSFER_TIMEOUT};
};

// HTTP response head. Header names are lower-cased; optional fields stay
// empty when the header is absent or unparseable.
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::optional<std::uint64_t> content_length;
    std::optional<std::uint64_t> content_range_total;   // From Content-Range: bytes a-b/TOTAL
    bool accepts_ranges{false};
    std::string content_type;

    [[nodiscard]] bool ok() const noexcept { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] bool partial() const noexcept { return status_code == 206; }
    [[nodiscard]] std::string_view header(std::string_view name) const noexcept;
};

// Consumer verdict after a response head or body chunk
enum class StreamAction : std::uint8_t {
    proceed,
    stop     // Cancel the read; not an error
};

using ResponseHandler = std::function<StreamAction(const HttpResponse&)>;
using DataHandler = std::function<StreamAction(std::span<const std::byte>)>;

struct StreamResult {
    HttpResponse response;
    bool stopped{false};    // A handler returned StreamAction::stop
};

// Blocking HTTP transport. Transport failures (DNS, connect, timeout,
// cancellation) come back as errors; any status code is a valid response.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Metadata-only request
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request, std::stop_token stop = {}) noexcept = 0;

    // Streamed GET. on_response runs once, before any body chunk, for the
    // final (post-redirect) response; on_data then receives the body in
    // bounded chunks.
    [[nodiscard]] virtual std::expected<StreamResult, std::error_code>
    get(const HttpRequest& request,
        const ResponseHandler& on_response,
        const DataHandler& on_data,
        std::stop_token stop = {}) noexcept = 0;
};

// libcurl transport
class HttpSession final : public HttpTransport {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request, std::stop_token stop = {}) noexcept override;

    [[nodiscard]] std::expected<StreamResult, std::error_code>
    get(const HttpRequest& request,
        const ResponseHandler& on_response,
        const DataHandler& on_data,
        std::stop_token stop = {}) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

// Request with the session headers (user agent, accept, cookie, extras) and referer
[[nodiscard]] HttpRequest make_request(const SessionConfig& session,
                                       std::string url,
                                       std::string_view referer,
                                       std::chrono::milliseconds timeout);

// "bytes=<start>-<end>" or "bytes=<start>-" when end is open
[[nodiscard]] std::string range_header(std::uint64_t start, std::optional<std::uint64_t> end = std::nullopt);

// Derive content_length, content_range_total, accepts_ranges and content_type
void parse_response_headers(HttpResponse& response);

[[nodiscard]] std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept;

// Total from "bytes 0-99/1234" or "bytes */1234"; nullopt for "*" or garbage
[[nodiscard]] std::optional<std::uint64_t> parse_content_range_total(std::string_view value) noexcept;

// Error for a non-2xx status
[[nodiscard]] std::error_code status_error(std::int32_t status_code) noexcept;

} // namespace reel::core

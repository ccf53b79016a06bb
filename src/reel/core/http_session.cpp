// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/http_session.hpp>
#include <reel/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace reel::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list
struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    [[nodiscard]] bool append(const std::string& line) noexcept {
        auto* next = curl_slist_append(ptr, line.c_str());
        if (!next) return false;
        ptr = next;
        return true;
    }
};

// Per-request state shared with the libcurl callbacks
struct TransferContext {
    CURL* curl{nullptr};
    HttpResponse response;
    const ResponseHandler* on_response{nullptr};
    const DataHandler* on_data{nullptr};
    std::stop_token stop;
    bool response_delivered{false};
    bool stopped{false};
    bool handler_failed{false};
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

bool icontains(std::string_view haystack, std::string_view needle) noexcept {
    if (needle.size() > haystack.size()) return false;
    for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
        if (iequals(haystack.substr(i, needle.size()), needle)) return true;
    }
    return false;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<std::uint64_t> parse_number(std::string_view s) noexcept {
    s = trim(s);
    if (s.empty()) return std::nullopt;

    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || end != s.data() + s.size()) return std::nullopt;
    return value;
}

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return total;

    try {
        std::string_view header(buffer, total);

        // A status line starts a new response (redirect hop or 100-continue)
        if (header.starts_with("HTTP/")) {
            ctx->response.headers.clear();
            auto space = header.find(' ');
            if (space != std::string_view::npos) {
                auto code = header.substr(space + 1, 3);
                if (auto parsed = parse_number(code)) {
                    ctx->response.status_code = static_cast<std::int32_t>(*parsed);
                }
            }
            return total;
        }

        auto colon = header.find(':');
        if (colon == std::string_view::npos) return total;

        ctx->response.headers[to_lower(trim(header.substr(0, colon)))] =
            std::string(trim(header.substr(colon + 1)));
    } catch (const std::exception&) {
        return 0;  // Aborts the transfer
    }
    return total;
}

// Hand the response head to the consumer once; false means stop
bool deliver_response(TransferContext& ctx) noexcept {
    if (ctx.response_delivered) return !ctx.stopped;
    ctx.response_delivered = true;

    long http_code = 0;
    if (curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code) == CURLE_OK && http_code > 0) {
        ctx.response.status_code = static_cast<std::int32_t>(http_code);
    }

    try {
        parse_response_headers(ctx.response);
        if (!ctx.on_response) return true;

        if ((*ctx.on_response)(ctx.response) == StreamAction::stop) {
            ctx.stopped = true;
            return false;
        }
    } catch (const std::exception& e) {
        spdlog::error("Response handler threw: {}", e.what());
        ctx.handler_failed = true;
        return false;
    }
    return true;
}

// Write callback: routes body chunks to the consumer; returning a short count
// makes curl abort with CURLE_WRITE_ERROR
std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::size_t bytes = size * nmemb;
    if (!ctx) return 0;

    if (!deliver_response(*ctx)) return 0;
    if (!ctx->on_data) return bytes;

    try {
        auto chunk = std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), bytes);
        if ((*ctx->on_data)(chunk) == StreamAction::stop) {
            ctx->stopped = true;
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("Data handler threw: {}", e.what());
        ctx->handler_failed = true;
        return 0;
    }
    return bytes;
}

// Progress callback: aborts the transfer once a stop is requested
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return (ctx && ctx->stop.stop_requested()) ? 1 : 0;
}

std::error_code curl_error_to_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:          return make_error_code(TransferErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:       return make_error_code(TransferErrc::dns_error);
        case CURLE_COULDNT_CONNECT:             return make_error_code(TransferErrc::refused);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:          return make_error_code(TransferErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:          return make_error_code(TransferErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:                 return make_error_code(TransferErrc::connection_lost);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:        return make_error_code(TransferErrc::invalid_url);
        case CURLE_WRITE_ERROR:                 return make_error_code(TransferErrc::write_failed);
        case CURLE_ABORTED_BY_CALLBACK:         return make_error_code(TransferErrc::cancelled);
        default:                                return make_error_code(TransferErrc::network_error);
    }
}

// Options shared by HEAD and GET
bool configure(CURL* curl, const HttpRequest& request, HeaderList& headers, TransferContext& ctx) noexcept {
    for (const auto& [name, value] : request.headers) {
        if (!headers.append(name + ": " + value)) return false;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.ptr);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));

    // Timeouts: a hard deadline for the whole request plus a stall guard
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);

    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    return true;
}

} // namespace

//=============================================================================
// HttpResponse
//=============================================================================

std::string_view HttpResponse::header(std::string_view name) const noexcept {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return value;
    }
    return {};
}

//=============================================================================
// HttpSession
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpSession::head(const HttpRequest& request, std::stop_token stop) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.stop = std::move(stop);

    HeaderList headers;
    if (!configure(curl.ptr, request, headers, ctx)) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", request.url, curl_easy_strerror(result));
        return std::unexpected(curl_error_to_error_code(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    ctx.response.status_code = static_cast<std::int32_t>(http_code);
    try {
        parse_response_headers(ctx.response);
    } catch (const std::exception& e) {
        spdlog::error("HEAD {}: cannot read headers: {}", request.url, e.what());
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    return ctx.response;
}

std::expected<StreamResult, std::error_code>
HttpSession::get(const HttpRequest& request,
                 const ResponseHandler& on_response,
                 const DataHandler& on_data,
                 std::stop_token stop) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.on_response = on_response ? &on_response : nullptr;
    ctx.on_data = on_data ? &on_data : nullptr;
    ctx.stop = std::move(stop);

    HeaderList headers;
    if (!configure(curl.ptr, request, headers, ctx)) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.handler_failed) {
        return std::unexpected(make_error_code(TransferErrc::write_failed));
    }

    // A consumer-requested stop surfaces as a write error; it is not a failure
    if (result == CURLE_WRITE_ERROR && ctx.stopped) {
        return StreamResult{std::move(ctx.response), true};
    }

    if (result != CURLE_OK) {
        spdlog::debug("GET {} failed: {}", request.url, curl_easy_strerror(result));
        return std::unexpected(curl_error_to_error_code(result));
    }

    // Empty body: the write callback never ran
    if (!ctx.response_delivered) {
        deliver_response(ctx);
        if (ctx.handler_failed) {
            return std::unexpected(make_error_code(TransferErrc::write_failed));
        }
    }

    return StreamResult{std::move(ctx.response), ctx.stopped};
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

//=============================================================================
// Request and header helpers
//=============================================================================

HttpRequest make_request(const SessionConfig& session,
                         std::string url,
                         std::string_view referer,
                         std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.url = std::move(url);
    request.timeout = timeout;

    request.headers["User-Agent"] = session.user_agent;
    request.headers["Accept"] = session.accept;
    request.headers["Accept-Language"] = "en-US,en;q=0.9";
    request.headers["Cache-Control"] = "no-cache";
    request.headers["Pragma"] = "no-cache";

    for (const auto& [name, value] : session.headers) {
        request.headers[name] = value;
    }

    if (!session.cookie.empty()) {
        request.headers["Cookie"] = session.cookie;
    }
    if (!referer.empty()) {
        request.headers["Referer"] = std::string(referer);
    }
    return request;
}

std::string range_header(std::uint64_t start, std::optional<std::uint64_t> end) {
    std::string range = "bytes=" + std::to_string(start) + "-";
    if (end) {
        range += std::to_string(*end);
    }
    return range;
}

void parse_response_headers(HttpResponse& response) {
    response.content_length = parse_content_length(response.header("content-length"));
    response.content_range_total = parse_content_range_total(response.header("content-range"));
    response.content_type = std::string(response.header("content-type"));

    response.accepts_ranges = icontains(response.header("accept-ranges"), "bytes");
}

std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept {
    return parse_number(value);
}

std::optional<std::uint64_t> parse_content_range_total(std::string_view value) noexcept {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos) return std::nullopt;
    return parse_number(value.substr(slash + 1));
}

std::error_code status_error(std::int32_t status_code) noexcept {
    if (status_code >= 200 && status_code < 300) return {};
    if (status_code == 404) return make_error_code(TransferErrc::not_found);
    if (status_code == 401 || status_code == 403) return make_error_code(TransferErrc::permission_denied);
    if (status_code == 416) return make_error_code(TransferErrc::invalid_range);
    if (status_code >= 500) return make_error_code(TransferErrc::server_error);
    return make_error_code(TransferErrc::http_error);
}

} // namespace reel::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/http_session.hpp>
#include <reel/disk/error.hpp>
#include <cerrno>
#include <utility>

using namespace reel::core;

TEST_CASE("range_header formatting", "[http]") {
    CHECK(range_header(0, 65535) == "bytes=0-65535");
    CHECK(range_header(1024) == "bytes=1024-");
    CHECK(range_header(0, 0) == "bytes=0-0");
}

TEST_CASE("parse_content_range_total", "[http]") {
    SECTION("Regular range") {
        CHECK(parse_content_range_total("bytes 0-99/1234") == 1234u);
    }

    SECTION("Unsatisfied range") {
        CHECK(parse_content_range_total("bytes */52428800") == 52428800u);
    }

    SECTION("Unknown total") {
        CHECK_FALSE(parse_content_range_total("bytes 0-99/*").has_value());
    }

    SECTION("Garbage") {
        CHECK_FALSE(parse_content_range_total("").has_value());
        CHECK_FALSE(parse_content_range_total("bytes 0-99").has_value());
        CHECK_FALSE(parse_content_range_total("bytes 0-99/12x").has_value());
    }
}

TEST_CASE("parse_content_length", "[http]") {
    CHECK(parse_content_length("1000000") == 1000000u);
    CHECK(parse_content_length(" 42 ") == 42u);
    CHECK_FALSE(parse_content_length("").has_value());
    CHECK_FALSE(parse_content_length("-1").has_value());
    CHECK_FALSE(parse_content_length("12abc").has_value());
}

TEST_CASE("parse_response_headers derives typed fields", "[http]") {
    HttpResponse response;
    response.status_code = 206;
    response.headers["content-length"] = "65536";
    response.headers["content-range"] = "bytes 0-65535/52428800";
    response.headers["accept-ranges"] = "Bytes";
    response.headers["content-type"] = "video/mp4";

    parse_response_headers(response);

    CHECK(response.partial());
    CHECK(response.ok());
    CHECK(response.content_length == 65536u);
    CHECK(response.content_range_total == 52428800u);
    CHECK(response.accepts_ranges);
    CHECK(response.content_type == "video/mp4");
    CHECK(response.header("Content-Type") == "video/mp4");
    CHECK(response.header("x-missing").empty());
}

TEST_CASE("parse_response_headers without range support", "[http]") {
    HttpResponse response;
    response.status_code = 200;
    response.headers["accept-ranges"] = "none";

    parse_response_headers(response);

    CHECK_FALSE(response.accepts_ranges);
    CHECK_FALSE(response.content_length.has_value());
    CHECK_FALSE(response.content_range_total.has_value());
}

TEST_CASE("parse_response_headers reports allocation failure by throwing", "[http]") {
    // Copies the content type, so it must not be noexcept
    STATIC_REQUIRE_FALSE(noexcept(parse_response_headers(std::declval<HttpResponse&>())));

    HttpResponse response;
    response.status_code = 200;
    response.headers["Content-Type"] = "video/mp4";
    response.headers["Content-Length"] = "10";
    REQUIRE_NOTHROW(parse_response_headers(response));
    CHECK(response.content_type == "video/mp4");
    CHECK(response.content_length == 10u);
}

TEST_CASE("make_request attaches session headers", "[http]") {
    SessionConfig session;
    session.cookie = "sid=abc";
    session.headers["X-Client"] = "reel";

    auto request = make_request(session, "https://example.com/v.mp4", "https://example.com/lesson/1",
                                std::chrono::milliseconds{5000});

    CHECK(request.url == "https://example.com/v.mp4");
    CHECK(request.timeout == std::chrono::milliseconds{5000});
    CHECK(request.headers.at("User-Agent") == DEFAULT_USER_AGENT);
    CHECK(request.headers.at("Accept") == DEFAULT_ACCEPT);
    CHECK(request.headers.at("Cookie") == "sid=abc");
    CHECK(request.headers.at("Referer") == "https://example.com/lesson/1");
    CHECK(request.headers.at("X-Client") == "reel");
    CHECK(request.headers.count("Range") == 0);

    SECTION("No cookie or referer when empty") {
        SessionConfig bare;
        auto plain = make_request(bare, "https://example.com/v.mp4", "", PROBE_TIMEOUT);
        CHECK(plain.headers.count("Cookie") == 0);
        CHECK(plain.headers.count("Referer") == 0);
    }
}

TEST_CASE("status_error mapping", "[http][error]") {
    CHECK(status_error(200) == std::error_code{});
    CHECK(status_error(206) == std::error_code{});
    CHECK(status_error(404) == TransferErrc::not_found);
    CHECK(status_error(403) == TransferErrc::permission_denied);
    CHECK(status_error(416) == TransferErrc::invalid_range);
    CHECK(status_error(503) == TransferErrc::server_error);
    CHECK(status_error(429) == TransferErrc::http_error);
}

TEST_CASE("is_retryable classification", "[error]") {
    CHECK(is_retryable(TransferErrc::timeout));
    CHECK(is_retryable(TransferErrc::network_error));
    CHECK(is_retryable(TransferErrc::server_error));
    CHECK(is_retryable(TransferErrc::range_not_honored));
    CHECK(is_retryable(TransferErrc::write_failed));
    CHECK(is_retryable(reel::disk::DiskErrc::disk_full));

    CHECK_FALSE(is_retryable(std::error_code{}));
    CHECK_FALSE(is_retryable(TransferErrc::invalid_url));
    CHECK_FALSE(is_retryable(TransferErrc::invalid_task));
    CHECK_FALSE(is_retryable(TransferErrc::cancelled));
    CHECK_FALSE(is_retryable(TransferErrc::finalize_failed));
    CHECK_FALSE(is_retryable(reel::disk::DiskErrc::access_denied));
}

TEST_CASE("Error categories have names and messages", "[error]") {
    std::error_code ec = TransferErrc::range_not_honored;
    CHECK(std::string(ec.category().name()) == "reel::transfer");
    CHECK_FALSE(ec.message().empty());

    std::error_code disk_ec = reel::disk::DiskErrc::disk_full;
    CHECK(std::string(disk_ec.category().name()) == "reel::disk");
    CHECK(reel::disk::posix_error_to_error_code(ENOSPC) == reel::disk::DiskErrc::disk_full);
    CHECK(reel::disk::posix_error_to_error_code(ENOENT) == reel::disk::DiskErrc::file_not_found);
}

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/transfer_engine.hpp>
#include <reel/disk/finalizer.hpp>
#include "test_support.hpp"
#include <thread>

using namespace reel::core;
using namespace std::chrono_literals;
using reel::test::FakeTransport;
using reel::test::Fault;
using reel::test::TempDir;
using reel::test::make_body;
using reel::test::read_file;
using reel::test::write_file;

namespace fs = std::filesystem;

namespace {

constexpr const char* URL = "https://cdn.example.com/media/lesson.mp4";

SessionConfig fast_session() {
    SessionConfig session;
    session.backoff_unit = 1ms;
    session.polite_pause = 0ms;
    return session;
}

TransferTask make_task(const TempDir& dir, std::string_view name = "lesson.mp4") {
    TransferTask task;
    task.source_url = URL;
    task.destination_path = dir.file(name);
    task.referer = "https://example.com/course/1";
    task.max_retries = 3;
    task.label = std::string(name);
    return task;
}

std::vector<std::byte> prefix(const std::vector<std::byte>& body, std::size_t n) {
    return {body.begin(), body.begin() + static_cast<std::ptrdiff_t>(n)};
}

} // namespace

TEST_CASE("Fresh download streams without a range", "[engine]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(300'000);
    FakeTransport transport(body);
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    auto result = engine.run(task);

    REQUIRE(result.has_value());
    CHECK(*result == TransferStatus::downloaded);
    CHECK(read_file(task.destination_path) == body);
    CHECK_FALSE(fs::exists(reel::disk::part_path(task.destination_path)));

    auto gets = transport.gets();
    REQUIRE(gets.size() == 1);
    CHECK_FALSE(gets[0].range().has_value());
    CHECK(gets[0].request.headers.at("Referer") == task.referer);
    CHECK(gets[0].request.timeout == session.transfer_timeout);
}

TEST_CASE("Destination directories are created", "[engine]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(1000);
    FakeTransport transport(body);
    TransferEngine engine(transport, session);

    auto task = make_task(dir, "course/module 1/lesson.mp4");
    REQUIRE(engine.run(task).has_value());
    CHECK(read_file(task.destination_path) == body);
}

TEST_CASE("Sample mode on a range-capable server", "[engine][sample]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(50 * 1024 * 1024);
    FakeTransport transport(body);
    TransferEngine engine(transport, session);

    auto task = make_task(dir, "lesson.sample.mp4");
    task.sample_bytes = 65536;

    auto result = engine.run(task);

    REQUIRE(result.has_value());
    CHECK(*result == TransferStatus::downloaded);
    CHECK(reel::disk::existing_size(task.destination_path) == 65536);
    CHECK(read_file(task.destination_path) == prefix(body, 65536));

    REQUIRE(transport.requests().size() == 1);
    CHECK(transport.requests()[0].range() == "bytes=0-65535");
}

TEST_CASE("Sample mode on a server that ignores ranges", "[engine][sample]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(1'000'000);
    FakeTransport transport(body, false);
    TransferEngine engine(transport, session);

    auto task = make_task(dir);

    auto cap = GENERATE(1u, 1000u, 16384u, 65536u, 100'001u);
    task.sample_bytes = cap;

    auto result = engine.run(task);

    REQUIRE(result.has_value());
    CHECK(reel::disk::existing_size(task.destination_path) == cap);
    CHECK(read_file(task.destination_path) == prefix(body, cap));
    // The stream was stopped early instead of read to the end
    CHECK(transport.body_bytes_sent() < body.size());
}

TEST_CASE("Sample mode accepts a 200 reply to its range request", "[engine][sample]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(200'000);
    FakeTransport transport(body);
    transport.then(Fault::full_body());
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    task.sample_bytes = 70'000;

    // A 200 to a sample range request is accepted and cut locally
    auto result = engine.run(task);
    REQUIRE(result.has_value());
    CHECK(reel::disk::existing_size(task.destination_path) == 70'000);
    CHECK(transport.gets().size() == 1);
}

TEST_CASE("Existing sample of the right size is complete", "[engine][sample]") {
    TempDir dir;
    auto session = fast_session();
    FakeTransport transport(make_body(100'000));
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    task.sample_bytes = 4096;

    SECTION("Exact size") {
        write_file(task.destination_path, make_body(4096));
        auto result = engine.run(task);
        REQUIRE(result.has_value());
        CHECK(*result == TransferStatus::already_complete);
        CHECK(transport.requests().empty());
    }

    SECTION("Wrong size is fetched again") {
        write_file(task.destination_path, make_body(5000));
        auto result = engine.run(task);
        REQUIRE(result.has_value());
        CHECK(*result == TransferStatus::downloaded);
        CHECK(reel::disk::existing_size(task.destination_path) == 4096);
    }
}

TEST_CASE("Resume from an existing temp file", "[engine][resume]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(500'000);
    FakeTransport transport(body);
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    write_file(reel::disk::part_path(task.destination_path), prefix(body, 123'456));

    std::vector<ProgressView> views;
    engine.callback([&](const ProgressView& v) { views.push_back(v); });

    auto result = engine.run(task);

    REQUIRE(result.has_value());
    CHECK(*result == TransferStatus::downloaded);
    CHECK(read_file(task.destination_path) == body);

    auto gets = transport.gets();
    REQUIRE(gets.size() == 1);
    CHECK(gets[0].range() == "bytes=123456-");

    REQUIRE_FALSE(views.empty());
    CHECK(views.front().shown_bytes >= 123'456);
    CHECK(views.back().final);
    CHECK(views.back().ratio == 1.0);
}

TEST_CASE("Range answered with 200 discards the temp file", "[engine][resume]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(400'000);
    FakeTransport transport(body);
    transport.then(Fault::full_body());
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    // Stale bytes that must not survive
    write_file(reel::disk::part_path(task.destination_path), make_body(7));

    std::vector<std::error_code> retries;
    engine.retry_callback([&](std::uint32_t, std::chrono::milliseconds, const std::error_code& ec) {
        retries.push_back(ec);
    });

    auto result = engine.run(task);

    REQUIRE(result.has_value());
    CHECK(read_file(task.destination_path) == body);
    REQUIRE(retries.size() == 1);
    CHECK(retries[0] == TransferErrc::range_not_honored);

    auto gets = transport.gets();
    REQUIRE(gets.size() == 2);
    CHECK(gets[0].range() == "bytes=7-");
    CHECK_FALSE(gets[1].range().has_value());
}

TEST_CASE("Interrupted attempt resumes from what reached the disk", "[engine][resume]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(300'000);
    FakeTransport transport(body);
    transport.then(Fault::fail(TransferErrc::connection_lost, 40'000));
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    auto result = engine.run(task);

    REQUIRE(result.has_value());
    CHECK(read_file(task.destination_path) == body);

    auto gets = transport.gets();
    REQUIRE(gets.size() == 2);
    CHECK_FALSE(gets[0].range().has_value());
    CHECK(gets[1].range() == "bytes=40000-");
}

TEST_CASE("Complete destination is not streamed again", "[engine]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(10'000);
    FakeTransport transport(body);
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    write_file(task.destination_path, body);

    auto result = engine.run(task);

    REQUIRE(result.has_value());
    CHECK(*result == TransferStatus::already_complete);
    CHECK(transport.gets().empty());
    CHECK(read_file(task.destination_path) == body);
}

TEST_CASE("Incomplete final file", "[engine][resume]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(250'000);
    auto task = make_task(dir);

    SECTION("Resumed when the server supports ranges") {
        FakeTransport transport(body);
        TransferEngine engine(transport, session);
        write_file(task.destination_path, prefix(body, 100'000));

        auto result = engine.run(task);

        REQUIRE(result.has_value());
        CHECK(*result == TransferStatus::downloaded);
        CHECK(read_file(task.destination_path) == body);
        auto gets = transport.gets();
        REQUIRE(gets.size() == 1);
        CHECK(gets[0].range() == "bytes=100000-");
    }

    SECTION("Restarted when it does not") {
        FakeTransport transport(body, false);
        TransferEngine engine(transport, session);
        write_file(task.destination_path, make_body(100'000));

        auto result = engine.run(task);

        REQUIRE(result.has_value());
        CHECK(read_file(task.destination_path) == body);

        // HEAD lacks Accept-Ranges, so the one-byte check runs before the restart
        auto gets = transport.gets();
        REQUIRE(gets.size() == 2);
        CHECK(gets[0].range() == "bytes=0-0");
        CHECK_FALSE(gets[1].range().has_value());
    }

    SECTION("Resumed when only the ranged check reveals range support") {
        FakeTransport transport(body);
        transport.head_advertises_ranges(false);
        TransferEngine engine(transport, session);
        write_file(task.destination_path, prefix(body, 60'000));

        auto result = engine.run(task);

        REQUIRE(result.has_value());
        CHECK(*result == TransferStatus::downloaded);
        CHECK(read_file(task.destination_path) == body);
        auto gets = transport.gets();
        REQUIRE(gets.size() == 2);
        CHECK(gets[0].range() == "bytes=0-0");
        CHECK(gets[1].range() == "bytes=60000-");
        CHECK(transport.body_bytes_sent() == body.size() - 60'000);
    }
}

TEST_CASE("Error status on a resume keeps the temp file", "[engine][resume]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(100'000);
    FakeTransport transport(body);
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    auto temp = reel::disk::part_path(task.destination_path);
    write_file(temp, prefix(body, 40'000));

    SECTION("Server error, then the resume succeeds") {
        transport.then(Fault::respond(503));
        std::vector<std::error_code> retries;
        engine.retry_callback([&](std::uint32_t, std::chrono::milliseconds, const std::error_code& ec) {
            retries.push_back(ec);
        });

        auto result = engine.run(task);

        REQUIRE(result.has_value());
        CHECK(read_file(task.destination_path) == body);
        REQUIRE(retries.size() == 1);
        CHECK(retries[0] == TransferErrc::server_error);

        auto gets = transport.gets();
        REQUIRE(gets.size() == 2);
        CHECK(gets[0].range() == "bytes=40000-");
        CHECK(gets[1].range() == "bytes=40000-");
        CHECK(transport.body_bytes_sent() == 60'000);
    }

    SECTION("Single attempt answered 503") {
        task.max_retries = 1;
        transport.then(Fault::respond(503));

        auto result = engine.run(task);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == TransferErrc::server_error);
        CHECK(reel::disk::existing_size(temp) == 40'000);
        CHECK(read_file(temp) == prefix(body, 40'000));
    }

    SECTION("Single attempt answered 404") {
        task.max_retries = 1;
        transport.then(Fault::respond(404));

        auto result = engine.run(task);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == TransferErrc::not_found);
        CHECK(reel::disk::existing_size(temp) == 40'000);
        CHECK_FALSE(fs::exists(task.destination_path));
    }
}

TEST_CASE("Temp file already holding the whole resource", "[engine][resume]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(20'000);
    FakeTransport transport(body);
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    write_file(reel::disk::part_path(task.destination_path), body);

    auto result = engine.run(task);

    REQUIRE(result.has_value());
    CHECK(*result == TransferStatus::downloaded);
    CHECK(read_file(task.destination_path) == body);
    CHECK(transport.body_bytes_sent() == 0);
}

TEST_CASE("Retries with linear back-off", "[engine][retry]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(1'000'000);
    FakeTransport transport(body, false);
    transport.then(Fault::fail(TransferErrc::timeout))
             .then(Fault::respond(500));
    TransferEngine engine(transport, session);

    std::vector<std::pair<std::uint32_t, std::chrono::milliseconds>> delays;
    engine.retry_callback([&](std::uint32_t attempt, std::chrono::milliseconds delay, const std::error_code&) {
        delays.emplace_back(attempt, delay);
    });

    auto task = make_task(dir);
    auto result = engine.run(task);

    REQUIRE(result.has_value());
    CHECK(*result == TransferStatus::downloaded);
    CHECK(reel::disk::existing_size(task.destination_path) == 1'000'000);

    REQUIRE(delays.size() == 2);
    CHECK(delays[0] == std::make_pair(1u, session.backoff_unit));
    CHECK(delays[1] == std::make_pair(2u, session.backoff_unit * 2));
    CHECK(transport.gets().size() == 3);
}

TEST_CASE("Exhausted retries keep the temp file", "[engine][retry]") {
    TempDir dir;
    auto session = fast_session();
    FakeTransport transport(make_body(500'000));
    transport.then(Fault::fail(TransferErrc::timeout, 50'000))
             .then(Fault::fail(TransferErrc::timeout, 50'000))
             .then(Fault::fail(TransferErrc::connection_lost, 50'000));
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    auto result = engine.run(task);

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == TransferErrc::connection_lost);
    CHECK(transport.gets().size() == 3);
    CHECK(reel::disk::existing_size(reel::disk::part_path(task.destination_path)) == 150'000);
    CHECK_FALSE(fs::exists(task.destination_path));
}

TEST_CASE("HTTP errors are retried then reported", "[engine][retry]") {
    TempDir dir;
    auto session = fast_session();
    FakeTransport transport(make_body(1000));
    transport.then(Fault::respond(404)).then(Fault::respond(404));
    TransferEngine engine(transport, session);

    auto task = make_task(dir);
    task.max_retries = 2;
    auto result = engine.run(task);

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == TransferErrc::not_found);
    CHECK(transport.gets().size() == 2);
}

TEST_CASE("Invalid tasks fail without requests", "[engine]") {
    TempDir dir;
    auto session = fast_session();
    FakeTransport transport(make_body(10));
    TransferEngine engine(transport, session);
    auto task = make_task(dir);

    SECTION("Bad URL") {
        task.source_url = "not a url";
        auto result = engine.run(task);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == TransferErrc::invalid_url);
    }

    SECTION("Non-http scheme") {
        task.source_url = "ftp://example.com/v.mp4";
        CHECK(engine.run(task).error() == TransferErrc::invalid_url);
    }

    SECTION("Empty destination") {
        task.destination_path.clear();
        CHECK(engine.run(task).error() == TransferErrc::invalid_task);
    }

    SECTION("Zero retries") {
        task.max_retries = 0;
        CHECK(engine.run(task).error() == TransferErrc::invalid_task);
    }

    CHECK(transport.requests().empty());
}

TEST_CASE("Cancellation", "[engine][cancel]") {
    TempDir dir;
    auto session = fast_session();
    auto task = make_task(dir);
    std::stop_source source;

    SECTION("During the stream") {
        FakeTransport transport(make_body(400'000));
        transport.on_chunk([&](std::size_t delivered) {
            if (delivered >= 32 * 1024) source.request_stop();
        });
        TransferEngine engine(transport, session);

        auto result = engine.run(task, source.get_token());

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == TransferErrc::cancelled);
        CHECK(transport.gets().size() == 1);
        CHECK(reel::disk::existing_size(reel::disk::part_path(task.destination_path)) == 32 * 1024);
        CHECK_FALSE(fs::exists(task.destination_path));
    }

    SECTION("During the back-off wait") {
        session.backoff_unit = 10s;
        FakeTransport transport(make_body(1000));
        transport.then(Fault::fail(TransferErrc::timeout));
        TransferEngine engine(transport, session);
        engine.retry_callback([&](std::uint32_t, std::chrono::milliseconds, const std::error_code&) {
            source.request_stop();
        });

        auto started = std::chrono::steady_clock::now();
        auto result = engine.run(task, source.get_token());

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == TransferErrc::cancelled);
        CHECK(std::chrono::steady_clock::now() - started < 5s);
        CHECK(transport.gets().size() == 1);
    }

    SECTION("Before starting") {
        FakeTransport transport(make_body(1000));
        TransferEngine engine(transport, session);
        source.request_stop();

        auto result = engine.run(task, source.get_token());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == TransferErrc::cancelled);
        CHECK(transport.gets().empty());
    }
}

TEST_CASE("Progress ratio stays monotonic and bounded", "[engine][progress]") {
    TempDir dir;
    auto session = fast_session();
    auto body = make_body(2'000'000);
    FakeTransport transport(body);
    TransferEngine engine(transport, session);

    double last = 0.0;
    bool monotonic = true;
    bool bounded = true;
    std::size_t count = 0;
    engine.callback([&](const ProgressView& v) {
        monotonic = monotonic && v.ratio >= last;
        bounded = bounded && v.ratio <= 1.0;
        last = v.ratio;
        ++count;
    });

    auto task = make_task(dir);
    write_file(reel::disk::part_path(task.destination_path), prefix(body, 1'000'000));

    REQUIRE(engine.run(task).has_value());
    CHECK(count >= 2);
    CHECK(monotonic);
    CHECK(bounded);
    CHECK(last == 1.0);
}

TEST_CASE("Disjoint tasks run concurrently on separate engines", "[engine][concurrency]") {
    TempDir dir;
    const auto session = fast_session();

    auto body_a = make_body(700'000);
    auto body_b = make_body(900'000);
    FakeTransport transport_a(body_a);
    FakeTransport transport_b(body_b, false);

    auto task_a = make_task(dir, "a.mp4");
    auto task_b = make_task(dir, "b.mp4");

    std::expected<TransferStatus, std::error_code> result_a;
    std::expected<TransferStatus, std::error_code> result_b;
    {
        std::jthread ta([&] {
            TransferEngine engine(transport_a, session);
            result_a = engine.run(task_a);
        });
        std::jthread tb([&] {
            TransferEngine engine(transport_b, session);
            result_b = engine.run(task_b);
        });
    }

    REQUIRE(result_a.has_value());
    REQUIRE(result_b.has_value());
    CHECK(read_file(task_a.destination_path) == body_a);
    CHECK(read_file(task_b.destination_path) == body_b);
}

TEST_CASE("TransferStatus names", "[engine]") {
    CHECK(to_string(TransferStatus::already_complete) == "already_complete");
    CHECK(to_string(TransferStatus::downloaded) == "downloaded");
}

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <booru/core/http_session.hpp>
#include <booru/core/transfer.hpp>
#include "support/temp_dir.hpp"
#include "support/test_server.hpp"
#include <sys/resource.h>
#include <csignal>
#include <filesystem>
#include <limits>
#include <system_error>
#include <thread>

using namespace booru::core;
using booru::test::Response;
using booru::test::TempDir;
using booru::test::TestServer;
using booru::test::read_text;

namespace fs = std::filesystem;

namespace {

// Caps the size of files this process may create; SIGXFSZ is ignored so the
// write fails with EFBIG instead of killing the run
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        ::getrlimit(RLIMIT_FSIZE, &previous_);
        rlimit lowered = previous_;
        lowered.rlim_cur = bytes;
        active_ = ::setrlimit(RLIMIT_FSIZE, &lowered) == 0;
    }
    ~FileSizeLimit() {
        ::setrlimit(RLIMIT_FSIZE, &previous_);
        std::signal(SIGXFSZ, previous_handler_);
    }

    FileSizeLimit(const FileSizeLimit&) = delete;
    FileSizeLimit& operator=(const FileSizeLimit&) = delete;

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    rlimit previous_{};
    void (*previous_handler_)(int){SIG_DFL};
    bool active_{false};
};

} // namespace

TEST_CASE("transfer - body with declared length", "[transfer]") {
    TestServer server;
    TempDir dir;
    const std::string body(100'000, 'a');
    server.route("/img/1.jpg", Response{200, body});

    HttpSession session;
    auto counter = std::make_shared<ByteCounter>(0);
    auto result = transfer(session, {server.url("/img/1.jpg"), dir / "1.jpg", counter, {}});

    REQUIRE(result.has_value());
    CHECK(*result == dir / "1.jpg");
    CHECK(read_text(dir / "1.jpg") == body);
    CHECK(counter->load() == body.size());
}

TEST_CASE("transfer - body without declared length", "[transfer]") {
    TestServer server;
    TempDir dir;
    Response response{200, "unknown length body"};
    response.send_length = false;
    server.route("/img/2.png", response);

    HttpSession session;
    auto counter = std::make_shared<ByteCounter>(0);
    auto result = transfer(session, {server.url("/img/2.png"), dir / "2.png", counter, {}});

    REQUIRE(result.has_value());
    CHECK(read_text(dir / "2.png") == "unknown length body");
    CHECK(counter->load() == 19);
}

TEST_CASE("transfer - declared length of zero", "[transfer]") {
    TestServer server;
    TempDir dir;
    Response response{200, ""};
    response.declared_length = 0;
    server.route("/img/3.jpg", response);

    HttpSession session;
    auto result = transfer(session, {server.url("/img/3.jpg"), dir / "3.jpg", {}, {}});

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == DownloadErrc::zero_content_length);
}

TEST_CASE("transfer - non-success status", "[transfer]") {
    TestServer server;
    TempDir dir;
    server.route("/img/4.jpg", Response{500, "oops"});

    HttpSession session;
    auto counter = std::make_shared<ByteCounter>(0);
    auto result = transfer(session, {server.url("/img/4.jpg"), dir / "4.jpg", counter, {}});

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == DownloadErrc::http_status);
    CHECK(result.error().detail() == "500");
    CHECK(counter->load() == 0);
    CHECK_FALSE(fs::exists(dir / "4.jpg"));
}

TEST_CASE("transfer - declared length the disk cannot hold", "[transfer]") {
    TestServer server;
    TempDir dir;
    server.route("/img/big.jpg", Response{200, std::string(1024 * 1024, 'b')});

    HttpSession session;
    auto counter = std::make_shared<ByteCounter>(0);
    std::expected<fs::path, Error> result;
    {
        FileSizeLimit limit(64 * 1024);
        REQUIRE(limit.active());
        result = transfer(session, {server.url("/img/big.jpg"), dir / "big.jpg", counter, {}});
    }

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == DownloadErrc::file_allocation_failed);
    CHECK(result.error().cause() == std::errc::file_too_large);
    CHECK(counter->load() == 0);
}

TEST_CASE("transfer - unreachable destination directory", "[transfer]") {
    TestServer server;
    TempDir dir;
    server.route("/img/5.jpg", Response{200, "data"});

    HttpSession session;
    auto result = transfer(session, {server.url("/img/5.jpg"), dir / "missing" / "5.jpg", {}, {}});

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == std::errc::no_such_file_or_directory);
}

TEST_CASE("transfer - dropped counter is skipped", "[transfer]") {
    TestServer server;
    TempDir dir;
    server.route("/img/6.jpg", Response{200, "some bytes"});

    std::weak_ptr<ByteCounter> weak;
    {
        auto counter = std::make_shared<ByteCounter>(0);
        weak = counter;
    }

    HttpSession session;
    auto result = transfer(session, {server.url("/img/6.jpg"), dir / "6.jpg", weak, {}});
    REQUIRE(result.has_value());
    CHECK(read_text(dir / "6.jpg") == "some bytes");
}

TEST_CASE("transfer - stop request aborts", "[transfer]") {
    TestServer server;
    TempDir dir;
    Response slow{200, std::string(64 * 1024, 'z')};
    slow.chunk_delay = std::chrono::milliseconds(50);
    server.route("/img/7.jpg", slow);

    HttpSession session;
    std::stop_source stop;
    std::jthread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        stop.request_stop();
    });

    auto result = transfer(session, {server.url("/img/7.jpg"), dir / "7.jpg", {}, stop.get_token()});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == DownloadErrc::cancelled);
}

TEST_CASE("report_bytes", "[transfer]") {
    SECTION("Adds to a live counter") {
        auto counter = std::make_shared<ByteCounter>(5);
        report_bytes(counter, 10);
        CHECK(counter->load() == 15);
    }

    SECTION("Overflow throws") {
        auto counter = std::make_shared<ByteCounter>(std::numeric_limits<std::uint64_t>::max() - 1);
        CHECK_THROWS_AS(report_bytes(counter, 2), std::overflow_error);
    }
}

TEST_CASE("HttpSession::fetch", "[http]") {
    TestServer server;
    server.route("/api", Response{200, R"({"ok":true})"});

    HttpSession session;
    auto body = session.fetch(server.url("/api?x=1"));
    REQUIRE(body.has_value());
    CHECK(*body == R"({"ok":true})");
    CHECK(server.hits("/api") == 1);

    auto missing = session.fetch(server.url("/nothing"));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == DownloadErrc::http_status);
}

TEST_CASE("HttpSession::escape", "[http]") {
    CHECK(HttpSession::escape("cat dog") == "cat%20dog");
    CHECK(HttpSession::escape("rating:general") == "rating%3Ageneral");
}

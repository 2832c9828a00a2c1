// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <booru/core/scheduler.hpp>
#include "support/temp_dir.hpp"
#include "support/test_server.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include <atomic>
#include <filesystem>
#include <format>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace booru::core;
using booru::test::Response;
using booru::test::TempDir;
using booru::test::TestServer;
using booru::test::md5_of;
using booru::test::read_text;
using booru::test::write_text;

namespace fs = std::filesystem;

namespace {

struct Recorded {
    std::vector<DownloadStatus> statuses;
    std::uint64_t advanced{0};
    std::size_t suspended{0};
    bool finished{false};
};

// Copies everything into a Recorded the test keeps after launch() drops us
class RecordingReporter final : public ProgressReporter {
public:
    explicit RecordingReporter(std::shared_ptr<Recorded> out) : out_(std::move(out)) {}

    void set_status(const DownloadStatus& status) override {
        std::lock_guard lock(mutex_);
        out_->statuses.push_back(status);
    }
    void set_speed(std::uint64_t) override {}
    void advance(std::uint64_t n) override {
        std::lock_guard lock(mutex_);
        out_->advanced += n;
    }
    void suspend(const std::function<void()>& fn) override {
        {
            std::lock_guard lock(mutex_);
            ++out_->suspended;
        }
        fn();
    }
    void finish() override {
        std::lock_guard lock(mutex_);
        out_->finished = true;
    }

private:
    std::mutex mutex_;
    std::shared_ptr<Recorded> out_;
};

// Routes the default logger into a string for the lifetime of the object
class LogCapture {
public:
    explicit LogCapture(spdlog::level::level_enum level = spdlog::level::debug)
        : previous_(spdlog::default_logger()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        auto logger = std::make_shared<spdlog::logger>("capture", std::move(sink));
        logger->set_level(level);
        spdlog::set_default_logger(std::move(logger));
    }
    ~LogCapture() { spdlog::set_default_logger(previous_); }

    [[nodiscard]] std::string text() const { return stream_.str(); }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> previous_;
};

Post make_post(TestServer& server, std::uint64_t id, const std::string& body,
               std::string tags = "cat dog") {
    auto target = std::format("/images/{}.jpg", id);
    server.route(target, Response{200, body});
    return Post::make(id, md5_of(body), server.url(target), std::move(tags), std::format("orig_{}.jpg", id));
}

SchedulerOptions fast_options(std::uint32_t concurrency = 0) {
    SchedulerOptions options;
    options.concurrency = concurrency;
    options.speed_interval = std::chrono::milliseconds(20);
    return options;
}

} // namespace

TEST_CASE("Scheduler - fresh directory downloads everything", "[scheduler]") {
    TestServer server;
    TempDir dir;
    std::vector<Post> posts;
    for (std::uint64_t id = 1; id <= 3; ++id) {
        posts.push_back(make_post(server, id, std::format("image body {}", id)));
    }

    auto recorded = std::make_shared<Recorded>();
    auto status = run_download(HttpSession{}, posts, dir.path(),
                               std::make_unique<RecordingReporter>(recorded), fast_options());

    REQUIRE(status.has_value());
    CHECK(*status == DownloadStatus{3, 0, 0});
    for (std::uint64_t id = 1; id <= 3; ++id) {
        CHECK(read_text(dir / std::format("{}.jpg", id)) == std::format("image body {}", id));
        CHECK(read_text(dir / std::format("{}.txt", id)) == "cat, dog");
    }
    CHECK(recorded->advanced == 3);
    CHECK(recorded->finished);
    REQUIRE_FALSE(recorded->statuses.empty());
    CHECK(recorded->statuses.front() == DownloadStatus{});
    CHECK(recorded->statuses.back() == DownloadStatus{3, 0, 0});
}

TEST_CASE("Scheduler - matching file on disk is not downloaded", "[scheduler]") {
    TestServer server;
    TempDir dir;
    auto post = make_post(server, 10, "already here");
    write_text(dir / "10.jpg", "already here");

    auto status = run_download(HttpSession{}, {post}, dir.path(),
                               std::make_unique<NullProgress>(), fast_options());

    REQUIRE(status.has_value());
    CHECK(*status == DownloadStatus{0, 1, 0});
    CHECK(server.hits("/images/10.jpg") == 0);
    CHECK_FALSE(fs::exists(dir / "10.txt"));
}

TEST_CASE("Scheduler - stale file is downloaded again", "[scheduler]") {
    TestServer server;
    TempDir dir;
    auto post = make_post(server, 11, "fresh content");
    write_text(dir / "11.jpg", "stale content that is longer than the new one");

    auto status = run_download(HttpSession{}, {post}, dir.path(),
                               std::make_unique<NullProgress>(), fast_options());

    REQUIRE(status.has_value());
    CHECK(*status == DownloadStatus{1, 0, 0});
    CHECK(read_text(dir / "11.jpg") == "fresh content");
    CHECK(server.hits("/images/11.jpg") == 1);
}

TEST_CASE("Scheduler - failed item is counted and logged", "[scheduler]") {
    TestServer server;
    TempDir dir;
    auto good = make_post(server, 20, "good");
    auto bad = make_post(server, 21, "bad");
    server.route("/images/21.jpg", Response{500, "error"});

    LogCapture log(spdlog::level::info);
    auto recorded = std::make_shared<Recorded>();
    auto status = run_download(HttpSession{}, {good, bad}, dir.path(),
                               std::make_unique<RecordingReporter>(recorded), fast_options());

    REQUIRE(status.has_value());
    CHECK(*status == DownloadStatus{1, 0, 1});
    CHECK(recorded->advanced == 2);
    CHECK(recorded->suspended == 1);
    CHECK(fs::exists(dir / "20.txt"));
    CHECK_FALSE(fs::exists(dir / "21.txt"));

    const auto text = log.text();
    CHECK_THAT(text, Catch::Matchers::ContainsSubstring("Failed to download: " + (dir / "21.jpg").string()));
}

TEST_CASE("Scheduler - zero declared length counts as failure", "[scheduler]") {
    TestServer server;
    TempDir dir;
    auto post = make_post(server, 30, "");
    Response empty{200, ""};
    empty.declared_length = 0;
    server.route("/images/30.jpg", empty);

    LogCapture log;
    auto status = run_download(HttpSession{}, {post}, dir.path(),
                               std::make_unique<NullProgress>(), fast_options());
    REQUIRE(status.has_value());
    CHECK(*status == DownloadStatus{0, 0, 1});
    CHECK_THAT(log.text(), Catch::Matchers::ContainsSubstring("There is no content to download"));
}

TEST_CASE("Scheduler - many items respect the concurrency cap", "[scheduler]") {
    TestServer server;
    TempDir dir;
    std::vector<Post> posts;
    for (std::uint64_t id = 1; id <= 101; ++id) {
        posts.push_back(make_post(server, id, std::string(2048 + id, 'p')));
    }

    auto scheduler = Scheduler::build(HttpSession{}, dir.path(), std::move(posts), fast_options(8));
    REQUIRE(scheduler.has_value());
    CHECK(scheduler->concurrency() == 8);
    CHECK(scheduler->size() == 101);

    auto status = scheduler->launch(std::make_unique<NullProgress>());
    CHECK(status == DownloadStatus{101, 0, 0});
    CHECK(scheduler->peak_concurrency() >= 1);
    CHECK(scheduler->peak_concurrency() <= 8);
    CHECK(server.total_hits() == 101);
}

TEST_CASE("Scheduler - empty listing", "[scheduler]") {
    TempDir dir;
    auto recorded = std::make_shared<Recorded>();
    auto status = run_download(HttpSession{}, {}, dir.path(),
                               std::make_unique<RecordingReporter>(recorded), fast_options());
    REQUIRE(status.has_value());
    CHECK(*status == DownloadStatus{});
    CHECK(recorded->finished);
    CHECK(recorded->advanced == 0);
}

TEST_CASE("Scheduler - creates the download directory", "[scheduler]") {
    TempDir dir;
    auto nested = dir / "a" / "b";
    auto scheduler = Scheduler::build(HttpSession{}, nested, {}, fast_options());
    REQUIRE(scheduler.has_value());
    CHECK(fs::is_directory(nested));
}

TEST_CASE("Scheduler - directory blocked by a file", "[scheduler]") {
    TempDir dir;
    write_text(dir / "blocker", "x");
    auto status = run_download(HttpSession{}, {}, dir / "blocker",
                               std::make_unique<NullProgress>(), fast_options());
    REQUIRE_FALSE(status.has_value());
    CHECK_THAT(status.error().message(), Catch::Matchers::ContainsSubstring("Failed to create download directory"));
}

TEST_CASE("Scheduler - cancel ends the run", "[scheduler]") {
    TestServer server;
    TempDir dir;
    std::vector<Post> posts;
    for (std::uint64_t id = 1; id <= 20; ++id) {
        auto target = std::format("/slow/{}.jpg", id);
        Response slow{200, std::string(256 * 1024, 's')};
        slow.chunk_delay = std::chrono::milliseconds(20);
        server.route(target, slow);
        posts.push_back(Post::make(id, md5_of("unused"), server.url(target), "slow", "s.jpg"));
    }

    LogCapture log;
    auto scheduler = Scheduler::build(HttpSession{}, dir.path(), std::move(posts), fast_options(2));
    REQUIRE(scheduler.has_value());

    auto stop = scheduler->stop_source();
    std::jthread canceller([stop]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        stop.request_stop();
    });

    auto status = scheduler->launch(std::make_unique<NullProgress>());
    CHECK(scheduler->stop_requested());
    CHECK(status.done == 0);
    CHECK(status.failed >= 1);
    CHECK(status.processed() < 20);
}

TEST_CASE("Scheduler - reporter fault is rethrown from launch", "[scheduler]") {
    class ThrowingReporter final : public ProgressReporter {
    public:
        void set_status(const DownloadStatus&) override {}
        void set_speed(std::uint64_t) override {}
        void advance(std::uint64_t) override { throw std::runtime_error("display broke"); }
        void suspend(const std::function<void()>& fn) override { fn(); }
        void finish() override {}
    };

    TestServer server;
    TempDir dir;
    std::vector<Post> posts;
    for (std::uint64_t id = 1; id <= 4; ++id) {
        posts.push_back(make_post(server, id, "body"));
    }

    LogCapture log;
    auto scheduler = Scheduler::build(HttpSession{}, dir.path(), std::move(posts), fast_options(2));
    REQUIRE(scheduler.has_value());
    CHECK_THROWS_WITH(scheduler->launch(std::make_unique<ThrowingReporter>()), "display broke");
    CHECK(scheduler->stop_requested());
}

TEST_CASE("Scheduler - per-item log lines go through the display", "[scheduler]") {
    TestServer server;
    TempDir dir;
    auto fresh = make_post(server, 40, "fresh");
    auto present = make_post(server, 41, "present");
    write_text(dir / "41.jpg", "present");

    LogCapture log(spdlog::level::debug);
    auto recorded = std::make_shared<Recorded>();
    auto status = run_download(HttpSession{}, {fresh, present}, dir.path(),
                               std::make_unique<RecordingReporter>(recorded), fast_options(2));

    REQUIRE(status.has_value());
    CHECK(*status == DownloadStatus{1, 1, 0});
    CHECK(recorded->suspended == 2);

    const auto text = log.text();
    CHECK_THAT(text, Catch::Matchers::ContainsSubstring((dir / "40.jpg").string() + " downloaded"));
    CHECK_THAT(text, Catch::Matchers::ContainsSubstring((dir / "41.jpg").string() + " already downloaded"));
}

TEST_CASE("Scheduler - worker fault is rethrown after every thread is joined", "[scheduler]") {
    TestServer server;
    TempDir dir;
    std::vector<Post> posts;
    for (std::uint64_t id = 1; id <= 6; ++id) {
        posts.push_back(make_post(server, id, std::format("body {}", id)));
    }

    auto started = std::make_shared<std::atomic<int>>(0);
    auto options = fast_options(2);
    options.on_item_start = [started](const Post& post) {
        started->fetch_add(1);
        if (post.id == 3) {
            throw std::logic_error("item hook failed");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    };

    LogCapture log;
    auto scheduler = Scheduler::build(HttpSession{}, dir.path(), std::move(posts), std::move(options));
    REQUIRE(scheduler.has_value());
    CHECK_THROWS_WITH(scheduler->launch(std::make_unique<NullProgress>()), "item hook failed");
    CHECK(scheduler->stop_requested());
    CHECK_THAT(log.text(), Catch::Matchers::ContainsSubstring("Download task failed: item hook failed"));

    // Nothing may still be running once launch() has returned
    const int seen = started->load();
    CHECK(seen >= 3);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(started->load() == seen);
}

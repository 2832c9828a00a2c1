// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <booru/core/speed_meter.hpp>
#include <booru/core/transfer.hpp>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace booru::core;

namespace {

class RecordingReporter final : public ProgressReporter {
public:
    void set_status(const DownloadStatus&) override {}
    void set_speed(std::uint64_t bps) override {
        std::lock_guard lock(mutex);
        speeds.push_back(bps);
    }
    void advance(std::uint64_t) override {}
    void suspend(const std::function<void()>& fn) override { fn(); }
    void finish() override {}

    std::mutex mutex;
    std::vector<std::uint64_t> speeds;
};

} // namespace

TEST_CASE("bytes_per_second", "[speed]") {
    using std::chrono::milliseconds;
    CHECK(bytes_per_second(1000, milliseconds(1000)) == 1000);
    CHECK(bytes_per_second(5000, milliseconds(500)) == 10000);
    CHECK(bytes_per_second(0, milliseconds(1000)) == 0);

    SECTION("Zero interval counts as one millisecond") {
        CHECK(bytes_per_second(3, milliseconds(0)) == 3000);
    }
}

TEST_CASE("SpeedMeter - samples drain the counter", "[speed]") {
    auto counter = std::make_shared<ByteCounter>(0);
    SpeedMeter meter(counter);

    counter->fetch_add(4096);
    auto s = meter.sample();
    CHECK(s.bytes == 4096);
    CHECK(counter->load() == 0);

    CHECK(meter.sample().bytes == 0);

    counter->fetch_add(10);
    meter.reset();
    CHECK(meter.sample().bytes == 0);
}

TEST_CASE("SpeedMeter - concurrent writers lose nothing", "[speed]") {
    auto counter = std::make_shared<ByteCounter>(0);
    SpeedMeter meter(counter);
    constexpr int writers = 8;
    constexpr int increments = 10'000;

    std::atomic<bool> done{false};
    std::uint64_t drained = 0;
    std::jthread reader([&] {
        while (!done.load()) {
            drained += meter.sample().bytes;
        }
    });

    {
        std::vector<std::jthread> threads;
        for (int w = 0; w < writers; ++w) {
            threads.emplace_back([weak = std::weak_ptr<ByteCounter>(counter)] {
                for (int i = 0; i < increments; ++i) {
                    report_bytes(weak, 3);
                }
            });
        }
    }
    done.store(true);
    reader.join();
    drained += meter.sample().bytes;

    CHECK(drained == std::uint64_t{writers} * increments * 3);
}

TEST_CASE("run_speed_sampler", "[speed]") {
    auto counter = std::make_shared<ByteCounter>(0);
    SpeedMeter meter(counter);

    SECTION("Stops once the reporter is released") {
        auto reporter = std::make_shared<RecordingReporter>();
        std::jthread sampler([&meter, weak = std::weak_ptr<ProgressReporter>(reporter)] {
            run_speed_sampler(meter, weak, std::chrono::milliseconds(20));
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        counter->fetch_add(1000);
        std::this_thread::sleep_for(std::chrono::milliseconds(70));

        std::size_t seen = 0;
        {
            std::lock_guard lock(reporter->mutex);
            seen = reporter->speeds.size();
        }
        CHECK(seen >= 1);

        reporter.reset();
        sampler.join();
    }

    SECTION("Returns at once for an expired reporter") {
        std::weak_ptr<ProgressReporter> expired;
        run_speed_sampler(meter, expired, std::chrono::seconds(10));
        SUCCEED();
    }
}

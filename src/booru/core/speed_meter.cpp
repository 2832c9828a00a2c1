// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/speed_meter.hpp>
#include <algorithm>
#include <limits>
#include <thread>
#include <utility>

namespace booru::core {

std::uint64_t bytes_per_second(std::uint64_t bytes, std::chrono::milliseconds elapsed) noexcept {
    auto ms = static_cast<std::uint64_t>(std::max<std::chrono::milliseconds::rep>(elapsed.count(), 1));
    if (bytes > std::numeric_limits<std::uint64_t>::max() / 1000) {
        return bytes / ms * 1000;
    }
    return bytes * 1000 / ms;
}

//=============================================================================
// SpeedMeter
//=============================================================================

SpeedMeter::SpeedMeter(std::shared_ptr<ByteCounter> counter) noexcept
    : counter_(std::move(counter))
    , last_(std::chrono::steady_clock::now()) {}

void SpeedMeter::reset() noexcept {
    counter_->exchange(0, std::memory_order_acquire);
    last_ = std::chrono::steady_clock::now();
}

SpeedSample SpeedMeter::sample() noexcept {
    auto now = std::chrono::steady_clock::now();
    SpeedSample s;
    s.bytes = counter_->exchange(0, std::memory_order_acquire);
    s.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_);
    s.bytes_per_sec = bytes_per_second(s.bytes, s.elapsed);
    last_ = now;
    return s;
}

void run_speed_sampler(SpeedMeter& meter,
                       std::weak_ptr<ProgressReporter> reporter,
                       std::chrono::milliseconds interval) {
    // Anything counted while tasks were being arranged is not steady-state speed
    meter.reset();
    if (reporter.expired()) {
        return;
    }

    while (true) {
        std::this_thread::sleep_for(interval);
        auto s = meter.sample();

        auto display = reporter.lock();
        if (!display) {
            return;
        }
        display->set_speed(s.bytes_per_sec);
    }
}

} // namespace booru::core

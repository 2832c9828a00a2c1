// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/core/config.hpp>
#include <booru/core/progress.hpp>
#include <booru/core/transfer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

namespace booru::core {

struct SpeedSample {
    std::uint64_t bytes{0};
    std::chrono::milliseconds elapsed{0};
    std::uint64_t bytes_per_sec{0};
};

// bytes * 1000 / elapsed_ms, treating a zero interval as 1 ms
[[nodiscard]] std::uint64_t bytes_per_second(std::uint64_t bytes,
                                             std::chrono::milliseconds elapsed) noexcept;

// Sole reader of the shared byte counter: each sample drains it
class SpeedMeter {
public:
    explicit SpeedMeter(std::shared_ptr<ByteCounter> counter) noexcept;

    // Drain and restart the interval without producing a sample
    void reset() noexcept;

    // Drain the counter and rate it over the time since the previous call
    [[nodiscard]] SpeedSample sample() noexcept;

private:
    std::shared_ptr<ByteCounter> counter_;
    std::chrono::steady_clock::time_point last_;
};

// Push a speed sample to the reporter every interval until the reporter has no
// owner left. The first sample is discarded. Returns up to one interval after
// the reporter is released.
void run_speed_sampler(SpeedMeter& meter,
                       std::weak_ptr<ProgressReporter> reporter,
                       std::chrono::milliseconds interval = SPEED_UPDATE_INTERVAL);

} // namespace booru::core

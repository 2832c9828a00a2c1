// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace booru::core {

// Running totals of a run
struct DownloadStatus {
    std::uint64_t done{0};      // Downloaded and tagged
    std::uint64_t existed{0};   // Already on disk with matching hash
    std::uint64_t failed{0};

    [[nodiscard]] std::uint64_t processed() const noexcept { return done + existed + failed; }

    bool operator==(const DownloadStatus&) const = default;
};

// "[done:1\texisted:0\tfailed:2]"
[[nodiscard]] std::string status_message(const DownloadStatus& status);

// Display driven by the scheduler. set_status/advance/suspend/finish come from
// the aggregation loop, set_speed from the speed sampler thread, so
// implementations must serialize their own rendering.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void set_status(const DownloadStatus& status) = 0;
    virtual void set_speed(std::uint64_t bytes_per_sec) = 0;
    virtual void advance(std::uint64_t n = 1) = 0;

    // Run fn with the display hidden, so fn may write to the terminal
    virtual void suspend(const std::function<void()>& fn) = 0;

    virtual void finish() = 0;
};

// Reporter that draws nothing (quiet mode)
class NullProgress final : public ProgressReporter {
public:
    void set_status(const DownloadStatus&) override {}
    void set_speed(std::uint64_t) override {}
    void advance(std::uint64_t) override {}
    void suspend(const std::function<void()>& fn) override { fn(); }
    void finish() override {}
};

} // namespace booru::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/core/progress.hpp>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace booru::cli {

// "512 B", "1.5 KiB", "2.00 MiB"
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

// "[1.50 MiB/S]"
[[nodiscard]] std::string format_speed(std::uint64_t bps);

// "1h 02m 5s", "3m 12s", "7s"
[[nodiscard]] std::string format_time(std::uint64_t seconds);

// "00:01:05"
[[nodiscard]] std::string format_elapsed(std::chrono::seconds elapsed);

// One-line item progress display:
// [elapsed] [speed] [=====>    ] [done:..] pos/len (eta)
// Redraws in place on every change; all methods are thread-safe.
class ProgressBar final : public core::ProgressReporter {
public:
    ProgressBar(std::uint64_t total, std::ostream& out);
    ~ProgressBar() override;

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    void set_status(const core::DownloadStatus& status) override;
    void set_speed(std::uint64_t bytes_per_sec) override;
    void advance(std::uint64_t n = 1) override;
    void suspend(const std::function<void()>& fn) override;
    void finish() override;

    // Current line without the carriage return
    [[nodiscard]] std::string render() const;

    [[nodiscard]] std::uint64_t position() const;
    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }

private:
    [[nodiscard]] std::string render_locked() const;
    [[nodiscard]] std::string render_bar(double fraction) const;
    void draw_locked();
    void clear_locked();

    mutable std::mutex mutex_;
    std::ostream& out_;
    std::uint64_t total_;
    std::uint64_t position_{0};
    std::string prefix_;
    std::string message_;
    std::chrono::steady_clock::time_point started_;
    std::size_t drawn_width_{0};
    bool finished_{false};
    int width_{30};
};

// Animated "...  message" line for work of unknown length. Ticks on its own
// thread until finish() or destruction, then clears the line.
class Spinner {
public:
    Spinner(std::string_view message, std::ostream& out,
            std::chrono::milliseconds tick = std::chrono::milliseconds(100));
    ~Spinner();

    Spinner(const Spinner&) = delete;
    Spinner& operator=(const Spinner&) = delete;

    void finish();

private:
    void update();
    void clear();

    std::mutex mutex_;
    std::ostream& out_;
    std::string message_;
    std::size_t frame_{0};
    bool finished_{false};
    std::jthread ticker_;
};

} // namespace booru::cli

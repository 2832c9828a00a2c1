// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <ostream>

namespace booru::cli {

namespace {

// ASCII only, so every console can draw it
constexpr const char* SPINNER_FRAMES[] = {".  ", ".. ", "...", " ..", "  .", "   "};
constexpr std::size_t SPINNER_FRAME_COUNT = std::size(SPINNER_FRAMES);

} // namespace

//=============================================================================
// Formatting
//=============================================================================

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KiB = 1024;
    constexpr std::uint64_t MiB = 1024 * KiB;
    constexpr std::uint64_t GiB = 1024 * MiB;
    constexpr std::uint64_t TiB = 1024 * GiB;

    const auto value = static_cast<double>(bytes);
    if (bytes >= TiB) return std::format("{:.2f} TiB", value / TiB);
    if (bytes >= GiB) return std::format("{:.2f} GiB", value / GiB);
    if (bytes >= MiB) return std::format("{:.2f} MiB", value / MiB);
    if (bytes >= KiB) return std::format("{:.2f} KiB", value / KiB);
    return std::format("{} B", bytes);
}

std::string format_speed(std::uint64_t bps) {
    return std::format("[{}/S]", format_bytes(bps));
}

std::string format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) return std::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return std::format("{}m {}s", minutes, secs);
    return std::format("{}s", secs);
}

std::string format_elapsed(std::chrono::seconds elapsed) {
    const auto total = static_cast<std::uint64_t>(std::max<std::int64_t>(elapsed.count(), 0));
    return std::format("{:02}:{:02}:{:02}", total / 3600, (total % 3600) / 60, total % 60);
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::ostream& out)
    : out_(out)
    , total_(total)
    , prefix_(format_speed(0))
    , message_(core::status_message({}))
    , started_(std::chrono::steady_clock::now()) {}

ProgressBar::~ProgressBar() {
    std::lock_guard lock(mutex_);
    if (!finished_ && drawn_width_ > 0) {
        out_ << '\n' << std::flush;
    }
}

void ProgressBar::set_status(const core::DownloadStatus& status) {
    std::lock_guard lock(mutex_);
    message_ = core::status_message(status);
    draw_locked();
}

void ProgressBar::set_speed(std::uint64_t bytes_per_sec) {
    std::lock_guard lock(mutex_);
    prefix_ = format_speed(bytes_per_sec);
    draw_locked();
}

void ProgressBar::advance(std::uint64_t n) {
    std::lock_guard lock(mutex_);
    position_ = std::min(total_, position_ + n);
    draw_locked();
}

void ProgressBar::suspend(const std::function<void()>& fn) {
    std::lock_guard lock(mutex_);
    clear_locked();
    fn();
    draw_locked();
}

void ProgressBar::finish() {
    std::lock_guard lock(mutex_);
    if (finished_) return;
    draw_locked();
    finished_ = true;
    out_ << '\n' << std::flush;
}

std::string ProgressBar::render() const {
    std::lock_guard lock(mutex_);
    return render_locked();
}

std::uint64_t ProgressBar::position() const {
    std::lock_guard lock(mutex_);
    return position_;
}

std::string ProgressBar::render_locked() const {
    using namespace std::chrono;
    const auto elapsed = duration_cast<seconds>(steady_clock::now() - started_);
    const double fraction = total_ == 0 ? 1.0
        : static_cast<double>(position_) / static_cast<double>(total_);

    // Items left at the average rate so far
    std::uint64_t eta = 0;
    if (position_ > 0 && position_ < total_) {
        const auto ms = static_cast<std::uint64_t>(duration_cast<milliseconds>(steady_clock::now() - started_).count());
        eta = ms * (total_ - position_) / position_ / 1000;
    }

    return std::format("[{}] {} {} {} {}/{} ({})",
                       format_elapsed(elapsed), prefix_, render_bar(fraction),
                       message_, position_, total_, format_time(eta));
}

std::string ProgressBar::render_bar(double fraction) const {
    const int filled = static_cast<int>(std::round(width_ * std::clamp(fraction, 0.0, 1.0)));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < width_) {
        bar += '>';
        bar.append(static_cast<std::size_t>(width_ - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

void ProgressBar::draw_locked() {
    if (finished_) return;
    auto line = render_locked();
    // Pad over leftovers of a longer previous line
    const std::size_t width = line.size();
    if (width < drawn_width_) {
        line.append(drawn_width_ - width, ' ');
    }
    drawn_width_ = width;
    out_ << '\r' << line << std::flush;
}

void ProgressBar::clear_locked() {
    if (drawn_width_ == 0 || finished_) return;
    out_ << '\r' << std::string(drawn_width_, ' ') << '\r' << std::flush;
    drawn_width_ = 0;
}

//=============================================================================
// Spinner
//=============================================================================

Spinner::Spinner(std::string_view message, std::ostream& out, std::chrono::milliseconds tick)
    : out_(out)
    , message_(message) {
    ticker_ = std::jthread([this, tick](std::stop_token stop) {
        while (!stop.stop_requested()) {
            update();
            std::this_thread::sleep_for(tick);
        }
    });
}

Spinner::~Spinner() {
    finish();
}

void Spinner::finish() {
    ticker_.request_stop();
    if (ticker_.joinable()) {
        ticker_.join();
    }
    clear();
}

void Spinner::update() {
    std::lock_guard lock(mutex_);
    if (finished_) return;
    out_ << '\r' << SPINNER_FRAMES[frame_ % SPINNER_FRAME_COUNT] << ' ' << message_ << std::flush;
    ++frame_;
}

void Spinner::clear() {
    std::lock_guard lock(mutex_);
    if (finished_) return;
    finished_ = true;
    out_ << '\r' << std::string(message_.size() + 4, ' ') << '\r' << std::flush;
}

} // namespace booru::cli

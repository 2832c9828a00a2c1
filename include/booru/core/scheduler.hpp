// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/core/config.hpp>
#include <booru/core/error.hpp>
#include <booru/core/http_session.hpp>
#include <booru/core/post.hpp>
#include <booru/core/progress.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <stop_token>
#include <vector>

namespace booru::core {

// Result of one post that didn't fail
enum class ItemOutcome : std::uint8_t {
    done,     // Downloaded and tag file written
    existed,  // File already on disk with the same MD5
};

// Runs on the worker thread before an item's existing-file check. An
// exception thrown here ends the run like any other task fault.
using ItemHook = std::function<void(const Post&)>;

struct SchedulerOptions {
    std::uint32_t concurrency{0};   // 0 = available_parallelism()
    std::chrono::milliseconds speed_interval{SPEED_UPDATE_INTERVAL};
    ItemHook on_item_start;
};

/*
 Downloads every post of a listing into one directory.

 Each post becomes one task that holds a permit of a limiter sized to the
 host's parallelism while it hashes any existing file, downloads, and writes
 the <id>.txt tag file. Outcomes are aggregated on the thread that calls
 launch(); a second thread turns the shared byte counter into a speed figure.
 Item failures are logged and counted, never returned as errors.
*/
class Scheduler {
public:
    // Creates download_dir if needed; failing to do so is the only error
    [[nodiscard]] static std::expected<Scheduler, Error>
    build(HttpSession session,
          std::filesystem::path download_dir,
          std::vector<Post> posts,
          SchedulerOptions options = {});

    Scheduler(Scheduler&&) noexcept = default;
    Scheduler& operator=(Scheduler&&) noexcept = default;
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Run every task to completion and return the totals. Posts are consumed,
    // so a scheduler launches once. An exception escaping a task stops the
    // run and is rethrown here.
    DownloadStatus launch(std::unique_ptr<ProgressReporter> reporter);

    // Stop spawning and abort in-flight transfers (thread-safe)
    void cancel() noexcept { stop_.request_stop(); }

    // Lets another thread (e.g. a signal watcher) cancel the run
    [[nodiscard]] std::stop_source stop_source() const noexcept { return stop_; }
    [[nodiscard]] bool stop_requested() const noexcept { return stop_.stop_requested(); }

    [[nodiscard]] const std::filesystem::path& download_dir() const noexcept { return download_dir_; }
    [[nodiscard]] std::size_t size() const noexcept { return posts_.size(); }
    [[nodiscard]] std::uint32_t concurrency() const noexcept { return options_.concurrency; }

    // Most tasks that held a permit at once during the last launch
    [[nodiscard]] std::uint32_t peak_concurrency() const noexcept { return peak_concurrency_; }

private:
    Scheduler(HttpSession session,
              std::filesystem::path download_dir,
              std::vector<Post> posts,
              SchedulerOptions options) noexcept;

    HttpSession session_;
    std::filesystem::path download_dir_;
    std::vector<Post> posts_;
    SchedulerOptions options_;
    std::stop_source stop_;
    std::uint32_t peak_concurrency_{0};
};

// build() + launch(); the only error is an uncreatable download directory
[[nodiscard]] std::expected<DownloadStatus, Error>
run_download(const HttpSession& session,
             std::vector<Post> posts,
             const std::filesystem::path& download_dir,
             std::unique_ptr<ProgressReporter> reporter,
             SchedulerOptions options = {});

} // namespace booru::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/scheduler.hpp>
#include <booru/core/existing_file.hpp>
#include <booru/core/limiter.hpp>
#include <booru/core/speed_meter.hpp>
#include <booru/core/transfer.hpp>
#include <booru/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace booru::core {

namespace {

using ItemResult = std::expected<ItemOutcome, Error>;

// What a task sends back: either a result or an exception that escaped it
struct TaskReport {
    std::size_t index{0};
    std::filesystem::path destination;
    std::optional<ItemResult> result;
    std::exception_ptr fault;
};

// Multi-producer, single-consumer report channel. The dispatcher seals it with
// the number of tasks it spawned; pop() returns nullopt once that many reports
// have been delivered.
class ReportQueue {
public:
    void push(TaskReport report) {
        {
            std::lock_guard lock(mutex_);
            reports_.push_back(std::move(report));
        }
        cv_.notify_one();
    }

    void seal(std::size_t total) {
        {
            std::lock_guard lock(mutex_);
            expected_ = total;
        }
        cv_.notify_one();
    }

    [[nodiscard]] std::optional<TaskReport> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] {
            return !reports_.empty() || (expected_ && delivered_ >= *expected_);
        });
        if (reports_.empty()) {
            return std::nullopt;
        }
        TaskReport report = std::move(reports_.front());
        reports_.pop_front();
        ++delivered_;
        return report;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TaskReport> reports_;
    std::optional<std::size_t> expected_;
    std::size_t delivered_{0};
};

// Owns the worker threads; finished ones are joined on the next spawn
class TaskGroup {
public:
    template<typename Fn>
    void spawn(Fn&& fn) {
        reap();
        auto finished = std::make_shared<std::atomic<bool>>(false);
        workers_.push_back(Worker{
            std::jthread([finished, fn = std::forward<Fn>(fn)]() mutable {
                fn();
                finished->store(true, std::memory_order_release);
            }),
            finished});
    }

    void join_all() {
        for (auto& w : workers_) {
            if (w.thread.joinable()) w.thread.join();
        }
        workers_.clear();
    }

    ~TaskGroup() { join_all(); }

private:
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void reap() {
        std::erase_if(workers_, [](const Worker& w) {
            return w.finished->load(std::memory_order_acquire);
        });
    }

    std::vector<Worker> workers_;
};

// Everything a task reads; outlives every worker
struct TaskContext {
    const HttpSession& session;
    const std::filesystem::path& download_dir;
    std::weak_ptr<ByteCounter> counter;
    std::stop_token stop;
    const ItemHook& on_item_start;
};

ItemResult run_item(const TaskContext& ctx, const Post& post, const std::filesystem::path& path) {
    if (ctx.on_item_start) {
        ctx.on_item_start(post);
    }

    auto existed = file_matches(path, post.md5);
    if (!existed) {
        return std::unexpected(Error(existed.error()).with_context(
            std::format("Failed to check if file is already existed: {}", path.string())));
    }
    if (*existed) {
        return ItemOutcome::existed;
    }

    auto downloaded = transfer(ctx.session, TransferRequest{post.file_url, path, ctx.counter, ctx.stop});
    if (!downloaded) {
        return std::unexpected(std::move(downloaded.error()).with_context(
            std::format("Failed to download: {}", path.string())));
    }

    const auto tag_path = tag_file_path(path);
    if (auto ec = disk::write_file(tag_path, format_tags(post.tags))) {
        return std::unexpected(Error(ec).with_context(
            std::format("Failed to write tags: {}", tag_path.string())));
    }

    return ItemOutcome::done;
}

// Fold reports into the totals until every spawned task has reported.
// A fault report is rethrown.
DownloadStatus aggregate(ReportQueue& queue, ProgressReporter& progress) {
    DownloadStatus status;
    progress.set_status(status);

    while (auto report = queue.pop()) {
        if (report->fault) {
            std::rethrow_exception(report->fault);
        }

        const auto& result = *report->result;
        if (result) {
            if (*result == ItemOutcome::done) {
                ++status.done;
            } else {
                ++status.existed;
            }
            if (spdlog::should_log(spdlog::level::debug)) {
                progress.suspend([&] {
                    spdlog::debug("{} {}", report->destination.string(),
                                  *result == ItemOutcome::done ? "downloaded" : "already downloaded");
                });
            }
        } else {
            ++status.failed;
            progress.suspend([&] { spdlog::error("{}", result.error().message()); });
        }

        progress.set_status(status);
        progress.advance(1);
    }

    progress.finish();
    return status;
}

} // namespace

//=============================================================================
// Scheduler
//=============================================================================

Scheduler::Scheduler(HttpSession session,
                     std::filesystem::path download_dir,
                     std::vector<Post> posts,
                     SchedulerOptions options) noexcept
    : session_(std::move(session))
    , download_dir_(std::move(download_dir))
    , posts_(std::move(posts))
    , options_(std::move(options)) {}

std::expected<Scheduler, Error>
Scheduler::build(HttpSession session,
                 std::filesystem::path download_dir,
                 std::vector<Post> posts,
                 SchedulerOptions options) {
    std::error_code ec;
    std::filesystem::create_directories(download_dir, ec);
    if (ec) {
        return std::unexpected(Error(ec).with_context(
            std::format("Failed to create download directory: {}", download_dir.string())));
    }

    if (options.concurrency == 0) {
        options.concurrency = available_parallelism();
    }

    return Scheduler(std::move(session), std::move(download_dir), std::move(posts), std::move(options));
}

DownloadStatus Scheduler::launch(std::unique_ptr<ProgressReporter> reporter) {
    auto posts = std::exchange(posts_, {});
    spdlog::debug("Downloading {} posts into {} with {} slots",
                  posts.size(), download_dir_.string(), options_.concurrency);

    std::shared_ptr<ProgressReporter> progress = std::move(reporter);
    if (!progress) {
        progress = std::make_shared<NullProgress>();
    }

    // Shared state first: threads below are destroyed before it
    auto counter = std::make_shared<ByteCounter>(0);
    ReportQueue queue;
    ConcurrencyLimiter limiter(options_.concurrency);
    TaskContext ctx{session_, download_dir_, counter, stop_.get_token(), options_.on_item_start};
    TaskGroup tasks;

    std::jthread dispatcher([&] {
        std::size_t spawned = 0;
        try {
            for (std::size_t i = 0; i < posts.size(); ++i) {
                auto permit = limiter.acquire(ctx.stop);
                if (!permit) {
                    spdlog::trace("Stop requested, {} posts not started", posts.size() - i);
                    break;
                }

                tasks.spawn([&ctx, &queue, i, post = std::move(posts[i]),
                             permit = std::move(*permit)]() mutable {
                    TaskReport report{i, ctx.download_dir / post.filename, std::nullopt, nullptr};
                    try {
                        Permit held = std::move(permit);
                        report.result = run_item(ctx, post, report.destination);
                    } catch (...) {
                        report.fault = std::current_exception();
                    }
                    queue.push(std::move(report));
                });
                ++spawned;
            }
        } catch (...) {
            queue.push(TaskReport{spawned, {}, std::nullopt, std::current_exception()});
            ++spawned;
        }
        queue.seal(spawned);
    });

    SpeedMeter meter(counter);
    std::jthread sampler([&meter, weak = std::weak_ptr<ProgressReporter>(progress),
                          interval = options_.speed_interval] {
        run_speed_sampler(meter, weak, interval);
    });

    std::exception_ptr fault;
    DownloadStatus status;
    try {
        status = aggregate(queue, *progress);
    } catch (const std::exception& e) {
        spdlog::critical("Download task failed: {}", e.what());
        fault = std::current_exception();
        stop_.request_stop();
    } catch (...) {
        fault = std::current_exception();
        stop_.request_stop();
    }

    // The sampler exits once it can no longer reach the reporter
    progress.reset();
    sampler.join();
    dispatcher.join();
    tasks.join_all();
    peak_concurrency_ = limiter.peak();

    if (fault) {
        std::rethrow_exception(fault);
    }
    return status;
}

std::expected<DownloadStatus, Error>
run_download(const HttpSession& session,
             std::vector<Post> posts,
             const std::filesystem::path& download_dir,
             std::unique_ptr<ProgressReporter> reporter,
             SchedulerOptions options) {
    auto scheduler = Scheduler::build(session, download_dir, std::move(posts), std::move(options));
    if (!scheduler) {
        return std::unexpected(std::move(scheduler.error()));
    }
    return scheduler->launch(std::move(reporter));
}

} // namespace booru::core

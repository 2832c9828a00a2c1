// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/cli/commands.hpp>
#include <booru/api/gelbooru.hpp>
#include <booru/cli/progress_bar.hpp>
#include <booru/core/http_session.hpp>
#include <booru/core/scheduler.hpp>
#include <booru/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <charconv>
#include <format>
#include <iostream>
#include <memory>
#include <stop_token>

using namespace booru::core;

namespace booru::cli {

namespace {

template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view flag) -> const char* {
        if (i + 1 >= argc) {
            if (args.error.empty()) args.error = std::format("{} requires a value", flag);
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "--print-config") {
            args.print_config = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-t" || arg == "--tags") {
            if (auto v = value_of(i, arg)) args.tags = v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value_of(i, arg)) args.download_dir = v;
        } else if (arg == "-n" || arg == "--num") {
            if (auto v = value_of(i, arg)) {
                args.num_imgs = parse_number<std::uint64_t>(v);
                if (!args.num_imgs && args.error.empty()) {
                    args.error = std::format("invalid number for {}: {}", arg, v);
                }
            }
        } else if (arg == "--timeout") {
            if (auto v = value_of(i, arg)) {
                args.timeout = parse_number<std::uint32_t>(v);
                if (!args.timeout && args.error.empty()) {
                    args.error = std::format("invalid number for {}: {}", arg, v);
                }
            }
        } else if (arg.starts_with("-")) {
            if (args.error.empty()) args.error = std::format("unknown option: {}", arg);
        } else if (args.config_path.empty()) {
            args.config_path = arg;
        } else if (args.error.empty()) {
            args.error = std::format("unexpected argument: {}", arg);
        }
    }

    return args;
}

std::expected<AppConfig, Error> resolve_config(const CliArgs& args) {
    AppConfig config;
    if (!args.config_path.empty()) {
        auto loaded = load_config(args.config_path);
        if (!loaded) {
            return std::unexpected(std::move(loaded.error()));
        }
        config = std::move(*loaded);
    } else if (!args.tags) {
        return std::unexpected(Error(make_error_code(DownloadErrc::invalid_argument),
                                     "no config file or --tags given"));
    }

    if (args.tags) config.tags = *args.tags;
    if (args.num_imgs) config.num_imgs = *args.num_imgs;
    if (args.download_dir) config.download_dir = *args.download_dir;
    if (args.timeout) config.timeout = *args.timeout;

    if (auto valid = config.validate(); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

void setup_logging(bool verbose, bool quiet) {
    auto logger = spdlog::stderr_color_mt("booru");
    logger->set_pattern("%^%l%$: %v");
    if (verbose) {
        logger->set_level(spdlog::level::debug);
    } else if (quiet) {
        logger->set_level(spdlog::level::warn);
    } else {
        logger->set_level(spdlog::level::info);
    }
    spdlog::set_default_logger(std::move(logger));
}

int run(const AppConfig& config, bool quiet, std::stop_token stop) {
    HttpSession session(HttpOptions{config.timeout, std::format("{}/{}", PROGRAM_NAME, version.to_string())});

    auto getter = api::BatchGetter::build(session, config.tags, config.num_imgs);
    if (!getter) {
        spdlog::error("{}", getter.error().message());
        return exit_failure;
    }

    std::expected<std::vector<Post>, Error> posts;
    {
        std::unique_ptr<Spinner> spinner;
        if (!quiet) {
            spinner = std::make_unique<Spinner>("Fetching image data from Gelbooru API...", std::cerr);
        }
        posts = getter->run(stop);
    }
    if (stop.stop_requested()) {
        return exit_interrupted;
    }
    if (!posts) {
        spdlog::error("{}", std::move(posts.error()).with_context("Failed to get data from API").message());
        return exit_failure;
    }
    if (posts->empty()) {
        std::cout << "There is no image found with the given tags: " << config.tags << std::endl;
        return exit_ok;
    }

    const auto total = posts->size();
    auto scheduler = Scheduler::build(session, config.download_dir, std::move(*posts));
    if (!scheduler) {
        spdlog::error("{}", std::move(scheduler.error())
            .with_context("Unable to ensure the existence of the download directory").message());
        return exit_failure;
    }

    std::stop_callback on_stop(stop, [source = scheduler->stop_source()]() mutable {
        source.request_stop();
    });

    spdlog::info("Arranging {} tasks into {}", total, config.download_dir.string());
    std::unique_ptr<ProgressReporter> reporter;
    if (quiet) {
        reporter = std::make_unique<NullProgress>();
    } else {
        reporter = std::make_unique<ProgressBar>(total, std::cerr);
    }

    const auto status = scheduler->launch(std::move(reporter));
    spdlog::info("Finished: {} downloaded, {} existed, {} failed",
                 status.done, status.existed, status.failed);

    return scheduler->stop_requested() ? exit_interrupted : exit_ok;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << PROGRAM_NAME << " - Gelbooru batch downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] [CONFIG]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -t, --tags <TAGS>       Search tags (overrides config)\n";
    std::cout << "  -n, --num <N>           Number of images (overrides config)\n";
    std::cout << "  -d, --directory <DIR>   Download directory (overrides config)\n";
    std::cout << "      --timeout <SECS>    Request timeout, 0 = none (overrides config)\n";
    std::cout << "      --print-config      Print a config template and exit\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " config.json\n";
    std::cout << "  " << program_name << " -t \"cat rating:general\" -n 200 -d ./cats\n";
}

void print_version() noexcept {
    std::cout << PROGRAM_NAME << " " << version.to_string() << std::endl;
}

} // namespace booru::cli

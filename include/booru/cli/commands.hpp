// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/cli/app_config.hpp>
#include <booru/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace booru::cli {

enum ExitCode : int {
    exit_ok = 0,
    exit_failure = 1,
    exit_interrupted = 130,
};

// Command line arguments
struct CliArgs {
    std::string config_path;
    std::optional<std::string> tags;
    std::optional<std::uint64_t> num_imgs;
    std::optional<std::string> download_dir;
    std::optional<std::uint32_t> timeout;
    bool verbose{false};
    bool quiet{false};
    bool print_config{false};
    bool version{false};
    bool help{false};
    std::string error;    // First malformed argument, if any
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Config file (if any) overlaid with flags, then validated
[[nodiscard]] std::expected<AppConfig, core::Error> resolve_config(const CliArgs& args);

// Default logger on stderr; verbose shows debug, quiet only warnings
void setup_logging(bool verbose, bool quiet);

// Query the board and download every post. Returns an ExitCode.
[[nodiscard]] int run(const AppConfig& config, bool quiet, std::stop_token stop);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace booru::cli

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace booru::cli {

// Template written by --print-config
constexpr std::string_view DEFAULT_CONFIG_STR = R"({
    "tags": "cat",
    "num_imgs": 10,
    "download_dir": "./download",
    "timeout": 0
}
)";

struct AppConfig {
    std::string tags;                     // Board search query, non-empty
    std::uint64_t num_imgs{10};           // Posts to fetch, positive
    std::filesystem::path download_dir{"./download"};
    std::uint32_t timeout{0};             // Per-request seconds, 0 = none

    // First violated field, if any
    [[nodiscard]] std::expected<void, core::Error> validate() const;
};

// Parse a JSON document; missing keys keep their defaults
[[nodiscard]] std::expected<AppConfig, core::Error> parse_config(std::string_view text);

// Read, parse and validate a config file
[[nodiscard]] std::expected<AppConfig, core::Error> load_config(const std::filesystem::path& path);

} // namespace booru::cli

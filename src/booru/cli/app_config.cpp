// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/cli/app_config.hpp>
#include <nlohmann/json.hpp>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace booru::cli {

using core::DownloadErrc;
using core::Error;
using json = nlohmann::json;

namespace {

Error invalid(std::string detail) {
    return Error(make_error_code(DownloadErrc::invalid_argument), std::move(detail));
}

} // namespace

std::expected<void, Error> AppConfig::validate() const {
    if (tags.empty()) {
        return std::unexpected(invalid("tags must not be empty"));
    }
    if (num_imgs == 0) {
        return std::unexpected(invalid("num_imgs must be greater than 0"));
    }
    if (download_dir.empty()) {
        return std::unexpected(invalid("download_dir must not be empty"));
    }
    return {};
}

std::expected<AppConfig, Error> parse_config(std::string_view text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return std::unexpected(invalid("config is not valid JSON"));
    }
    if (!doc.is_object()) {
        return std::unexpected(invalid("config must be a JSON object"));
    }

    AppConfig config;
    const char* field = "";
    try {
        if (doc.contains(field = "tags")) {
            config.tags = doc.at(field).get<std::string>();
        }
        if (doc.contains(field = "num_imgs")) {
            const auto& v = doc.at(field);
            if (!v.is_number_unsigned()) {
                return std::unexpected(invalid("num_imgs must be a positive integer"));
            }
            config.num_imgs = v.get<std::uint64_t>();
        }
        if (doc.contains(field = "download_dir")) {
            config.download_dir = doc.at(field).get<std::string>();
        }
        if (doc.contains(field = "timeout")) {
            const auto& v = doc.at(field);
            if (!v.is_number_unsigned()) {
                return std::unexpected(invalid("timeout must be a non-negative integer"));
            }
            const auto seconds = v.get<std::uint64_t>();
            if (seconds > std::numeric_limits<std::uint32_t>::max()) {
                return std::unexpected(invalid(std::format("timeout is out of range: {}", seconds)));
            }
            config.timeout = static_cast<std::uint32_t>(seconds);
        }
    } catch (const json::exception& e) {
        return std::unexpected(invalid(std::format("{}: {}", field, e.what())));
    }
    return config;
}

std::expected<AppConfig, Error> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(Error(std::make_error_code(std::errc::no_such_file_or_directory))
            .with_context(std::format("Failed to read config: {}", path.string())));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str()).and_then([](AppConfig c) -> std::expected<AppConfig, Error> {
        if (auto valid = c.validate(); !valid) {
            return std::unexpected(std::move(valid.error()));
        }
        return c;
    });
    if (!config) {
        return std::unexpected(std::move(config.error()).with_context(
            std::format("Invalid config: {}", path.string())));
    }
    return config;
}

} // namespace booru::cli

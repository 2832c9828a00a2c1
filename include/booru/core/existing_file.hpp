// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <expected>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace booru::core {

// True when path exists and its MD5 equals expected_md5 (hex, any case).
// A missing file is not an error: it reports false.
[[nodiscard]] std::expected<bool, std::error_code>
file_matches(const std::filesystem::path& path, std::string_view expected_md5);

} // namespace booru::core

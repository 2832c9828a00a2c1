// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace booru::core {

// One media item from the image board
struct Post {
    std::uint64_t id{0};
    std::string md5;               // Lowercase hex digest of the file
    std::string file_url;          // Direct download URL
    std::string tags;              // Space-separated, as served by the board
    std::filesystem::path image;   // Original file name
    std::filesystem::path filename; // Local name: <id> + extension of image

    // Build a post and derive its local filename
    [[nodiscard]] static Post make(std::uint64_t id,
                                   std::string md5,
                                   std::string file_url,
                                   std::string tags,
                                   std::filesystem::path image);
};

// "<id>.<ext>" from the last component of image; "<id>" if it has no extension
[[nodiscard]] std::filesystem::path destination_filename(std::uint64_t id,
                                                         const std::filesystem::path& image);

// Sidecar path: same stem, tag extension
[[nodiscard]] std::filesystem::path tag_file_path(const std::filesystem::path& file_path);

// "a b c" -> "a, b, c"
[[nodiscard]] std::string format_tags(std::string_view tags);

} // namespace booru::core

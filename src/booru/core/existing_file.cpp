// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/existing_file.hpp>
#include <booru/core/hasher.hpp>
#include <algorithm>
#include <cctype>

namespace booru::core {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::expected<bool, std::error_code>
file_matches(const std::filesystem::path& path, std::string_view expected_md5) {
    auto digest = hash_file(path, DigestAlgorithm::md5);
    if (!digest) {
        if (digest.error() == std::errc::no_such_file_or_directory) {
            return false;
        }
        return std::unexpected(digest.error());
    }
    return iequals(*digest, expected_md5);
}

} // namespace booru::core

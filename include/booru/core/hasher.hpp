// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/core/config.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <system_error>

namespace booru::core {

enum class DigestAlgorithm : std::uint8_t {
    md5,
    sha1,
    sha256,
};

// Incremental digest over OpenSSL EVP
class Hasher {
public:
    explicit Hasher(DigestAlgorithm algorithm);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    void update(std::span<const std::byte> data);

    // Lowercase hex digest; the hasher is reset afterwards
    [[nodiscard]] std::string finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Hash a file in chunks of min(chunk_size, file size). A missing file reports
// std::errc::no_such_file_or_directory.
[[nodiscard]] std::expected<std::string, std::error_code>
hash_file(const std::filesystem::path& path,
          DigestAlgorithm algorithm,
          std::size_t chunk_size = HASH_CHUNK_SIZE);

} // namespace booru::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/hasher.hpp>
#include <booru/disk/file_writer.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

namespace booru::core {

namespace {

const EVP_MD* evp_for(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::md5:    return EVP_md5();
        case DigestAlgorithm::sha1:   return EVP_sha1();
        case DigestAlgorithm::sha256: return EVP_sha256();
    }
    return EVP_md5();
}

constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // namespace

struct Hasher::Impl {
    EVP_MD_CTX* ctx{EVP_MD_CTX_new()};
    const EVP_MD* md{nullptr};

    explicit Impl(const EVP_MD* digest) : md(digest) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
        init();
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    void init() {
        if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
            throw std::runtime_error("Failed to initialize digest");
        }
    }
};

Hasher::Hasher(DigestAlgorithm algorithm)
    : impl_(std::make_unique<Impl>(evp_for(algorithm))) {}

Hasher::~Hasher() = default;
Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

void Hasher::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(impl_->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
}

std::string Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;

    if (EVP_DigestFinal_ex(impl_->ctx, digest.data(), &len) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += HEX_DIGITS[digest[i] >> 4];
        hex += HEX_DIGITS[digest[i] & 0x0f];
    }

    impl_->init();
    return hex;
}

std::expected<std::string, std::error_code>
hash_file(const std::filesystem::path& path, DigestAlgorithm algorithm, std::size_t chunk_size) {
    disk::FileReader file;
    if (auto ec = file.open(path)) {
        return std::unexpected(ec);
    }

    auto file_size = file.size();
    if (!file_size) {
        return std::unexpected(file_size.error());
    }

    // Never allocate more than the file needs, but keep one byte to detect EOF
    auto buf_size = static_cast<std::size_t>(
        std::clamp<std::uint64_t>(*file_size, 1, std::max<std::size_t>(chunk_size, 1)));
    std::vector<std::byte> buffer(buf_size);

    Hasher hasher(algorithm);
    while (true) {
        auto n = file.read(buffer.data(), buffer.size());
        if (!n) {
            return std::unexpected(n.error());
        }
        if (*n == 0) {
            break;
        }
        hasher.update(std::span<const std::byte>(buffer.data(), *n));
    }

    return hasher.finalize();
}

} // namespace booru::core

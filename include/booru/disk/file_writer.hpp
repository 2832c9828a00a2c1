// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/disk/error.hpp>
#include <cstdint>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string_view>

namespace booru::disk {

// Sequential writer over a POSIX file descriptor
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate the file
    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    // Reserve size bytes on disk; fails with ENOSPC when the disk is full
    [[nodiscard]] std::error_code pre_allocate(std::uint64_t size) noexcept;

    // Append data, retrying partial writes
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush to stable storage
    [[nodiscard]] std::error_code sync() noexcept;

    // Close the descriptor, reporting close() failures
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::uint64_t written_{0};
    std::filesystem::path path_;
};

// Write a whole small file: create, write, sync, close
[[nodiscard]] std::error_code write_file(const std::filesystem::path& path,
                                         std::string_view content) noexcept;

// Sequential reader over a POSIX file descriptor
class FileReader {
public:
    FileReader() = default;
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;
    FileReader(FileReader&& other) noexcept;
    FileReader& operator=(FileReader&& other) noexcept;

    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    // Returns 0 at end of file
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(void* buffer, std::size_t size) noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

private:
    int fd_{-1};
};

} // namespace booru::disk

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/disk/file_writer.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace booru::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , written_(other.written_)
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = std::exchange(other.fd_, -1);
        written_ = other.written_;
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path) noexcept {
    if (fd_ >= 0) {
        return make_error_code(DiskErrc::already_open);
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return last_os_error();
    }

    fd_ = fd;
    written_ = 0;
    path_ = path;
    return {};
}

std::error_code FileWriter::pre_allocate(std::uint64_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (size == 0) {
        return {};
    }

    // posix_fallocate returns the error number instead of setting errno
    int rc = ::posix_fallocate(fd_, 0, static_cast<off_t>(size));
    if (rc == EOPNOTSUPP || rc == EINVAL) {
        // File system can't reserve blocks; fall back to a sparse size
        if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
            return last_os_error();
        }
        return {};
    }
    return rc == 0 ? std::error_code{} : os_error(rc);
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* cursor = static_cast<const char*>(data);
    std::size_t left = size;
    while (left > 0) {
        ssize_t n = ::write(fd_, cursor, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_os_error();
        }
        if (n == 0) {
            return make_error_code(DiskErrc::short_write);
        }
        cursor += n;
        left -= static_cast<std::size_t>(n);
    }

    written_ += size;
    return {};
}

std::error_code FileWriter::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    // Shrink back if the declared length was larger than what arrived
    struct stat st {};
    if (::fstat(fd_, &st) == 0 && static_cast<std::uint64_t>(st.st_size) > written_) {
        if (::ftruncate(fd_, static_cast<off_t>(written_)) != 0) {
            return last_os_error();
        }
    }

    return ::fsync(fd_) == 0 ? std::error_code{} : last_os_error();
}

std::error_code FileWriter::close() noexcept {
    if (fd_ < 0) {
        return {};
    }

    int fd = std::exchange(fd_, -1);
    return ::close(fd) == 0 ? std::error_code{} : last_os_error();
}

std::error_code write_file(const std::filesystem::path& path, std::string_view content) noexcept {
    FileWriter writer;
    if (auto ec = writer.open(path)) return ec;
    if (auto ec = writer.write(content.data(), content.size())) return ec;
    if (auto ec = writer.sync()) return ec;
    return writer.close();
}

//=============================================================================
// FileReader
//=============================================================================

FileReader::~FileReader() {
    close();
}

FileReader::FileReader(FileReader&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileReader& FileReader::operator=(FileReader&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::error_code FileReader::open(const std::filesystem::path& path) noexcept {
    close();

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return last_os_error();
    }
    fd_ = fd;
    return {};
}

std::expected<std::size_t, std::error_code>
FileReader::read(void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    while (true) {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            return std::unexpected(last_os_error());
        }
    }
}

std::expected<std::uint64_t, std::error_code> FileReader::size() const noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(last_os_error());
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void FileReader::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace booru::disk

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <cstddef>

namespace booru::core {

constexpr std::size_t HASH_CHUNK_SIZE = 2 * 1024 * 1024;          // 2 MB, bounds per-item memory
constexpr std::size_t TRANSFER_BUFFER_SIZE = 256 * 1024;          // 256 KB curl receive buffer

constexpr std::chrono::milliseconds SPEED_UPDATE_INTERVAL{1000};
constexpr std::chrono::milliseconds PERMIT_POLL_INTERVAL{100};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr const char* TAG_FILE_EXTENSION = ".txt";

// Number of hardware threads, at least 1
[[nodiscard]] std::uint32_t available_parallelism() noexcept;

} // namespace booru::core

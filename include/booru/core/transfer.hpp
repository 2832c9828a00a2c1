// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/core/error.hpp>
#include <booru/core/http_session.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>

namespace booru::core {

// Bytes written by all transfers since the speed sampler last drained it
using ByteCounter = std::atomic<std::uint64_t>;

struct TransferRequest {
    std::string url;
    std::filesystem::path destination;
    // Held weakly: once the owner drops it, increments are skipped
    std::weak_ptr<ByteCounter> counter;
    std::stop_token stop;
};

// Download one URL to request.destination.
//
// Fails with DownloadErrc::zero_content_length when the server declares an
// empty body, with DownloadErrc::file_allocation_failed (cause set) when the
// declared length can't be reserved, and with transport, HTTP status or disk
// errors otherwise. Throws std::overflow_error if the byte counter would wrap.
[[nodiscard]] std::expected<std::filesystem::path, Error>
transfer(const HttpSession& session, const TransferRequest& request);

// Add bytes to the counter if it is still alive
void report_bytes(const std::weak_ptr<ByteCounter>& counter, std::uint64_t bytes);

} // namespace booru::core

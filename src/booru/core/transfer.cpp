// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/transfer.hpp>
#include <booru/disk/file_writer.hpp>
#include <limits>
#include <optional>
#include <stdexcept>

namespace booru::core {

void report_bytes(const std::weak_ptr<ByteCounter>& counter, std::uint64_t bytes) {
    auto alive = counter.lock();
    if (!alive) {
        return;
    }

    auto previous = alive->fetch_add(bytes, std::memory_order_release);
    if (previous > std::numeric_limits<std::uint64_t>::max() - bytes) {
        throw std::overflow_error("byte counter overflow");
    }
}

std::expected<std::filesystem::path, Error>
transfer(const HttpSession& session, const TransferRequest& request) {
    disk::FileWriter file;
    std::optional<Error> failure;

    auto on_body = [&](const HttpResponse& head, std::span<const std::byte> chunk) -> std::error_code {
        if (!file.is_open()) {
            if (auto ec = file.open(request.destination)) {
                failure.emplace(ec);
                return ec;
            }
            if (head.content_length) {
                if (auto ec = file.pre_allocate(*head.content_length)) {
                    failure.emplace(make_error_code(DownloadErrc::file_allocation_failed), std::string{}, ec);
                    return ec;
                }
            }
        }

        if (auto ec = file.write(chunk.data(), chunk.size())) {
            failure.emplace(ec);
            return ec;
        }

        report_bytes(request.counter, chunk.size());
        return {};
    };

    auto response = session.stream(request.url, on_body, request.stop);
    if (failure) {
        return std::unexpected(std::move(*failure));
    }
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }

    if (response->content_length && *response->content_length == 0) {
        return std::unexpected(Error(make_error_code(DownloadErrc::zero_content_length)));
    }

    // Body of unknown length that turned out empty
    if (!file.is_open()) {
        if (auto ec = file.open(request.destination)) {
            return std::unexpected(Error(ec));
        }
    }

    if (auto ec = file.sync()) {
        return std::unexpected(Error(ec));
    }
    if (auto ec = file.close()) {
        return std::unexpected(Error(ec));
    }

    return request.destination;
}

} // namespace booru::core

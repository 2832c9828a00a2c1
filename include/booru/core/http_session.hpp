// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace booru::core {

// Final response head, available once the body starts
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lowercase names
    std::optional<std::uint64_t> content_length;  // Declared length, if any
    std::string content_type;

    [[nodiscard]] bool success() const noexcept { return status_code >= 200 && status_code < 300; }
};

struct HttpOptions {
    std::uint32_t timeout_sec{0};   // Whole-request timeout, 0 = none
    std::string user_agent{"booru-dl"};
};

// Receives each body chunk; a non-empty error aborts the transfer and is
// returned from stream(). Exceptions are rethrown from stream().
using BodyHandler = std::function<std::error_code(const HttpResponse& head,
                                                  std::span<const std::byte> chunk)>;

// Stateless libcurl client; safe to share between threads
class HttpSession {
public:
    explicit HttpSession(HttpOptions options = {});

    // GET url and hand the body to on_body chunk by chunk
    [[nodiscard]] std::expected<HttpResponse, Error>
    stream(const std::string& url, const BodyHandler& on_body, std::stop_token stop = {}) const;

    // GET url and buffer the whole body
    [[nodiscard]] std::expected<std::string, Error>
    fetch(const std::string& url, std::stop_token stop = {}) const;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Percent-encode a query component
    [[nodiscard]] static std::string escape(std::string_view value);

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

} // namespace booru::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace booru::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    connection_lost,
    too_many_redirects,
    http_status,            // Non-2xx final status
    zero_content_length,
    file_allocation_failed,
    write_failed,
    cancelled,
    invalid_argument,
    bad_response,           // Body could not be decoded
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "booru::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:                return "Success";
            case DownloadErrc::network_error:          return "Network error";
            case DownloadErrc::timeout:                return "Operation timed out";
            case DownloadErrc::refused:                return "Connection refused";
            case DownloadErrc::dns_error:              return "DNS resolution failed";
            case DownloadErrc::ssl_error:              return "SSL/TLS error";
            case DownloadErrc::connection_lost:        return "Connection lost";
            case DownloadErrc::too_many_redirects:     return "Too many redirects";
            case DownloadErrc::http_status:            return "HTTP status is not success";
            case DownloadErrc::zero_content_length:    return "There is no content to download";
            case DownloadErrc::file_allocation_failed: return "Failed to allocate file size";
            case DownloadErrc::write_failed:           return "Failed to write response body";
            case DownloadErrc::cancelled:              return "Download cancelled";
            case DownloadErrc::invalid_argument:       return "Invalid argument";
            case DownloadErrc::bad_response:           return "Malformed response";
            default:                                   return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Error with a context chain, rendered outermost first:
// "Failed to download: /dl/1.jpg: Failed to allocate file size: No space left on device"
class Error {
public:
    Error() = default;

    Error(std::error_code code, std::string detail = {}, std::error_code cause = {})
        : code_(code)
        , cause_(cause)
        , detail_(std::move(detail)) {}

    [[nodiscard]] const std::error_code& code() const noexcept { return code_; }
    [[nodiscard]] const std::error_code& cause() const noexcept { return cause_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
    [[nodiscard]] const std::vector<std::string>& context() const noexcept { return context_; }

    // Prepend a context line (outermost last added)
    Error& with_context(std::string ctx) & {
        context_.push_back(std::move(ctx));
        return *this;
    }

    Error&& with_context(std::string ctx) && {
        context_.push_back(std::move(ctx));
        return std::move(*this);
    }

    [[nodiscard]] std::string message() const;

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(code_); }

private:
    std::error_code code_;
    std::error_code cause_;
    std::string detail_;
    std::vector<std::string> context_;
};

} // namespace booru::core

namespace std {

template<>
struct is_error_code_enum<booru::core::DownloadErrc> : true_type {};

} // namespace std

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/http_session.hpp>
#include <booru/core/config.hpp>
#include <curl/curl.h>
#include <cctype>
#include <exception>
#include <string>
#include <utility>

namespace booru::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Per-request state shared with the callbacks
struct Transfer {
    CURL* curl{nullptr};
    const BodyHandler* on_body{nullptr};
    std::stop_token stop;
    HttpResponse head;
    bool head_ready{false};
    std::error_code handler_error;
    std::exception_ptr handler_exception;
};

void fill_head(Transfer& t) noexcept {
    long http_code = 0;
    curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &http_code);
    t.head.status_code = static_cast<std::int32_t>(http_code);

    curl_off_t cl = -1;
    if (curl_easy_getinfo(t.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
        t.head.content_length = static_cast<std::uint64_t>(cl);
    }

    char* ct = nullptr;
    if (curl_easy_getinfo(t.curl, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        t.head.content_type = ct;
    }
    t.head_ready = true;
}

// Header callback; a new status line (after a redirect) starts a fresh map
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* t = static_cast<Transfer*>(userdata);
    if (!t) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        t->head.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    t->head.headers[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* t = static_cast<Transfer*>(userdata);
    std::size_t bytes = size * nmemb;

    if (!t->head_ready) {
        fill_head(*t);
    }

    // Error bodies are never handed to the caller
    if (!t->head.success()) {
        t->handler_error = make_error_code(DownloadErrc::http_status);
        return 0;
    }

    try {
        auto ec = (*t->on_body)(t->head, std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(ptr), bytes));
        if (ec) {
            t->handler_error = ec;
            return 0;
        }
    } catch (...) {
        // Can't unwind through libcurl; rethrown once curl_easy_perform returns
        t->handler_exception = std::current_exception();
        return 0;
    }
    return bytes;
}

// libcurl progress callback - aborts the transfer once stop is requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* t = static_cast<Transfer*>(userdata);
    return t->stop.stop_requested() ? 1 : 0;
}

DownloadErrc map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:        return DownloadErrc::timeout;
        case CURLE_COULDNT_CONNECT:           return DownloadErrc::refused;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:     return DownloadErrc::dns_error;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:        return DownloadErrc::ssl_error;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:               return DownloadErrc::connection_lost;
        case CURLE_TOO_MANY_REDIRECTS:        return DownloadErrc::too_many_redirects;
        case CURLE_HTTP_RETURNED_ERROR:       return DownloadErrc::http_status;
        case CURLE_ABORTED_BY_CALLBACK:       return DownloadErrc::cancelled;
        case CURLE_WRITE_ERROR:               return DownloadErrc::write_failed;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:      return DownloadErrc::invalid_argument;
        default:                              return DownloadErrc::network_error;
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options)) {}

std::expected<HttpResponse, Error>
HttpSession::stream(const std::string& url, const BodyHandler& on_body, std::stop_token stop) const {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(Error(make_error_code(DownloadErrc::network_error), "curl_easy_init"));
    }

    Transfer t;
    t.curl = curl.ptr;
    t.on_body = &on_body;
    t.stop = std::move(stop);

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    if (options_.timeout_sec > 0) {
        curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_sec));
    }
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(TRANSFER_BUFFER_SIZE));

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &t);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &t);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (t.handler_exception) {
        std::rethrow_exception(t.handler_exception);
    }

    // Empty bodies never reach write_callback
    if (!t.head_ready) {
        fill_head(t);
    }

    if (t.handler_error) {
        if (t.handler_error == DownloadErrc::http_status) {
            return std::unexpected(Error(t.handler_error, std::to_string(t.head.status_code)));
        }
        return std::unexpected(Error(make_error_code(DownloadErrc::write_failed), {}, t.handler_error));
    }

    if (result != CURLE_OK) {
        auto errc = map_curl_error(result);
        std::string detail = errc == DownloadErrc::http_status
            ? std::to_string(t.head.status_code)
            : curl_easy_strerror(result);
        return std::unexpected(Error(make_error_code(errc), std::move(detail)));
    }

    if (!t.head.success()) {
        return std::unexpected(Error(make_error_code(DownloadErrc::http_status),
                                     std::to_string(t.head.status_code)));
    }

    return std::move(t.head);
}

std::expected<std::string, Error>
HttpSession::fetch(const std::string& url, std::stop_token stop) const {
    std::string body;
    auto append = [&body](const HttpResponse&, std::span<const std::byte> chunk) -> std::error_code {
        body.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
        return {};
    };

    auto response = stream(url, append, std::move(stop));
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    return body;
}

std::string HttpSession::escape(std::string_view value) {
    CurlHandle curl(curl_easy_init());
    char* escaped = curl_easy_escape(curl.ptr, value.data(), static_cast<int>(value.size()));
    if (!escaped) {
        return {};
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace booru::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <booru/core/error.hpp>
#include <booru/core/http_session.hpp>
#include <booru/core/post.hpp>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace booru::api {

// https://gelbooru.com/index.php?page=wiki&s=view&id=18780
constexpr std::string_view API_URL =
    "https://gelbooru.com/index.php?page=dapi&s=post&q=index&json=1";

constexpr std::uint64_t MAX_PAGE_LIMIT = 100;

// "@attributes" of a listing page
struct Attributes {
    std::uint64_t limit{0};   // Posts in this page, 0..=100
    std::uint64_t offset{0};  // Index of the first post
    std::uint64_t count{0};   // Total matches on the board
};

struct Page {
    Attributes attributes;
    std::vector<core::Post> posts;   // Empty when nothing matched or pid is past the end
};

// Decode one JSON listing page
[[nodiscard]] std::expected<Page, core::Error> parse_page(std::string_view body);

// One page of a tag query
class Getter {
public:
    // tags must be non-empty and limit in 1..=100
    [[nodiscard]] static std::expected<Getter, core::Error>
    build(const core::HttpSession& session,
          std::string tags,
          std::uint64_t limit,
          std::uint64_t pid,
          std::string api_url = std::string(API_URL));

    [[nodiscard]] std::string url() const;

    [[nodiscard]] std::expected<Page, core::Error> run(std::stop_token stop = {}) const;

private:
    Getter(const core::HttpSession& session, std::string tags,
           std::uint64_t limit, std::uint64_t pid, std::string api_url)
        : session_(&session), tags_(std::move(tags)), limit_(limit)
        , pid_(pid), api_url_(std::move(api_url)) {}

    const core::HttpSession* session_;
    std::string tags_;
    std::uint64_t limit_;
    std::uint64_t pid_;
    std::string api_url_;
};

// Pages through the listing until num_imgs posts (or every match) are collected
class BatchGetter {
public:
    // tags must be non-empty and num_imgs positive
    [[nodiscard]] static std::expected<BatchGetter, core::Error>
    build(const core::HttpSession& session,
          std::string tags,
          std::uint64_t num_imgs,
          std::string api_url = std::string(API_URL));

    // Empty when nothing matched
    [[nodiscard]] std::expected<std::vector<core::Post>, core::Error>
    run(std::stop_token stop = {}) const;

private:
    BatchGetter(const core::HttpSession& session, std::string tags,
                std::uint64_t num_imgs, std::string api_url)
        : session_(&session), tags_(std::move(tags))
        , num_imgs_(num_imgs), api_url_(std::move(api_url)) {}

    const core::HttpSession* session_;
    std::string tags_;
    std::uint64_t num_imgs_;
    std::string api_url_;
};

} // namespace booru::api

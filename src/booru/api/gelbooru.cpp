// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/api/gelbooru.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <format>
#include <utility>

namespace booru::api {

using core::DownloadErrc;
using core::Error;
using json = nlohmann::json;

namespace {

Error bad_response(std::string detail) {
    return Error(make_error_code(DownloadErrc::bad_response), std::move(detail));
}

Error invalid_argument(std::string detail) {
    return Error(make_error_code(DownloadErrc::invalid_argument), std::move(detail));
}

core::Post to_post(const json& j) {
    return core::Post::make(j.at("id").get<std::uint64_t>(),
                            j.at("md5").get<std::string>(),
                            j.at("file_url").get<std::string>(),
                            j.at("tags").get<std::string>(),
                            j.at("image").get<std::string>());
}

} // namespace

std::expected<Page, Error> parse_page(std::string_view body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected(bad_response("response is not a JSON object"));
    }

    Page page;
    try {
        const auto& attrs = doc.at("@attributes");
        page.attributes.limit = attrs.at("limit").get<std::uint64_t>();
        page.attributes.offset = attrs.at("offset").get<std::uint64_t>();
        page.attributes.count = attrs.at("count").get<std::uint64_t>();

        if (auto it = doc.find("post"); it != doc.end() && !it->is_null()) {
            if (!it->is_array()) {
                return std::unexpected(bad_response("\"post\" is not an array"));
            }
            page.posts.reserve(it->size());
            for (const auto& item : *it) {
                page.posts.push_back(to_post(item));
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(bad_response(e.what()));
    }
    return page;
}

//=============================================================================
// Getter
//=============================================================================

std::expected<Getter, Error>
Getter::build(const core::HttpSession& session, std::string tags,
              std::uint64_t limit, std::uint64_t pid, std::string api_url) {
    if (tags.empty()) {
        return std::unexpected(invalid_argument("Tags cannot be empty"));
    }
    if (limit < 1 || limit > MAX_PAGE_LIMIT) {
        return std::unexpected(invalid_argument("Limit can only be between 1 and 100"));
    }
    return Getter(session, std::move(tags), limit, pid, std::move(api_url));
}

std::string Getter::url() const {
    return std::format("{}&tags={}&limit={}&pid={}",
                       api_url_, core::HttpSession::escape(tags_), limit_, pid_);
}

std::expected<Page, Error> Getter::run(std::stop_token stop) const {
    const auto target = url();
    spdlog::debug("GET {}", target);

    auto body = session_->fetch(target, std::move(stop));
    if (!body) {
        return std::unexpected(std::move(body.error()).with_context(
            std::format("Failed to query page {}", pid_)));
    }
    auto page = parse_page(*body);
    if (!page) {
        return std::unexpected(std::move(page.error()).with_context(
            std::format("Failed to decode page {}", pid_)));
    }
    return page;
}

//=============================================================================
// BatchGetter
//=============================================================================

std::expected<BatchGetter, Error>
BatchGetter::build(const core::HttpSession& session, std::string tags,
                   std::uint64_t num_imgs, std::string api_url) {
    if (tags.empty()) {
        return std::unexpected(invalid_argument("Tags cannot be empty"));
    }
    if (num_imgs == 0) {
        return std::unexpected(invalid_argument("Number of images cannot be 0"));
    }
    return BatchGetter(session, std::move(tags), num_imgs, std::move(api_url));
}

std::expected<std::vector<core::Post>, Error> BatchGetter::run(std::stop_token stop) const {
    std::uint64_t pid = 0;

    auto fetch_page = [&](std::uint64_t page_id) {
        return Getter::build(*session_, tags_, MAX_PAGE_LIMIT, page_id, api_url_)
            .and_then([&](const Getter& getter) { return getter.run(stop); });
    };

    auto first = fetch_page(pid);
    if (!first) {
        return std::unexpected(std::move(first.error()));
    }

    std::vector<core::Post> posts = std::move(first->posts);
    if (posts.empty()) {
        return posts;
    }

    const auto total = static_cast<std::size_t>(std::min(num_imgs_, first->attributes.count));
    spdlog::debug("{} posts match \"{}\", taking {}", first->attributes.count, tags_, total);

    while (posts.size() < total) {
        if (stop.stop_requested()) {
            return std::unexpected(Error(make_error_code(DownloadErrc::cancelled)));
        }
        auto page = fetch_page(++pid);
        if (!page) {
            return std::unexpected(std::move(page.error()));
        }
        // The board reported more matches than it serves
        if (page->posts.empty()) {
            return std::unexpected(bad_response(
                std::format("page {} is empty after {} of {} posts", pid, posts.size(), total)));
        }
        std::move(page->posts.begin(), page->posts.end(), std::back_inserter(posts));
    }

    if (posts.size() > total) {
        posts.erase(posts.begin() + static_cast<std::ptrdiff_t>(total), posts.end());
    }
    return posts;
}

} // namespace booru::api

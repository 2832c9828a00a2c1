// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/post.hpp>
#include <booru/core/config.hpp>
#include <utility>

namespace booru::core {

Post Post::make(std::uint64_t id,
                std::string md5,
                std::string file_url,
                std::string tags,
                std::filesystem::path image) {
    Post post;
    post.id = id;
    post.md5 = std::move(md5);
    post.file_url = std::move(file_url);
    post.tags = std::move(tags);
    post.filename = destination_filename(id, image);
    post.image = std::move(image);
    return post;
}

std::filesystem::path destination_filename(std::uint64_t id,
                                           const std::filesystem::path& image) {
    // Keep only the final component so a hostile name can't escape the download dir
    std::filesystem::path name = std::to_string(id);
    auto ext = image.filename().extension();
    if (!ext.empty() && ext != ".") {
        name += ext;
    }
    return name;
}

std::filesystem::path tag_file_path(const std::filesystem::path& file_path) {
    auto path = file_path;
    path.replace_extension(TAG_FILE_EXTENSION);
    return path;
}

std::string format_tags(std::string_view tags) {
    std::string out;
    out.reserve(tags.size() + tags.size() / 4);
    for (char c : tags) {
        if (c == ' ') {
            out += ", ";
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace booru::core

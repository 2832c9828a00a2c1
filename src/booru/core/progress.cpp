// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/progress.hpp>
#include <format>

namespace booru::core {

std::string status_message(const DownloadStatus& status) {
    return std::format("[done:{}\texisted:{}\tfailed:{}]", status.done, status.existed, status.failed);
}

} // namespace booru::core

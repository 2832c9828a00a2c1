// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/config.hpp>
#include <algorithm>
#include <thread>

namespace booru::core {

std::uint32_t available_parallelism() noexcept {
    // hardware_concurrency() returns 0 when the value is not computable
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace booru::core

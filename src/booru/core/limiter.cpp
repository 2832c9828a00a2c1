// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/limiter.hpp>
#include <booru/core/config.hpp>
#include <algorithm>
#include <utility>

namespace booru::core {

//=============================================================================
// Permit
//=============================================================================

Permit::Permit(Permit&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)) {}

Permit& Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = std::exchange(other.owner_, nullptr);
    }
    return *this;
}

Permit::~Permit() {
    release();
}

void Permit::release() noexcept {
    if (auto* owner = std::exchange(owner_, nullptr)) {
        owner->give_back();
    }
}

//=============================================================================
// ConcurrencyLimiter
//=============================================================================

ConcurrencyLimiter::ConcurrencyLimiter(std::uint32_t capacity)
    : capacity_(std::max(1u, capacity))
    , slots_(static_cast<std::ptrdiff_t>(capacity_)) {}

std::optional<Permit> ConcurrencyLimiter::acquire(std::stop_token stop) {
    // counting_semaphore has no stop_token wait; poll so a stop is noticed promptly
    while (!stop.stop_requested()) {
        if (slots_.try_acquire_for(PERMIT_POLL_INTERVAL)) {
            return grant();
        }
    }
    return std::nullopt;
}

std::optional<Permit> ConcurrencyLimiter::try_acquire() {
    if (slots_.try_acquire()) {
        return grant();
    }
    return std::nullopt;
}

Permit ConcurrencyLimiter::grant() noexcept {
    auto now = in_use_.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto peak = peak_.load(std::memory_order_relaxed);
    while (now > peak && !peak_.compare_exchange_weak(peak, now, std::memory_order_acq_rel)) {
    }
    return Permit(this);
}

void ConcurrencyLimiter::give_back() noexcept {
    in_use_.fetch_sub(1, std::memory_order_acq_rel);
    slots_.release();
}

} // namespace booru::core

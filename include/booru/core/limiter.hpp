// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <semaphore>
#include <stop_token>

namespace booru::core {

class ConcurrencyLimiter;

// One unit of capacity; released exactly once, when destroyed
class Permit {
public:
    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;
    ~Permit();

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

private:
    friend class ConcurrencyLimiter;
    explicit Permit(ConcurrencyLimiter* owner) noexcept : owner_(owner) {}

    void release() noexcept;

    ConcurrencyLimiter* owner_{nullptr};
};

// Fixed-capacity permit pool bounding simultaneous item tasks
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(std::uint32_t capacity);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    // Block until a permit is free; nullopt once stop is requested
    [[nodiscard]] std::optional<Permit> acquire(std::stop_token stop = {});

    [[nodiscard]] std::optional<Permit> try_acquire();

    [[nodiscard]] std::uint32_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::uint32_t in_use() const noexcept { return in_use_.load(std::memory_order_acquire); }
    // Highest in_use() ever observed
    [[nodiscard]] std::uint32_t peak() const noexcept { return peak_.load(std::memory_order_acquire); }

private:
    friend class Permit;

    Permit grant() noexcept;
    void give_back() noexcept;

    std::uint32_t capacity_;
    std::counting_semaphore<> slots_;
    std::atomic<std::uint32_t> in_use_{0};
    std::atomic<std::uint32_t> peak_{0};
};

} // namespace booru::core

/**
 * @file SpinLock.hpp
 * @brief Test-and-set spin-lock for the per-row fields shared between the
 *        render thread and team-update callers.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef SBR_CONCURRENCY_SPINLOCK_HPP
    #define SBR_CONCURRENCY_SPINLOCK_HPP

#include <sbr/core/Platform.hpp>
#include <sbr/core/NonCopyable.hpp>

#include <atomic>

namespace sbr::concurrency {

/**
 * @class SpinLock
 * @brief Spin-lock with a CPU pause while the flag is held elsewhere.
 *
 * Critical sections guarded by it are a handful of field reads/writes,
 * so contention never lasts long enough to justify an OS mutex.  Satisfies
 * BasicLockable, so std::lock_guard works as well as SpinLockGuard.
 */
class SpinLock final : public core::NonMovable<SpinLock>
{
public:
    SpinLock() noexcept = default;

    void lock() noexcept
    {
        while (_flag.test_and_set(std::memory_order_acquire))
        {
            while (_flag.test(std::memory_order_relaxed))
            {
                SBR_CPU_PAUSE();
            }
        }
    }

    /**
     * @brief Attempts a single acquire without spinning.
     * @return @c true if the lock was acquired.
     */
    [[nodiscard]] bool tryLock() noexcept
    {
        return !_flag.test_and_set(std::memory_order_acquire);
    }

    void unlock() noexcept
    {
        _flag.clear(std::memory_order_release);
    }

private:
    std::atomic_flag _flag = ATOMIC_FLAG_INIT;
};

/**
 * @class SpinLockGuard
 * @brief RAII guard: acquires on construction, releases on destruction.
 */
class SpinLockGuard final : public core::NonMovable<SpinLockGuard>
{
public:
    explicit SpinLockGuard(SpinLock& lock) noexcept
        : _lock{lock}
    {
        _lock.lock();
    }

    ~SpinLockGuard() noexcept
    {
        _lock.unlock();
    }

private:
    SpinLock& _lock;
};

} // namespace sbr::concurrency

#endif // SBR_CONCURRENCY_SPINLOCK_HPP

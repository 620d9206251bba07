#pragma once

/**
 * Clock.hpp
 *
 * Time source and interruptible sleep used by the device flow polling loop.
 * Tests substitute a manual clock so polling runs without real delays.
 */

#include <atomic>
#include <chrono>
#include <thread>

namespace gas::core::auth {

/**
 * CancellationToken - operator interrupt flag
 *
 * cancel() only stores to a lock-free atomic and may be called from a signal handler.
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    void reset() { m_cancelled.store(false); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

/**
 * Clock - wall time plus a cancellable sleep
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;

    /**
     * Sleep for a duration unless cancelled
     * @param duration Time to wait
     * @param cancel Cancellation flag checked while waiting
     * @return false if the wait was cut short by cancellation
     */
    virtual bool sleepFor(std::chrono::seconds duration, const CancellationToken& cancel) = 0;
};

/**
 * SystemClock - real time, sleeping in short slices so an interrupt is seen promptly
 */
class SystemClock : public Clock {
public:
    static constexpr std::chrono::milliseconds SLICE{100};

    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    bool sleepFor(std::chrono::seconds duration, const CancellationToken& cancel) override {
        auto deadline = std::chrono::steady_clock::now() + duration;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel.isCancelled()) {
                return false;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(left < SLICE ? left : SLICE);
        }
        return !cancel.isCancelled();
    }
};

} // namespace gas::core::auth

#pragma once

#include <core/auth/Clock.hpp>

#include <vector>

namespace gas::test {

// Virtual time: sleepFor advances instantly and records each wait.
class ManualClock : public core::auth::Clock {
public:
    ManualClock() : m_now(std::chrono::system_clock::time_point(std::chrono::seconds(1700000000))) {}

    std::chrono::system_clock::time_point now() const override { return m_now; }

    bool sleepFor(std::chrono::seconds duration, const core::auth::CancellationToken& cancel) override {
        if (cancel.isCancelled()) return false;
        sleeps.push_back(duration);
        m_now += duration;
        if (cancelAfterSleeps > 0 && static_cast<int>(sleeps.size()) >= cancelAfterSleeps && cancelTarget) {
            cancelTarget->cancel();
        }
        return !cancel.isCancelled();
    }

    void advance(std::chrono::seconds duration) { m_now += duration; }

    std::vector<std::chrono::seconds> sleeps;

    // Raise cancelTarget once this many sleeps have happened
    int cancelAfterSleeps{0};
    core::auth::CancellationToken* cancelTarget{nullptr};

private:
    std::chrono::system_clock::time_point m_now;
};

} // namespace gas::test

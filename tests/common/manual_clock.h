#pragma once

#include <ragcore/cache/cache_clock.h>

#include <chrono>
#include <memory>
#include <mutex>

namespace ragcore::test {

// Shared, manually advanced time source for TTL and cool-down tests
class ManualClock {
public:
    ManualClock() : state_(std::make_shared<State>()) {}

    void advance(std::chrono::milliseconds by) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->offset += by;
    }

    cache::SteadyClockFn steady() const {
        auto state = state_;
        return [state] {
            std::lock_guard<std::mutex> lock(state->mutex);
            return cache::SteadyTime{} + std::chrono::hours(1) + state->offset;
        };
    }

    cache::WallClockFn wall() const {
        auto state = state_;
        return [state] {
            std::lock_guard<std::mutex> lock(state->mutex);
            return cache::WallTime{} + std::chrono::hours(24 * 365 * 50) + state->offset;
        };
    }

private:
    struct State {
        std::mutex mutex;
        std::chrono::milliseconds offset{0};
    };
    std::shared_ptr<State> state_;
};

} // namespace ragcore::test

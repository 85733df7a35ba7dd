#pragma once

#include <ragcore/cache/cache_clock.h>

#include <chrono>
#include <mutex>

namespace ragcore::cache {

enum class TierState { Up, Down };

enum class TierAdmission {
    Use,    ///< tier is healthy
    Skip,   ///< tier is cooling down after a failure
    Recheck ///< cool-down elapsed; the caller should check reachability first
};

inline const char* tierStateToString(TierState state) {
    return state == TierState::Up ? "up" : "down";
}

/**
 * @brief Tracks whether a cache tier may be used.
 *
 * A failed tier is skipped until the cool-down has elapsed. The first caller admitted after
 * that receives Recheck and the window restarts, so concurrent callers keep skipping while a
 * single recheck is in flight.
 */
class TierHealth {
public:
    TierHealth(std::chrono::milliseconds cooldown, SteadyClockFn clock)
        : cooldown_(cooldown), clock_(std::move(clock)) {}

    TierAdmission admit() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == TierState::Up) {
            return TierAdmission::Use;
        }
        auto now = clock_();
        if (now - downSince_ < cooldown_) {
            return TierAdmission::Skip;
        }
        downSince_ = now;
        return TierAdmission::Recheck;
    }

    void markUp() {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = TierState::Up;
    }

    /**
     * @return true when this call moved the tier from Up to Down
     */
    bool markDown() {
        std::lock_guard<std::mutex> lock(mutex_);
        bool transitioned = state_ == TierState::Up;
        state_ = TierState::Down;
        downSince_ = clock_();
        return transitioned;
    }

    TierState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

private:
    const std::chrono::milliseconds cooldown_;
    SteadyClockFn clock_;
    mutable std::mutex mutex_;
    TierState state_ = TierState::Up;
    SteadyTime downSince_{};
};

} // namespace ragcore::cache

#include <gtest/gtest.h>
#include <ragcore/cache/tier_health.h>

#include "../../common/manual_clock.h"

using namespace ragcore;
using namespace ragcore::cache;
using ragcore::test::ManualClock;
using namespace std::chrono_literals;

TEST(TierHealthTest, SkipsUntilCooldownThenRechecksOnce) {
    ManualClock clock;
    TierHealth health(30s, clock.steady());
    EXPECT_EQ(health.admit(), TierAdmission::Use);

    EXPECT_TRUE(health.markDown());
    EXPECT_FALSE(health.markDown());
    EXPECT_EQ(health.state(), TierState::Down);
    EXPECT_EQ(health.admit(), TierAdmission::Skip);

    clock.advance(29s);
    EXPECT_EQ(health.admit(), TierAdmission::Skip);
    clock.advance(2s);
    EXPECT_EQ(health.admit(), TierAdmission::Recheck);
    // Concurrent callers keep skipping while the recheck runs
    EXPECT_EQ(health.admit(), TierAdmission::Skip);

    health.markUp();
    EXPECT_EQ(health.admit(), TierAdmission::Use);
    EXPECT_STREQ(tierStateToString(health.state()), "up");
}

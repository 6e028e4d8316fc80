#include "block_timer.hpp"

#include "FakeClock.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace std::chrono_literals;

class BlockTimerTest : public ::testing::Test {
  protected:
    FakeClock clock;
    BlockTimer timer{clock.Fn()};
    std::string error;

    void StartRunning(std::chrono::seconds d = 1500s) {
        ASSERT_TRUE(timer.Start(d, error)) << error;
    }

    void EnterCooldown() {
        StartRunning(60s);
        clock.Advance(60s);
        ASSERT_EQ(timer.Tick(), BlockTimer::TRANSITION_BLOCK_FINISHED);
        ASSERT_EQ(timer.State(), COOLDOWN);
    }
};

TEST_F(BlockTimerTest, StartsIdleWithNothingRemaining) {
    const BlockStatus s = timer.Snapshot();
    EXPECT_EQ(s.state, IDLE);
    EXPECT_EQ(s.remaining, 0ms);
    EXPECT_EQ(s.block_duration, 0s);
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_NONE);
}

TEST_F(BlockTimerTest, StartFromIdleHasFullDurationRemaining) {
    for (auto d : {1s, 25s, 1500s, 7200s}) {
        BlockTimer t(clock.Fn());
        ASSERT_TRUE(t.Start(d, error));
        const BlockStatus s = t.Snapshot();
        EXPECT_EQ(s.state, RUNNING);
        EXPECT_EQ(s.remaining, d);
        EXPECT_EQ(s.block_duration, d);
    }
}

TEST_F(BlockTimerTest, RemainingFollowsTheClock) {
    StartRunning(1500s);
    clock.Advance(90s);
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_NONE);
    EXPECT_EQ(timer.Snapshot().remaining, 1410s);
    EXPECT_EQ(timer.Snapshot().elapsed, 90s);
}

TEST_F(BlockTimerTest, StartWithZeroDurationIsRejected) {
    EXPECT_FALSE(timer.Start(0s, error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(timer.State(), IDLE);
    EXPECT_EQ(timer.ConsumeFlash(), FLASH_WARN);
}

TEST_F(BlockTimerTest, StartWhileRunningIsRejectedAndStateKept) {
    StartRunning(1500s);
    clock.Advance(100s);

    EXPECT_FALSE(timer.Start(600s, error));
    EXPECT_EQ(error, "a block is already in progress");
    EXPECT_EQ(timer.State(), RUNNING);
    EXPECT_EQ(timer.Snapshot().block_duration, 1500s);
    EXPECT_EQ(timer.Snapshot().remaining, 1400s);
}

TEST_F(BlockTimerTest, StartWhilePausedIsRejectedAndStateKept) {
    StartRunning(1500s);
    ASSERT_TRUE(timer.TogglePause(error));

    EXPECT_FALSE(timer.Start(600s, error));
    EXPECT_EQ(timer.State(), PAUSED);
    EXPECT_EQ(timer.Snapshot().block_duration, 1500s);
}

TEST_F(BlockTimerTest, StartDuringCooldownIsRejectedWithErrorFlash) {
    EnterCooldown();

    EXPECT_FALSE(timer.Start(600s, error));
    EXPECT_EQ(error, "cannot start during cooldown");
    EXPECT_EQ(timer.State(), COOLDOWN);
    EXPECT_EQ(timer.ConsumeFlash(), FLASH_ERROR);
}

TEST_F(BlockTimerTest, PauseThenResumeExcludesPausedTime) {
    StartRunning(1500s);
    clock.Advance(100s);
    ASSERT_TRUE(timer.TogglePause(error));
    EXPECT_EQ(timer.State(), PAUSED);

    clock.Advance(600s);
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_NONE);
    EXPECT_EQ(timer.Snapshot().remaining, 1400s);

    ASSERT_TRUE(timer.TogglePause(error));
    EXPECT_EQ(timer.State(), RUNNING);
    EXPECT_EQ(timer.Snapshot().remaining, 1400s);

    clock.Advance(50s);
    EXPECT_EQ(timer.Snapshot().remaining, 1350s);
}

TEST_F(BlockTimerTest, RepeatedPausesAccumulate) {
    StartRunning(300s);
    for (int i = 0; i < 3; ++i) {
        clock.Advance(10s);
        ASSERT_TRUE(timer.TogglePause(error));
        clock.Advance(1000s);
        ASSERT_TRUE(timer.TogglePause(error));
    }
    EXPECT_EQ(timer.Snapshot().remaining, 270s);
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_NONE);
}

TEST_F(BlockTimerTest, PausedBlockNeverFinishes) {
    StartRunning(60s);
    ASSERT_TRUE(timer.TogglePause(error));
    clock.Advance(3600s);
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_NONE);
    EXPECT_EQ(timer.State(), PAUSED);
}

TEST_F(BlockTimerTest, PauseFromIdleIsRejected) {
    EXPECT_FALSE(timer.TogglePause(error));
    EXPECT_EQ(error, "no block to pause");
    EXPECT_EQ(timer.State(), IDLE);
}

TEST_F(BlockTimerTest, PauseDuringCooldownIsRejected) {
    EnterCooldown();
    EXPECT_FALSE(timer.TogglePause(error));
    EXPECT_EQ(timer.State(), COOLDOWN);
}

TEST_F(BlockTimerTest, CancelFromRunningOrPausedReturnsToIdle) {
    StartRunning(1500s);
    clock.Advance(10s);
    ASSERT_TRUE(timer.Cancel(error));
    EXPECT_EQ(timer.State(), IDLE);
    EXPECT_EQ(timer.Snapshot().block_duration, 0s);

    StartRunning(900s);
    ASSERT_TRUE(timer.TogglePause(error));
    ASSERT_TRUE(timer.Cancel(error));
    EXPECT_EQ(timer.State(), IDLE);
    EXPECT_EQ(timer.Snapshot().block_duration, 0s);
    EXPECT_EQ(timer.Snapshot().remaining, 0ms);
}

TEST_F(BlockTimerTest, CancelFromIdleOrCooldownIsRejected) {
    EXPECT_FALSE(timer.Cancel(error));
    EXPECT_EQ(timer.State(), IDLE);

    EnterCooldown();
    EXPECT_FALSE(timer.Cancel(error));
    EXPECT_EQ(error, "cooldown cannot be cancelled");
    EXPECT_EQ(timer.State(), COOLDOWN);
}

TEST_F(BlockTimerTest, FinishedBlockEntersFullCooldownOnNextTick) {
    StartRunning(120s);
    clock.Advance(119s);
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_NONE);
    EXPECT_EQ(timer.State(), RUNNING);

    clock.Advance(1s);
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_BLOCK_FINISHED);
    const BlockStatus s = timer.Snapshot();
    EXPECT_EQ(s.state, COOLDOWN);
    EXPECT_EQ(s.remaining, kCooldownDuration);
    EXPECT_EQ(s.duration, kCooldownDuration);

    // only reported once
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_NONE);
}

TEST_F(BlockTimerTest, LateTickStartsCooldownAtTickTime) {
    StartRunning(60s);
    clock.Advance(75s);
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_BLOCK_FINISHED);
    EXPECT_EQ(timer.Snapshot().remaining, kCooldownDuration);
}

TEST_F(BlockTimerTest, FullBlockAndCooldownScenario) {
    StartRunning(1500s);

    clock.Advance(1500s);
    timer.Tick();
    BlockStatus s = timer.Snapshot();
    EXPECT_EQ(s.state, COOLDOWN);
    EXPECT_EQ(s.remaining, 300s);

    clock.Advance(300s);
    EXPECT_EQ(timer.Tick(), BlockTimer::TRANSITION_COOLDOWN_FINISHED);
    s = timer.Snapshot();
    EXPECT_EQ(s.state, IDLE);
    EXPECT_EQ(s.remaining, 0ms);

    // a new block may start once the cooldown is over
    EXPECT_TRUE(timer.Start(1500s, error));
}

TEST_F(BlockTimerTest, SnapshotNeverReportsNegativeRemaining) {
    StartRunning(10s);
    clock.Advance(30s);
    const BlockStatus s = timer.Snapshot();
    EXPECT_EQ(s.state, RUNNING);
    EXPECT_EQ(s.remaining, 0ms);
    EXPECT_EQ(s.elapsed, 10s);
}

TEST_F(BlockTimerTest, WarnFlashShowsOnOddFramesOnly) {
    timer.SetFlashFrames(5, 7);
    ASSERT_FALSE(timer.Cancel(error));

    std::vector<FlashLevel> frames;
    for (int i = 0; i < 6; ++i) {
        frames.push_back(timer.ConsumeFlash());
    }
    EXPECT_EQ(frames, (std::vector<FlashLevel>{FLASH_WARN, FLASH_NONE, FLASH_WARN, FLASH_NONE,
                                               FLASH_WARN, FLASH_NONE}));
}

TEST_F(BlockTimerTest, ErrorFlashLastsLongerThanWarn) {
    timer.SetFlashFrames(5, 7);
    EnterCooldown();
    ASSERT_FALSE(timer.Start(60s, error));

    int shown = 0;
    for (int i = 0; i < 10; ++i) {
        if (timer.ConsumeFlash() == FLASH_ERROR) {
            ++shown;
        }
    }
    EXPECT_EQ(shown, 4);
}

TEST_F(BlockTimerTest, ErrorFlashOverridesWarn) {
    ASSERT_FALSE(timer.Cancel(error));
    EnterCooldown();
    ASSERT_FALSE(timer.Start(60s, error));
    EXPECT_EQ(timer.ConsumeFlash(), FLASH_ERROR);
}

TEST_F(BlockTimerTest, JournalRecordsTransitionsAndResetsOnStart) {
    StartRunning(60s);
    ASSERT_TRUE(timer.TogglePause(error));
    ASSERT_TRUE(timer.TogglePause(error));
    ASSERT_FALSE(timer.Start(60s, error));

    const std::string journal = timer.Journal();
    EXPECT_NE(journal.find("started block"), std::string::npos);
    EXPECT_NE(journal.find("paused block"), std::string::npos);
    EXPECT_NE(journal.find("unpaused block"), std::string::npos);
    EXPECT_NE(journal.find("rejected: a block is already in progress"), std::string::npos);

    ASSERT_TRUE(timer.Cancel(error));
    StartRunning(60s);
    EXPECT_EQ(timer.Journal().find("paused block"), std::string::npos);
}

TEST_F(BlockTimerTest, JournalKeepsOnlyTheNewestLines) {
    for (size_t i = 0; i < BlockTimer::kJournalLines * 3; ++i) {
        ASSERT_FALSE(timer.Cancel(error));
    }
    StartRunning(60s);
    ASSERT_FALSE(timer.Start(60s, error));
    for (size_t i = 0; i < BlockTimer::kJournalLines; ++i) {
        ASSERT_TRUE(timer.TogglePause(error));
    }

    const std::string journal = timer.Journal();
    EXPECT_EQ(static_cast<size_t>(std::count(journal.begin(), journal.end(), '\n')),
              BlockTimer::kJournalLines);
    // the start and the rejection have been pushed out by the pause toggles
    EXPECT_EQ(journal.find("started block"), std::string::npos);
    EXPECT_EQ(journal.find("rejected"), std::string::npos);
    EXPECT_NE(journal.find("paused block"), std::string::npos);
}

TEST_F(BlockTimerTest, RejectionsWhileIdleDoNotGrowJournal) {
    for (size_t i = 0; i < BlockTimer::kJournalLines * 4; ++i) {
        ASSERT_FALSE(timer.TogglePause(error));
    }
    const std::string journal = timer.Journal();
    EXPECT_EQ(static_cast<size_t>(std::count(journal.begin(), journal.end(), '\n')),
              BlockTimer::kJournalLines);
}

#include <gtest/gtest.h>

#include <atomic>

#include <SecmonAutoTimer.h>

#include "fakes.h"

using namespace secmon;

namespace {

struct Counts {
  std::atomic<int> on{0};
  std::atomic<int> off{0};
};

void count_on(void *ctx) { static_cast<Counts *>(ctx)->on++; }
void count_off(void *ctx) { static_cast<Counts *>(ctx)->off++; }

class AutoTimerTest : public ::testing::Test {
protected:
  AutoTimerTest() : timer(flags, config()) { timer.setActions(count_on, count_off, &counts); }

  static AutoTimerConfig config() {
    AutoTimerConfig c;
    c.timeoutTicks = 5;
    c.tickMs = 10;
    return c;
  }

  void ticks(int n) {
    for (int i = 0; i < n; i++) timer.tick();
  }

  ControlFlags flags;
  Counts counts;
  AutoTimer timer;
};

} // namespace

TEST_F(AutoTimerTest, OffAfterTimeoutOnce) {
  ticks(4);
  EXPECT_EQ(counts.off.load(), 0);
  ticks(1);
  EXPECT_EQ(counts.off.load(), 1);
  ticks(20);
  EXPECT_EQ(counts.off.load(), 1);
  EXPECT_EQ(timer.counter(), 5u);
}

TEST_F(AutoTimerTest, MotionResetsAndTurnsOn) {
  ticks(3);
  flags.motionTrigger = true;
  ticks(1);
  EXPECT_EQ(counts.on.load(), 1);
  EXPECT_FALSE(flags.motionTrigger.load());
  EXPECT_EQ(timer.counter(), 1u);

  ticks(3);
  EXPECT_EQ(counts.off.load(), 0);
  ticks(1);
  EXPECT_EQ(counts.off.load(), 1);

  // motion after the display went off starts a new idle period
  flags.motionTrigger = true;
  ticks(1);
  EXPECT_EQ(counts.on.load(), 2);
  ticks(4);
  EXPECT_EQ(counts.off.load(), 2);
}

TEST_F(AutoTimerTest, ManualModeIgnoresMotionAndTimeout) {
  flags.autoMode = false;
  flags.motionTrigger = true;
  ticks(20);
  EXPECT_EQ(counts.on.load(), 0);
  EXPECT_EQ(counts.off.load(), 0);
  EXPECT_FALSE(flags.motionTrigger.load());
}

TEST_F(AutoTimerTest, ResumingAutoTurnsOnOnce) {
  flags.autoMode = false;
  ticks(10);
  flags.autoMode = true;
  ticks(1);
  EXPECT_EQ(counts.on.load(), 1);
  EXPECT_EQ(timer.counter(), 1u);
  ticks(2);
  EXPECT_EQ(counts.on.load(), 1);
  ticks(2);
  EXPECT_EQ(counts.off.load(), 1);
}

TEST_F(AutoTimerTest, ThreadTicks) {
  ASSERT_TRUE(timer.start());
  EXPECT_FALSE(timer.start());
  EXPECT_TRUE(secmon_test::waitUntil([this] { return counts.off.load() == 1; }, 2000));
  timer.stop();
  const int off = counts.off.load();
  timer.stop();
  EXPECT_EQ(counts.off.load(), off);
}

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <SecmonSync.h>

using namespace secmon;

TEST(Event, WaitTimesOutWhenClear) {
  Event e;
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(e.waitFor(50));
  EXPECT_GE(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(45));
  EXPECT_FALSE(e.isSet());
}

TEST(Event, SetWakesWaiterAndStaysSetUntilCleared) {
  Event e;
  std::thread t([&e] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    e.set();
  });
  EXPECT_TRUE(e.waitFor(2000));
  t.join();
  EXPECT_TRUE(e.isSet());
  EXPECT_TRUE(e.waitFor(0));
  e.clear();
  EXPECT_FALSE(e.isSet());
}

TEST(Mailbox, DeliversInOrder) {
  Mailbox m;
  m.post(SlotMsg::Ready, 7);
  m.post(SlotMsg::Stop);
  EXPECT_EQ(m.pending(), 2u);

  SlotMessage msg;
  ASSERT_TRUE(m.waitFor(0, msg));
  EXPECT_EQ(msg.kind, SlotMsg::Ready);
  EXPECT_EQ(msg.launch, 7u);
  ASSERT_TRUE(m.waitFor(0, msg));
  EXPECT_EQ(msg.kind, SlotMsg::Stop);
  EXPECT_EQ(msg.launch, 0u);
  EXPECT_FALSE(m.waitFor(10, msg));
}

TEST(Mailbox, DrainDropsStaleMessages) {
  Mailbox m;
  m.post(SlotMsg::Ready);
  m.post(SlotMsg::Ready);
  EXPECT_EQ(m.drain(), 2u);
  EXPECT_EQ(m.pending(), 0u);
  SlotMessage msg;
  EXPECT_FALSE(m.waitFor(10, msg));
}

TEST(Mailbox, BoundedCapacity) {
  Mailbox m;
  for (size_t i = 0; i < Mailbox::kCapacity + 5; i++) m.post(SlotMsg::Ready, (uint32_t)i);
  EXPECT_EQ(m.pending(), Mailbox::kCapacity);
  SlotMessage msg;
  ASSERT_TRUE(m.waitFor(0, msg));
  EXPECT_EQ(msg.launch, 5u);
}

TEST(Mailbox, CrossThreadPost) {
  Mailbox m;
  std::thread t([&m] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    m.post(SlotMsg::Ready);
  });
  SlotMessage msg;
  EXPECT_TRUE(m.waitFor(2000, msg));
  EXPECT_EQ(msg.kind, SlotMsg::Ready);
  t.join();
}

TEST(ControlFlags, Defaults) {
  ControlFlags f;
  EXPECT_TRUE(f.autoMode.load());
  EXPECT_FALSE(f.motionTrigger.load());
  EXPECT_FALSE(f.displayPowerOff.load());
  EXPECT_FALSE(f.restartRequested.load());
}

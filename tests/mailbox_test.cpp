#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include "mailbox.hpp"

using namespace MS;

TEST(Mailbox, FifoOrder) {
  Mailbox mb(8);
  mb.post(Outbound::message("one"));
  mb.post(Outbound::message("two"));
  mb.post(Outbound::closedByHost());
  EXPECT_EQ(mb.size(), 3u);
  EXPECT_EQ(mb.tryTake()->text, "one");
  EXPECT_EQ(mb.tryTake()->text, "two");
  EXPECT_EQ(mb.tryTake()->kind, Outbound::Kind::ClosedByHost);
  EXPECT_FALSE(mb.tryTake().has_value());
}

TEST(Mailbox, ZeroCapacityRejected) {
  EXPECT_THROW(Mailbox(0), std::invalid_argument);
}

TEST(Mailbox, OverflowDropsBacklogAndCloses) {
  Mailbox mb(2);
  mb.post(Outbound::message("a"));
  mb.post(Outbound::message("b"));
  EXPECT_FALSE(mb.overflowed());
  mb.post(Outbound::message("c"));
  EXPECT_TRUE(mb.overflowed());
  EXPECT_TRUE(mb.closed());
  EXPECT_EQ(mb.size(), 0u);
  EXPECT_FALSE(mb.take().has_value());
}

TEST(Mailbox, PostAfterCloseIsDiscarded) {
  Mailbox mb(4);
  mb.close();
  mb.post(Outbound::message("late"));
  EXPECT_EQ(mb.size(), 0u);
  EXPECT_FALSE(mb.overflowed());
}

TEST(Mailbox, CloseLetsConsumerDrainFirst) {
  Mailbox mb(4);
  mb.post(Outbound::message("bye"));
  mb.close();
  auto m = mb.take();
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->text, "bye");
  EXPECT_FALSE(mb.take().has_value());
}

TEST(Mailbox, TakeBlocksUntilPost) {
  Mailbox mb(4);
  std::atomic<bool> got{false};
  std::thread consumer([&]{
    auto m = mb.take();
    got = m.has_value() && m->text == "wake";
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_FALSE(got.load());
  mb.post(Outbound::message("wake"));
  consumer.join();
  EXPECT_TRUE(got.load());
}

TEST(Mailbox, ProducersKeepTheirOwnOrder) {
  constexpr int kProducers = 4;
  constexpr int kEach = 200;
  Mailbox mb(kProducers * kEach);

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&mb, p]{
      for (int i = 0; i < kEach; ++i) mb.post(Outbound::chat(std::to_string(p), std::to_string(i)));
    });
  }
  for (auto& t : producers) t.join();

  std::vector<int> last(kProducers, -1);
  int total = 0;
  while (auto m = mb.tryTake()) {
    const int p = std::stoi(m->from);
    const int i = std::stoi(m->text);
    EXPECT_EQ(i, last[p] + 1) << "producer " << p;
    last[p] = i;
    ++total;
  }
  EXPECT_EQ(total, kProducers * kEach);
}

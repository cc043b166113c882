#include <chrono> // std::chrono::milliseconds
#include <thread> // std::thread

#include <Nimbus/Utils/Channel.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace nimbus::utils::types;
using nimbus::utils::sync::Channel;

class ChannelTest : public testing::Test {
 protected:
  Channel<Pair<usize, usize>> m_channel;
};

TEST_F(ChannelTest, PopReturnsItemsInPushOrder) {
  m_channel.push({ 0, 1 });
  m_channel.push({ 0, 2 });
  m_channel.push({ 0, 3 });

  EXPECT_EQ(m_channel.pop().second, 1);
  EXPECT_EQ(m_channel.pop().second, 2);
  EXPECT_EQ(m_channel.pop().second, 3);
  EXPECT_EQ(m_channel.size(), 0);
}

TEST_F(ChannelTest, PopForTimesOutWhenEmpty) {
  EXPECT_FALSE(m_channel.popFor(std::chrono::milliseconds(10)).has_value());
}

TEST_F(ChannelTest, PopBlocksUntilAnotherThreadPushes) {
  std::thread producer([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    m_channel.push({ 7, 42 });
  });

  const Pair<usize, usize> item = m_channel.pop();

  producer.join();

  EXPECT_EQ(item.first, 7);
  EXPECT_EQ(item.second, 42);
}

TEST_F(ChannelTest, ConcurrentProducersLoseNothingAndKeepPerProducerOrder) {
  constexpr usize PRODUCERS    = 8;
  constexpr usize PER_PRODUCER = 1000;

  Vec<std::thread> producers;

  for (usize producer = 0; producer < PRODUCERS; ++producer)
    producers.emplace_back([this, producer] {
      for (usize seq = 0; seq < PER_PRODUCER; ++seq)
        m_channel.push({ producer, seq });
    });

  Vec<usize> nextExpected(PRODUCERS, 0);

  for (usize received = 0; received < PRODUCERS * PER_PRODUCER; ++received) {
    const auto [producer, seq] = m_channel.pop();

    ASSERT_LT(producer, PRODUCERS);
    EXPECT_EQ(seq, nextExpected[producer]);
    nextExpected[producer] = seq + 1;
  }

  for (std::thread& producer : producers)
    producer.join();

  for (const usize count : nextExpected)
    EXPECT_EQ(count, PER_PRODUCER);

  EXPECT_EQ(m_channel.size(), 0);
}

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "session/watchdog.hpp"

using namespace coderun;
using namespace std::chrono_literals;

namespace {

using Clock = std::chrono::steady_clock;

IdleWatchdog<int>::TimeoutFn fixed(std::chrono::milliseconds timeout) {
  return [timeout] {
    return timeout;
  };
}

}  // namespace

TEST(WatchdogTest, FiresAfterIdleDeadline) {
  Channel<int> channel;
  IdleWatchdog<int> watchdog(channel, fixed(50ms), AbortSignal::create());

  auto start = Clock::now();
  try {
    watchdog.next();
    FAIL() << "expected an idle timeout";
  } catch (const StreamIdleTimeoutError &e) {
    EXPECT_EQ(e.timeout(), 50ms);
  }
  auto elapsed = Clock::now() - start;
  EXPECT_GE(elapsed, 50ms);
  EXPECT_LT(elapsed, 1s);
}

TEST(WatchdogTest, EachEventResetsTheDeadline) {
  Channel<int> channel;
  IdleWatchdog<int> watchdog(channel, fixed(80ms), AbortSignal::create());

  // Events every 40ms keep the stream alive well past one timeout
  std::thread producer([&channel] {
    for (int i = 0; i < 5; ++i) {
      std::this_thread::sleep_for(40ms);
      channel.push(i);
    }
    channel.close();
  });

  int received = 0;
  while (true) {
    auto next = watchdog.next();
    if (next.status == WatchStatus::Done) break;
    ASSERT_EQ(next.status, WatchStatus::Event);
    EXPECT_EQ(*next.value, received++);
  }
  producer.join();
  EXPECT_EQ(received, 5);
}

TEST(WatchdogTest, QueuedEventsDrainBeforeDone) {
  Channel<int> channel;
  channel.push(1);
  channel.push(2);
  channel.close();
  IdleWatchdog<int> watchdog(channel, fixed(10ms), AbortSignal::create());

  EXPECT_EQ(watchdog.next().status, WatchStatus::Event);
  EXPECT_EQ(watchdog.next().status, WatchStatus::Event);
  EXPECT_EQ(watchdog.next().status, WatchStatus::Done);
}

TEST(WatchdogTest, ZeroTimeoutDisablesDeadline) {
  Channel<int> channel;
  IdleWatchdog<int> watchdog(channel, fixed(0ms), AbortSignal::create());

  std::thread producer([&channel] {
    std::this_thread::sleep_for(60ms);
    channel.push(7);
  });

  auto next = watchdog.next();
  producer.join();
  ASSERT_EQ(next.status, WatchStatus::Event);
  EXPECT_EQ(*next.value, 7);
  EXPECT_FALSE(watchdog.deadline().has_value());
}

TEST(WatchdogTest, TimeoutIsReadAgainAfterEveryEvent) {
  Channel<int> channel;
  std::atomic<bool> pending{false};
  IdleWatchdog<int> watchdog(
      channel,
      [&pending] {
        return pending ? 300ms : 40ms;
      },
      AbortSignal::create());

  channel.push(1);
  ASSERT_EQ(watchdog.next().status, WatchStatus::Event);

  // The element switched the watchdog to the longer deadline
  pending = true;
  std::thread producer([&channel] {
    std::this_thread::sleep_for(120ms);
    channel.push(2);
  });

  auto next = watchdog.next();
  producer.join();
  EXPECT_EQ(next.status, WatchStatus::Event);
  EXPECT_EQ(watchdog.current_timeout(), 300ms);
}

TEST(WatchdogTest, WakeTimeReturnsTickWithoutMovingDeadline) {
  Channel<int> channel;
  IdleWatchdog<int> watchdog(channel, fixed(200ms), AbortSignal::create());

  auto next = watchdog.next(Clock::now() + 20ms);
  EXPECT_EQ(next.status, WatchStatus::Tick);
  auto deadline = watchdog.deadline();
  ASSERT_TRUE(deadline.has_value());

  EXPECT_EQ(watchdog.next(Clock::now() + 20ms).status, WatchStatus::Tick);
  EXPECT_EQ(watchdog.deadline(), deadline);
  EXPECT_THROW(watchdog.next(), StreamIdleTimeoutError);
}

TEST(WatchdogTest, AbortTakesPrecedence) {
  Channel<int> channel;
  auto abort = AbortSignal::create();
  IdleWatchdog<int> watchdog(channel, fixed(5s), abort);

  std::thread aborter([abort] {
    std::this_thread::sleep_for(20ms);
    abort->abort();
  });

  auto start = Clock::now();
  EXPECT_THROW(watchdog.next(), AbortError);
  EXPECT_LT(Clock::now() - start, 1s);
  aborter.join();

  // Already aborted: no wait, even with an element queued
  channel.push(1);
  EXPECT_THROW(watchdog.next(), AbortError);
}

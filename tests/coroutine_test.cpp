#include "caprouter/core/coroutine.hpp"
#include "caprouter/io/context.hpp"
#include "caprouter/util/async_event.hpp"
#include "caprouter/util/time.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <chrono>
#include <memory>
#include <vector>

using namespace caprouter;
using namespace std::chrono_literals;
using caprouter::test::run_coro;

namespace {

auto wait_and_record(util::AsyncEvent *event, std::vector<int> *order, int id)
    -> spawn_task {
  co_await event->wait();
  order->push_back(id);
}

auto read_shared(std::shared_ptr<util::SharedResult<int>> shared, int *sum)
    -> spawn_task {
  *sum += co_await shared->get();
}

} // namespace

struct CoroutineTest : ::testing::Test {
  io::IoContext io;
};

TEST_F(CoroutineTest, RunCoroReturnsValue) {
  auto coro = []() -> task<int> { co_return 42; };
  EXPECT_EQ(run_coro(io, coro()), 42);
}

TEST_F(CoroutineTest, RunCoroPropagatesExceptions) {
  auto coro = []() -> task<int> {
    throw std::runtime_error("boom");
    co_return 0;
  };
  EXPECT_THROW((void)run_coro(io, coro()), std::runtime_error);
}

TEST_F(CoroutineTest, SleepSuspendsForDuration) {
  const auto start = Clock::now();
  run_coro(io, io::async_sleep(20ms));
  EXPECT_GE(Clock::now() - start, 20ms);
}

TEST_F(CoroutineTest, EventWakesAllWaiters) {
  util::AsyncEvent event(io.get_executor());
  std::vector<int> order;
  for (int i = 0; i < 3; ++i) {
    boost::asio::co_spawn(io, wait_and_record(&event, &order, i),
                          boost::asio::detached);
  }
  io.poll();
  EXPECT_TRUE(order.empty());
  EXPECT_FALSE(event.is_set());

  event.set();
  event.set();
  io.restart();
  io.run_for(1s);
  EXPECT_EQ(order.size(), 3u);
  EXPECT_TRUE(event.is_set());
}

TEST_F(CoroutineTest, WaitOnSetEventReturnsImmediately) {
  util::AsyncEvent event(io.get_executor());
  event.set();
  std::vector<int> order;
  boost::asio::co_spawn(io, wait_and_record(&event, &order, 7),
                        boost::asio::detached);
  io.poll();
  EXPECT_EQ(order, std::vector<int>{7});
}

TEST_F(CoroutineTest, SharedResultKeepsFirstValue) {
  auto shared = std::make_shared<util::SharedResult<int>>(io.get_executor());
  int sum = 0;
  boost::asio::co_spawn(io, read_shared(shared, &sum), boost::asio::detached);
  boost::asio::co_spawn(io, read_shared(shared, &sum), boost::asio::detached);
  io.poll();
  EXPECT_FALSE(shared->ready());

  shared->publish(5);
  shared->publish(100);
  io.restart();
  io.run_for(1s);
  EXPECT_TRUE(shared->ready());
  EXPECT_EQ(sum, 10);

  // Late readers see the published value too.
  EXPECT_EQ(run_coro(io, shared->get()), 5);
}

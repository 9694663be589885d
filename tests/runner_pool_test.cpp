#include "ciforge/scheduler/runner_pool.hpp"

#include "test_utils.hpp"

#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>

#include <optional>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace ciforge;
using namespace std::chrono_literals;

class RunnerPoolTest : public ::testing::Test {
protected:
  auto make_pool(int count, std::filesystem::path root = {})
      -> std::unique_ptr<RunnerPool> {
    return std::make_unique<RunnerPool>(
        io_.get_executor(),
        RunnerPoolOptions{.runner_count = count,
                          .workspace_root = std::move(root)});
  }

  boost::asio::io_context io_;
};

TEST_F(RunnerPoolTest, AcquireAndReleaseImmediately) {
  auto pool = make_pool(2);
  EXPECT_EQ(pool->capacity(), 2u);
  EXPECT_EQ(pool->available(), 2u);
  {
    auto lease = test::run_coro(io_, pool->acquire({}, 1s));
    ASSERT_TRUE(lease.has_value());
    EXPECT_TRUE(lease->valid());
    EXPECT_EQ(lease->id(), RunnerId{"runner-0"});
    EXPECT_TRUE(lease->workspace().empty());
    EXPECT_EQ(pool->available(), 1u);
  }
  EXPECT_EQ(pool->available(), 2u);
}

TEST_F(RunnerPoolTest, WorkspacesCreatedUnderRoot) {
  test::TempDir dir;
  auto pool = make_pool(2, dir.path());
  EXPECT_TRUE(std::filesystem::is_directory(dir.path() / "runner-0"));
  EXPECT_TRUE(std::filesystem::is_directory(dir.path() / "runner-1"));
  auto lease = test::run_coro(io_, pool->acquire({}, 1s));
  ASSERT_TRUE(lease.has_value());
  EXPECT_EQ(lease->workspace(), dir.path() / "runner-0");
}

TEST_F(RunnerPoolTest, LeaseMoveTransfersOwnership) {
  auto pool = make_pool(1);
  auto lease = test::run_coro(io_, pool->acquire({}, 1s));
  ASSERT_TRUE(lease.has_value());
  RunnerLease moved = std::move(*lease);
  EXPECT_FALSE(lease->valid());
  EXPECT_TRUE(moved.valid());
  EXPECT_EQ(pool->available(), 0u);
  moved.release();
  EXPECT_FALSE(moved.valid());
  EXPECT_EQ(pool->available(), 1u);
}

TEST_F(RunnerPoolTest, AcquireTimesOutWhenExhausted) {
  auto pool = make_pool(1);
  auto held = test::run_coro(io_, pool->acquire({}, 1s));
  ASSERT_TRUE(held.has_value());

  auto second = test::run_coro(io_, pool->acquire({}, 50ms));
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), make_error_code(Error::Timeout));
  EXPECT_EQ(pool->waiting(), 0u);
}

TEST_F(RunnerPoolTest, WaitersServedInFifoOrder) {
  auto pool = make_pool(1);
  auto held = std::make_unique<RunnerLease>();
  *held = *test::run_coro(io_, pool->acquire({}, 1s));

  std::vector<int> order;
  std::vector<RunnerLease> leases;
  auto waiter = [&](int n) -> task<void> {
    auto lease = co_await pool->acquire({}, 5s);
    if (lease) {
      order.push_back(n);
      leases.push_back(std::move(*lease));
      // Hand the runner straight to the next waiter.
      leases.back().release();
    }
  };
  for (int i = 0; i < 3; ++i) {
    boost::asio::co_spawn(io_, waiter(i), boost::asio::detached);
  }
  io_.restart();
  io_.poll();
  EXPECT_EQ(pool->waiting(), 3u);

  held.reset();
  io_.restart();
  io_.run_for(1s);
  EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
  EXPECT_EQ(pool->available(), 1u);
}

TEST_F(RunnerPoolTest, CancelledWaiterGivesUpAndIsSkipped) {
  auto pool = make_pool(1);
  auto held = test::run_coro(io_, pool->acquire({}, 1s));
  ASSERT_TRUE(held.has_value());

  CancellationSource source;
  std::optional<Result<RunnerLease>> cancelled_result;
  boost::asio::co_spawn(
      io_,
      [&]() -> task<void> {
        cancelled_result = co_await pool->acquire(source.token(), 5s);
      },
      boost::asio::detached);
  io_.restart();
  io_.poll();
  EXPECT_EQ(pool->waiting(), 1u);

  source.cancel();
  io_.restart();
  io_.poll();
  ASSERT_TRUE(cancelled_result.has_value());
  ASSERT_FALSE(cancelled_result->has_value());
  EXPECT_EQ(cancelled_result->error(), make_error_code(Error::Cancelled));

  held->release();
  EXPECT_EQ(pool->available(), 1u);
}

TEST_F(RunnerPoolTest, AlreadyCancelledTokenFailsFast) {
  auto pool = make_pool(1);
  CancellationSource source;
  source.cancel();
  auto lease = test::run_coro(io_, pool->acquire(source.token(), 1s));
  ASSERT_FALSE(lease.has_value());
  EXPECT_EQ(lease.error(), make_error_code(Error::Cancelled));
  EXPECT_EQ(pool->available(), 1u);
}

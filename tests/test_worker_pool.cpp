#include <gtest/gtest.h>

#include "worker_pool.hpp"

#include <atomic>
#include <stdexcept>

namespace {

TEST(WorkerPoolTest, StopRunsQueuedTasks) {
  std::atomic<int> done{0};
  bridge::WorkerPool pool("test", 2);
  for (int i = 0; i < 50; i++) {
    ASSERT_TRUE(pool.Post([&done] { done++; }));
  }
  pool.Stop();
  EXPECT_EQ(done.load(), 50);
  EXPECT_EQ(pool.Pending(), 0u);
}

TEST(WorkerPoolTest, PostAfterStopIsRejected) {
  bridge::WorkerPool pool("test", 1);
  pool.Stop();
  EXPECT_FALSE(pool.Post([] {}));
  pool.Stop();
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillWorker) {
  std::atomic<int> done{0};
  bridge::WorkerPool pool("test", 1);
  ASSERT_TRUE(pool.Post([] { throw std::runtime_error("task failure"); }));
  ASSERT_TRUE(pool.Post([&done] { done++; }));
  pool.Stop();
  EXPECT_EQ(done.load(), 1);
}

}  // namespace

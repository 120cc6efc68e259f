/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "cloudfn/error_code.hpp"
#include "cloudfn/test_common.hpp"
#include "cloudfn/thread/bounded_thread_pool_impl.hpp"
#include "cloudfn/thread/rendezvous_impl.hpp"
#include "cloudfn/thread/stoppable_thread_impl.hpp"

namespace cloudfn {
namespace thread {
DEFINE_TEST_CASE_PACKAGE(BoundedThreadPoolTest, cloudfn.thread);

TEST(BoundedThreadPoolTest, RunAll) {
  BoundedThreadPool pool("test_pool", 4);
  std::atomic<int> sum(0);
  std::vector< std::shared_ptr<PoolJob> > jobs;
  for (int i = 1; i <= 100; ++i) {
    std::shared_ptr<PoolJob> job = pool.submit([&sum, i]() {
      sum += i;
      return kRetOk;
    });
    ASSERT_TRUE(job != nullptr);
    jobs.push_back(job);
  }
  for (const std::shared_ptr<PoolJob>& job : jobs) {
    COERCE_ERROR(job->get_result());
    EXPECT_TRUE(job->is_done());
  }
  EXPECT_EQ(5050, sum.load());
  EXPECT_EQ(100U, pool.get_submitted_count());
  EXPECT_EQ(100U, pool.get_completed_count());
}

TEST(BoundedThreadPoolTest, Bounded) {
  const uint32_t kThreads = 2;
  BoundedThreadPool pool("test_bounded", kThreads);
  std::atomic<uint32_t> running(0);
  std::atomic<uint32_t> max_running(0);
  std::vector< std::shared_ptr<PoolJob> > jobs;
  for (int i = 0; i < 8; ++i) {
    jobs.push_back(pool.submit([&running, &max_running]() {
      uint32_t now = ++running;
      uint32_t observed = max_running.load();
      while (now > observed && !max_running.compare_exchange_weak(observed, now)) {
      }
      sleep_ms(20);
      --running;
      return kRetOk;
    }));
  }
  for (const std::shared_ptr<PoolJob>& job : jobs) {
    COERCE_ERROR(job->get_result());
  }
  EXPECT_LE(max_running.load(), kThreads);
  EXPECT_GE(max_running.load(), 1U);
}

TEST(BoundedThreadPoolTest, ErrorResult) {
  BoundedThreadPool pool("test_error", 1);
  std::shared_ptr<PoolJob> job = pool.submit([]() {
    return ERROR_STACK_MSG(kErrorCodeFunctionExecutionFailed, "boom");
  });
  ErrorStack result = job->get_result();
  EXPECT_TRUE(result.is_error());
  EXPECT_EQ(kErrorCodeFunctionExecutionFailed, result.get_error_code());
  EXPECT_EQ(std::string("boom"), result.describe_brief());
}

TEST(BoundedThreadPoolTest, StopAbandonsQueued) {
  BoundedThreadPool pool("test_stop", 1);
  Rendezvous release;
  std::shared_ptr<PoolJob> blocking = pool.submit([&release]() {
    release.wait();
    return kRetOk;
  });
  EXPECT_TRUE(wait_until([&pool]() { return pool.get_queued_count() == 0; }, 5000));
  std::shared_ptr<PoolJob> queued = pool.submit([]() { return kRetOk; });
  ASSERT_TRUE(queued != nullptr);

  std::thread releaser([&release]() {
    sleep_ms(50);
    release.signal();
  });
  pool.stop();
  releaser.join();
  EXPECT_TRUE(pool.is_stopped());
  COERCE_ERROR(blocking->get_result());
  ErrorStack abandoned = queued->get_result();
  EXPECT_EQ(kErrorCodeWorkerPoolStopped, abandoned.get_error_code());
  EXPECT_TRUE(pool.submit([]() { return kRetOk; }) == nullptr);
}

TEST(BoundedThreadPoolTest, StoppableThread) {
  std::atomic<int> ticks(0);
  StoppableThread thread;
  thread.launch("ticker", std::chrono::microseconds(1000), [&ticks](StoppableThread* me) {
    while (!me->sleep()) {
      ++ticks;
    }
  });
  EXPECT_TRUE(wait_until([&ticks]() { return ticks.load() >= 3; }, 5000));
  thread.stop();
  EXPECT_TRUE(thread.is_stopped());
  int after_stop = ticks.load();
  sleep_ms(10);
  EXPECT_EQ(after_stop, ticks.load());
}

}  // namespace thread
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(BoundedThreadPoolTest, cloudfn.thread);

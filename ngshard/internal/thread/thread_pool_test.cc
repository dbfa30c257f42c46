// Copyright 2024 The NgShard Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "ngshard/internal/thread/thread_pool.h"

#include <atomic>
#include <memory>

#include <gtest/gtest.h>
#include "absl/synchronization/notification.h"

namespace {

using ::ngshard::internal::ThreadPool;

TEST(ThreadPoolTest, RunsAllTasks) {
  std::atomic<int> count{0};
  ThreadPool pool(4);
  EXPECT_EQ(4, pool.num_threads());
  for (int i = 0; i < 100; ++i) {
    pool.Schedule([&count] { ++count; });
  }
  pool.WaitIdle();
  EXPECT_EQ(100, count.load());
}

TEST(ThreadPoolTest, AcceptsMoveOnlyTasks) {
  ThreadPool pool(1);
  auto value = std::make_unique<int>(5);
  int result = 0;
  pool.Schedule([value = std::move(value), &result] { result = *value; });
  pool.WaitIdle();
  EXPECT_EQ(5, result);
}

TEST(ThreadPoolTest, DestructorDrainsQueue) {
  std::atomic<int> count{0};
  absl::Notification release;
  {
    ThreadPool pool(2);
    pool.Schedule([&] { release.WaitForNotification(); });
    for (int i = 0; i < 10; ++i) {
      pool.Schedule([&count] { ++count; });
    }
    release.Notify();
  }
  EXPECT_EQ(10, count.load());
}

TEST(ThreadPoolTest, WaitIdleOnEmptyPool) {
  ThreadPool pool(0);
  EXPECT_GT(pool.num_threads(), 0);
  pool.WaitIdle();
}

}  // namespace

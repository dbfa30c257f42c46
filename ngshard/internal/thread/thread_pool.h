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

#ifndef NGSHARD_INTERNAL_THREAD_THREAD_POOL_H_
#define NGSHARD_INTERNAL_THREAD_THREAD_POOL_H_

#include <stddef.h>

#include <deque>
#include <thread>  // NOLINT
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"

namespace ngshard {
namespace internal {

/// Fixed-size pool of worker threads executing tasks in FIFO order.
///
/// The destructor drains queued tasks before joining the workers.
class ThreadPool {
 public:
  using Task = absl::AnyInvocable<void() &&>;

  /// Starts `num_threads` workers.  A value of 0 selects
  /// `std::thread::hardware_concurrency()`.
  explicit ThreadPool(size_t num_threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void Schedule(Task task) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Blocks until every scheduled task has finished running.
  void WaitIdle() ABSL_LOCKS_EXCLUDED(mutex_);

  size_t num_threads() const { return workers_.size(); }

 private:
  void WorkerLoop();

  absl::Mutex mutex_;
  std::deque<Task> queue_ ABSL_GUARDED_BY(mutex_);
  size_t active_ ABSL_GUARDED_BY(mutex_) = 0;
  bool stopping_ ABSL_GUARDED_BY(mutex_) = false;
  std::vector<std::thread> workers_;
};

}  // namespace internal
}  // namespace ngshard

#endif  // NGSHARD_INTERNAL_THREAD_THREAD_POOL_H_

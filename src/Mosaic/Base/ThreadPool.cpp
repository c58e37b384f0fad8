//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <fmt/format.h>

#include <Mosaic/Base/Logging.h>
#include <Mosaic/Base/ThreadPool.h>

namespace mosaic {

ThreadPool::ThreadPool(const unsigned thread_count, const std::string_view name)
{
  const auto count = std::max(thread_count, 1U);
  workers_.reserve(count);
  for (unsigned i = 0; i < count; ++i) {
    workers_.emplace_back([this, thread_name = fmt::format("{}-{}", name, i)] {
      loguru::set_thread_name(thread_name.c_str());
      WorkerLoop();
    });
  }
  DLOG_F(1, "thread pool '{}' started with {} worker(s)", name, count);
}

ThreadPool::~ThreadPool()
{
  {
    std::scoped_lock lock(mutex_);
    stopping_ = true;
  }
  ready_.notify_all();
  // jthread joins on destruction
  workers_.clear();
}

auto ThreadPool::Enqueue(std::move_only_function<void()> task) -> void
{
  {
    std::scoped_lock lock(mutex_);
    CHECK_F(!stopping_, "task queued on a thread pool that is shutting down");
    queue_.push_back(std::move(task));
  }
  ready_.notify_one();
}

auto ThreadPool::WorkerLoop() -> void
{
  for (;;) {
    std::move_only_function<void()> task;
    {
      std::unique_lock lock(mutex_);
      ready_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

} // namespace mosaic

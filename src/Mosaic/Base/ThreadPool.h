//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <Mosaic/Base/Macros.h>
#include <Mosaic/Base/api_export.h>

namespace mosaic {

//! Thread pool for running CPU-bound tasks off the calling thread.
/*!
 Tasks are queued with Run() and picked up by a fixed set of named worker
 threads (`<name>-0`, `<name>-1`, ...). Each call returns a future that
 delivers the result, or rethrows the exception the task threw.

 ### Usage Example
 ```cpp
 ThreadPool pool(4, "rewrite");
 auto squared = pool.Run([](int x) { return x * x; }, 42);
 // squared.get() == 1764
 ```

 @warning Not intended for blocking I/O; may stall if all threads block.
*/
class ThreadPool {
public:
  //! Starts `thread_count` workers, at least one.
  MSC_BASE_API explicit ThreadPool(
    unsigned thread_count, std::string_view name = "worker");

  //! Shuts down the thread pool once every queued task has run.
  MSC_BASE_API ~ThreadPool();

  MOSAIC_MAKE_NON_COPYABLE(ThreadPool)
  MOSAIC_MAKE_NON_MOVABLE(ThreadPool)

  //! Queue `f(args...)`. Arguments are decay-copied into the task.
  template <class F, class... Args>
    requires std::invocable<std::decay_t<F>, std::decay_t<Args>...>
  auto Run(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>
  {
    using Result = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;
    std::packaged_task<Result()> task(
      [fn = std::forward<F>(f),
        ... bound = std::forward<Args>(args)]() mutable -> Result {
        return std::invoke(std::move(fn), std::move(bound)...);
      });
    auto result = task.get_future();
    Enqueue(std::move(task));
    return result;
  }

  [[nodiscard]] auto Size() const noexcept -> size_t { return workers_.size(); }

private:
  MSC_BASE_API auto Enqueue(std::move_only_function<void()> task) -> void;
  auto WorkerLoop() -> void;

  std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<std::move_only_function<void()>> queue_;
  bool stopping_ { false };
  std::vector<std::jthread> workers_;
};

} // namespace mosaic

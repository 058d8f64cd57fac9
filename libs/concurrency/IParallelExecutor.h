#pragma once

#include <cstddef>
#include <future>
#include <vector>
#include <functional>
#include <thread>

namespace concurrency
{
  // Worker count used when a caller does not pick one
  inline std::size_t defaultConcurrency()
  {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw ? hw : 2;
  }

  /**
   * @brief Fork/join seam used by the multi-symbol pipelines.
   *
   * Every symbol is analysed independently, so an executor only has to run
   * void() tasks and hand back a future per task. Exceptions thrown by a task
   * travel through its future.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Blocks until every future is ready. The first stored exception is
    // rethrown, after all tasks have finished.
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      for (auto& f : futures)
	f.wait();

      for (auto& f : futures)
	f.get();
    }
  };
}

#pragma once

#include <algorithm>
#include <cstddef>
#include <future>
#include <vector>
#include "IParallelExecutor.h"

namespace concurrency
{
  /**
   * @brief Runs body(i) for every i in [0, total) through an executor.
   *
   * The range is cut into at most maxTasks contiguous chunks (0 picks the
   * hardware concurrency) and each chunk is one submitted task. Callers write
   * results into pre-sized slots indexed by i, so no locking is needed.
   * Returns after every chunk finished; a body exception is rethrown then.
   */
  template <typename Executor, typename Body>
  void parallel_for (std::size_t total, Executor& exec, Body body, std::size_t maxTasks = 0)
  {
    if (total == 0)
      return;

    const std::size_t numTasks = std::min(total, maxTasks ? maxTasks : defaultConcurrency());
    const std::size_t chunkSize = (total + numTasks - 1) / numTasks;

    std::vector<std::future<void>> futures;
    futures.reserve(numTasks);
    for (std::size_t start = 0; start < total; start += chunkSize)
      {
	const std::size_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([start, end, &body]() {
	      for (std::size_t i = start; i < end; ++i)
		body(i);
	    }));
      }

    exec.waitAll(futures);
  }

  // Same as parallel_for but hands each element of a random access container
  template <typename Executor, typename Container, typename Body>
  void parallel_for_each (Executor& exec, Container& container, Body body)
  {
    parallel_for(container.size(), exec, [&container, &body](std::size_t i) {
	body(container[i]);
      });
  }
}

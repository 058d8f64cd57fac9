#pragma once

#include "IParallelExecutor.h"
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <queue>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>
#include <system_error>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for the per-symbol fork/join.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread. Output is
 *    deterministic, which is what the unit tests use.
 *  - StdAsyncExecutor: one std::async(std::launch::async) per task. Fine for a
 *    handful of symbols.
 *  - ThreadPoolExecutor<N>: fixed pool of N workers (N == 0 picks the hardware
 *    concurrency). Preferred for large symbol universes.
 */
namespace concurrency
{
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      }
      catch (...) {
	// handed to the caller through the future
	prom.set_exception(std::current_exception());
      }
      return fut;
    }
  };

  class StdAsyncExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      return std::async(std::launch::async, std::move(task));
    }
  };

  /**
   * @brief Fixed-size thread pool.
   *
   * Tasks are queued and drained by the workers. The destructor lets the
   * workers finish every queued task before joining them.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    ThreadPoolExecutor()
      : mStop(false)
    {
      const std::size_t threads = (N > 0) ? N : defaultConcurrency();

      try {
	for (std::size_t i = 0; i < threads; ++i)
	  mWorkers.emplace_back([this] { workerLoop(); });
      }
      catch (const std::system_error&) {
	shutdown();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::size_t getNumThreads() const
    {
      return mWorkers.size();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::lock_guard<std::mutex> lock(mTasksMutex);
	if (mStop)
	  throw std::runtime_error("ThreadPoolExecutor: submit on a stopped pool");

	mTasks.emplace([packaged]() { (*packaged)(); });
      }
      mCondition.notify_one();
      return fut;
    }

  private:
    void workerLoop()
    {
      for (;;)
	{
	  std::function<void()> task;
	  {
	    std::unique_lock<std::mutex> lock(mTasksMutex);
	    mCondition.wait(lock, [this] { return mStop || !mTasks.empty(); });
	    if (mStop && mTasks.empty())
	      return;

	    task = std::move(mTasks.front());
	    mTasks.pop();
	  }
	  task();
	}
    }

    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(mTasksMutex);
	mStop = true;
      }
      mCondition.notify_all();
      for (auto& worker : mWorkers)
	if (worker.joinable())
	  worker.join();
    }

  private:
    std::vector<std::thread> mWorkers;
    std::queue<std::function<void()>> mTasks;
    std::mutex mTasksMutex;
    std::condition_variable mCondition;
    bool mStop;
  };
}

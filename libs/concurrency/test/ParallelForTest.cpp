#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <atomic>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace concurrency;

TEST_CASE("parallel_for visits every index once", "[parallel_for]")
{
  SECTION("SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<std::size_t> slots(37, 0);

    parallel_for(slots.size(), executor, [&slots](std::size_t i) { slots[i] = i * 2; });

    for (std::size_t i = 0; i < slots.size(); ++i)
      REQUIRE(slots[i] == i * 2);
  }

  SECTION("ThreadPoolExecutor")
  {
    ThreadPoolExecutor<4> executor;
    std::vector<std::atomic<int>> visited(1001);
    for (auto& v : visited)
      v.store(0);

    parallel_for(visited.size(), executor, [&visited](std::size_t i) {
	visited[i].fetch_add(1, std::memory_order_relaxed);
      });

    for (const auto& v : visited)
      REQUIRE(v.load() == 1);
  }

  SECTION("Explicit task count larger than range")
  {
    StdAsyncExecutor executor;
    std::vector<int> slots(3, 0);

    parallel_for(slots.size(), executor, [&slots](std::size_t i) { slots[i] = 1; }, 16);

    REQUIRE(std::accumulate(slots.begin(), slots.end(), 0) == 3);
  }

  SECTION("Empty range does nothing")
  {
    SingleThreadExecutor executor;
    int calls = 0;
    parallel_for(0, executor, [&calls](std::size_t) { ++calls; });
    REQUIRE(calls == 0);
  }
}

TEST_CASE("parallel_for propagates body exceptions", "[parallel_for]")
{
  ThreadPoolExecutor<2> executor;
  REQUIRE_THROWS_AS(parallel_for(10, executor, [](std::size_t i) {
	if (i == 7)
	  throw std::logic_error("index 7");
      }), std::logic_error);
}

TEST_CASE("parallel_for_each hands out container elements", "[parallel_for_each]")
{
  ThreadPoolExecutor<3> executor;
  std::vector<int> values(50);
  std::iota(values.begin(), values.end(), 1);

  parallel_for_each(executor, values, [](int& v) { v *= 10; });

  for (std::size_t i = 0; i < values.size(); ++i)
    REQUIRE(values[i] == static_cast<int>((i + 1) * 10));
}

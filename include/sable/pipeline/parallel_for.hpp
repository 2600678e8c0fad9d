#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace sable::pipeline {

// Run fn(i) for every i in [0, count) on up to `workers` threads. Indices are
// handed out in order from a shared counter; completion order is unspecified.
// fn must be safe to call concurrently for distinct indices. With one worker
// (or one item) everything runs on the calling thread.
template <typename Fn>
void ParallelFor(size_t count, size_t workers, Fn&& fn) {
  workers = std::min(std::max<size_t>(workers, 1), count);
  if (workers <= 1) {
    for (size_t i = 0; i < count; ++i) {
      fn(i);
    }
    return;
  }

  std::atomic<size_t> next{0};
  auto worker = [&] {
    while (true) {
      size_t index = next.fetch_add(1, std::memory_order_relaxed);
      if (index >= count) {
        break;
      }
      fn(index);
    }
  };

  std::vector<std::jthread> threads;
  threads.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  // jthread destructors join
}

}  // namespace sable::pipeline

#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace unitrisk {

class ThreadPool {
  std::vector<std::thread> workers;
  std::queue<std::function<void()>> q;
  std::mutex m;
  std::condition_variable cv;
  std::condition_variable idle_cv;
  size_t active = 0;
  bool stop = false;

  void start_workers(unsigned n);
  void shutdown();

 public:
  // n == 0 means one worker per hardware thread. Throws std::system_error
  // when a thread can't be created; workers already started are joined first.
  explicit ThreadPool(unsigned n);
  ~ThreadPool();
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void submit(std::function<void()> fn);
  // Blocks until the queue is drained and no job is running.
  void wait_idle();
  size_t size() const { return workers.size(); }
};

} // namespace unitrisk

#include <unitrisk/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace unitrisk {

ThreadPool::ThreadPool(unsigned n){
  if (n==0) n = std::thread::hardware_concurrency();
  if (n==0) n = 1;
  try {
    start_workers(n);
  } catch (...) {
    // Join whatever did start; a joinable std::thread must not be destroyed.
    shutdown();
    throw;
  }
  spdlog::debug("thread pool started with {} workers", workers.size());
}

void ThreadPool::start_workers(unsigned n){
  for (unsigned i=0;i<n;i++){
    workers.emplace_back([this]{
      for(;;){
        std::function<void()> job;
        { std::unique_lock<std::mutex> lk(m);
          cv.wait(lk,[&]{ return stop || !q.empty(); });
          if (stop && q.empty()) return;
          job = std::move(q.front()); q.pop();
          ++active;
        }
        try {
          job();
        } catch (const std::exception& e) {
          spdlog::error("thread pool job failed: {}", e.what());
        }
        { std::lock_guard<std::mutex> lk(m);
          --active;
          if (q.empty() && active==0) idle_cv.notify_all();
        }
      }
    });
  }
}

void ThreadPool::shutdown(){
  { std::lock_guard<std::mutex> lk(m); stop=true; }
  cv.notify_all();
  for(auto& t:workers) if (t.joinable()) t.join();
}

ThreadPool::~ThreadPool(){
  shutdown();
}

void ThreadPool::submit(std::function<void()> fn){
  { std::lock_guard<std::mutex> lk(m); q.emplace(std::move(fn)); }
  cv.notify_one();
}

void ThreadPool::wait_idle(){
  std::unique_lock<std::mutex> lk(m);
  idle_cv.wait(lk,[&]{ return q.empty() && active==0; });
}

} // namespace unitrisk

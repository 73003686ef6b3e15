#pragma once
#include <unitrisk/classifier.hpp>
#include <unitrisk/path_filter.hpp>
#include <unitrisk/thread_pool.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

namespace unitrisk {

// Runs fn(i) for every index in [0, n), in contiguous chunks on the pool.
// The first exception thrown by fn is rethrown here once the pool is idle;
// remaining indices of the failed chunk are skipped.
template <typename Fn>
void parallel_for(size_t n, ThreadPool& pool, Fn fn){
  if (n == 0) return;
  std::mutex err_m;
  std::exception_ptr err;
  const size_t slots = std::max<size_t>(1, pool.size() * 4);
  const size_t chunk = std::max<size_t>(1, (n + slots - 1) / slots);
  for (size_t begin = 0; begin < n; begin += chunk) {
    const size_t end = std::min(n, begin + chunk);
    pool.submit([begin, end, &fn, &err_m, &err]{
      try {
        for (size_t i = begin; i < end; ++i) fn(i);
      } catch (...) {
        std::lock_guard<std::mutex> lk(err_m);
        if (!err) err = std::current_exception();
      }
    });
  }
  pool.wait_idle();
  if (err) std::rethrow_exception(err);
}

// Parallel map over the pool; result i belongs to input i. A failure in any
// item propagates to the caller instead of leaving a default result behind.
std::vector<Classification> classify_units(const UnitClassifier& classifier,
                                           const std::vector<std::string>& units,
                                           ThreadPool& pool);

// result[i] is true when paths[i] is ignored.
std::vector<bool> filter_paths(const PathFilter& filter,
                               const std::vector<std::string>& paths,
                               ThreadPool& pool);

} // namespace unitrisk

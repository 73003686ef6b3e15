#include <unitrisk/batch.hpp>

namespace unitrisk {

std::vector<Classification> classify_units(const UnitClassifier& classifier,
                                           const std::vector<std::string>& units,
                                           ThreadPool& pool){
  std::vector<Classification> out(units.size());
  parallel_for(units.size(), pool, [&](size_t i){
    out[i] = classifier.classify(units[i]);
  });
  return out;
}

std::vector<bool> filter_paths(const PathFilter& filter,
                               const std::vector<std::string>& paths,
                               ThreadPool& pool){
  // vector<bool> packs bits, so workers write bytes and we convert after.
  std::vector<char> flags(paths.size(), 0);
  parallel_for(paths.size(), pool, [&](size_t i){
    flags[i] = filter.is_ignored(paths[i]) ? 1 : 0;
  });
  return std::vector<bool>(flags.begin(), flags.end());
}

} // namespace unitrisk

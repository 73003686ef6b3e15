#pragma once
#include <unitrisk/classifier.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace unitrisk {

struct Report {
  // group name -> units, both sorted
  std::map<std::string, std::set<std::string>> groups;
  size_t ignored_units = 0;
};

// units[i] was classified as results[i]; sizes must agree.
Report group_units(const std::vector<std::string>& units,
                   const std::vector<Classification>& results);

std::string render_report(const Report& report);

// Lists the paths whose ignored[i] is false.
std::string render_paths(const std::vector<std::string>& paths,
                         const std::vector<bool>& ignored);

} // namespace unitrisk

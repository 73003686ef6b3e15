#include <unitrisk/path_filter.hpp>

namespace unitrisk {

bool PathFilter::is_ignored(std::string_view path) const {
  return rules_.ignore_paths().matches(path);
}

} // namespace unitrisk

#pragma once
#include <unitrisk/rules.hpp>

#include <string_view>

namespace unitrisk {

// Drops paths that start with one of the rule set's ignore prefixes.
// Holds a reference; the RuleSet must outlive the filter.
class PathFilter {
public:
  explicit PathFilter(const RuleSet& rules) : rules_(rules) {}

  bool is_ignored(std::string_view path) const;

private:
  const RuleSet& rules_;
};

} // namespace unitrisk

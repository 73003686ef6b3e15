#pragma once
#include <unitrisk/matcher.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace unitrisk {

// Name of the synthetic group for units no rule claims.
inline constexpr const char* kOtherGroup = "other";

// Raised while building a RuleSet; never raised by classification.
class RuleError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct GroupRule {
  std::string name;
  Matcher match;
};

// Read-only rule data shared by the path filter and the unit classifier.
// The constructor rejects duplicate, empty or reserved group names.
class RuleSet {
public:
  RuleSet(Matcher ignore_paths, Matcher catchall_units, std::vector<GroupRule> groups);

  const Matcher& ignore_paths() const { return ignore_paths_; }
  const Matcher& catchall_units() const { return catchall_units_; }
  // Declaration order; earlier groups take precedence.
  const std::vector<GroupRule>& groups() const { return groups_; }

private:
  Matcher ignore_paths_;
  Matcher catchall_units_;
  std::vector<GroupRule> groups_;
};

RuleSet parse_rules(const std::string& yaml_text);
RuleSet load_rules(const std::filesystem::path& file);

} // namespace unitrisk

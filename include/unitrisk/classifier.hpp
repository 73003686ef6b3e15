#pragma once
#include <unitrisk/rules.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace unitrisk {

enum class Outcome { Ignored, Assigned };

struct Classification {
  Outcome outcome = Outcome::Assigned;
  std::string group; // empty when ignored

  static Classification ignored() { return {Outcome::Ignored, {}}; }
  static Classification assigned(std::string g) { return {Outcome::Assigned, std::move(g)}; }

  bool is_ignored() const { return outcome == Outcome::Ignored; }
  bool operator==(const Classification& o) const {
    return outcome == o.outcome && group == o.group;
  }
  bool operator!=(const Classification& o) const { return !(*this == o); }
};

// "ignored" or "group:<name>"
std::string to_string(const Classification& c);

// Catchall check first, then the groups in declaration order, then "other".
class UnitClassifier {
public:
  explicit UnitClassifier(const RuleSet& rules) : rules_(rules) {}

  Classification classify(std::string_view unit) const;

private:
  const RuleSet& rules_;
};

} // namespace unitrisk

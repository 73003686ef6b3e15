#include <unitrisk/classifier.hpp>

namespace unitrisk {

std::string to_string(const Classification& c){
  if (c.is_ignored()) return "ignored";
  return "group:" + c.group;
}

Classification UnitClassifier::classify(std::string_view unit) const {
  if (rules_.catchall_units().matches(unit)) return Classification::ignored();

  for (const auto& g : rules_.groups()) {
    if (g.match.matches(unit)) return Classification::assigned(g.name);
  }
  return Classification::assigned(kOtherGroup);
}

} // namespace unitrisk

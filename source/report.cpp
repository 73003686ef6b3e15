#include <unitrisk/report.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace unitrisk {

Report group_units(const std::vector<std::string>& units,
                   const std::vector<Classification>& results){
  if (units.size() != results.size())
    throw std::invalid_argument(fmt::format("group_units: {} units but {} results",
                                            units.size(), results.size()));
  Report r;
  std::set<std::string> ignored;
  for (size_t i=0;i<units.size();++i) {
    if (results[i].is_ignored()) { ignored.insert(units[i]); continue; }
    r.groups[results[i].group].insert(units[i]);
  }
  r.ignored_units = ignored.size();
  return r;
}

std::string render_report(const Report& report){
  std::string out;
  for (const auto& [group, units] : report.groups) {
    out += fmt::format(" * {}\n", group);
    out += "   - sudo systemctl restart";
    for (const auto& u : units) { out += ' '; out += u; }
    out += '\n';
  }
  if (report.groups.empty()) out += "No units need restarting.\n";
  if (report.ignored_units > 0) out += "Some units matched catchall rules and were ignored.\n";
  return out;
}

std::string render_paths(const std::vector<std::string>& paths,
                         const std::vector<bool>& ignored){
  if (paths.size() != ignored.size())
    throw std::invalid_argument(fmt::format("render_paths: {} paths but {} flags",
                                            paths.size(), ignored.size()));
  std::string out;
  for (size_t i=0;i<paths.size();++i) {
    if (ignored[i]) continue;
    if (out.empty()) out = "These paths are held open by stale processes:\n";
    out += fmt::format(" * {}\n", paths[i]);
  }
  return out;
}

} // namespace unitrisk

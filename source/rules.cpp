#include <unitrisk/rules.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace unitrisk {

RuleSet::RuleSet(Matcher ignore_paths, Matcher catchall_units, std::vector<GroupRule> groups)
: ignore_paths_(std::move(ignore_paths)),
  catchall_units_(std::move(catchall_units)),
  groups_(std::move(groups)) {
  std::unordered_set<std::string> seen;
  for (const auto& g : groups_) {
    if (g.name.empty()) throw RuleError("group name must not be empty");
    if (g.name == kOtherGroup)
      throw RuleError(fmt::format("group name '{}' is reserved for unmatched units", kOtherGroup));
    if (!seen.insert(g.name).second)
      throw RuleError(fmt::format("duplicate group name '{}'", g.name));
  }
}

namespace {

// Which matcher keys a section accepts.
struct Allowed {
  bool by_prefix = false;
  bool by_full = false;
  bool by_regex = false;
};

std::vector<std::string> string_list(const YAML::Node& node, const std::string& where){
  std::vector<std::string> out;
  if (!node || node.IsNull()) return out;
  if (!node.IsSequence()) throw RuleError(fmt::format("{}: expected a list", where));
  for (const auto& item : node) {
    if (!item.IsScalar()) throw RuleError(fmt::format("{}: list entries must be strings", where));
    out.push_back(item.as<std::string>());
  }
  return out;
}

std::vector<Pattern> compile_all(const std::vector<std::string>& sources, const std::string& where){
  std::vector<Pattern> out;
  out.reserve(sources.size());
  for (const auto& s : sources) {
    try {
      out.push_back(Matcher::compile(s));
    } catch (const std::regex_error& e) {
      throw RuleError(fmt::format("{}: invalid regex '{}': {}", where, s, e.what()));
    }
  }
  return out;
}

// `skip` names a key handled by the caller (a group's `group`).
Matcher parse_matcher(const YAML::Node& node, const std::string& where, Allowed allowed,
                      const char* skip = nullptr){
  if (!node.IsMap()) throw RuleError(fmt::format("{}: expected a mapping", where));

  std::vector<std::string> prefixes, fulls, regexes;
  for (const auto& kv : node) {
    auto key = kv.first.as<std::string>();
    auto sub = fmt::format("{}.{}", where, key);
    if (skip && key == skip) continue;
    if (key == "by_prefix" && allowed.by_prefix) {
      prefixes = string_list(kv.second, sub);
    } else if (key == "by_full" && allowed.by_full) {
      fulls = string_list(kv.second, sub);
    } else if (key == "by_regex" && allowed.by_regex) {
      regexes = string_list(kv.second, sub);
    } else {
      throw RuleError(fmt::format("{}: unrecognised matcher key '{}'", where, key));
    }
  }
  return Matcher(std::move(prefixes), std::move(fulls), compile_all(regexes, where + ".by_regex"));
}

std::vector<GroupRule> parse_groups(const YAML::Node& node){
  std::vector<GroupRule> groups;
  if (node.IsNull()) return groups;
  if (!node.IsSequence()) throw RuleError("group_services: expected a list");

  size_t idx = 0;
  for (const auto& item : node) {
    auto where = fmt::format("group_services[{}]", idx++);
    if (!item.IsMap()) throw RuleError(fmt::format("{}: expected a mapping", where));
    const auto name = item["group"];
    if (!name || !name.IsScalar())
      throw RuleError(fmt::format("{}: missing 'group' name", where));

    GroupRule g;
    g.name = name.as<std::string>();
    where = fmt::format("group_services[{}]", g.name);
    g.match = parse_matcher(item, where, Allowed{false, true, true}, "group");
    groups.push_back(std::move(g));
  }
  return groups;
}

YAML::Node required(const YAML::Node& root, const char* key){
  auto n = root[key];
  if (!n) throw RuleError(fmt::format("missing required key '{}'", key));
  return n;
}

RuleSet build_rules(const YAML::Node& root){
  if (!root.IsMap()) throw RuleError("rules document must be a mapping");

  for (const auto& kv : root) {
    auto key = kv.first.as<std::string>();
    if (key != "ignore_paths" && key != "catchall_units" && key != "group_services")
      throw RuleError(fmt::format("unrecognised top-level key '{}'", key));
  }

  auto ignore = parse_matcher(required(root, "ignore_paths"), "ignore_paths", Allowed{true, false, false});
  auto catchall = parse_matcher(required(root, "catchall_units"), "catchall_units", Allowed{false, true, true});
  auto groups = parse_groups(required(root, "group_services"));
  return RuleSet(std::move(ignore), std::move(catchall), std::move(groups));
}

} // namespace

RuleSet parse_rules(const std::string& yaml_text){
  try {
    auto root = YAML::Load(yaml_text);
    auto rules = build_rules(root);
    spdlog::debug("rules loaded: {} ignore prefixes, {} catchall patterns, {} groups",
                  rules.ignore_paths().prefixes().size(),
                  rules.catchall_units().fulls().size() + rules.catchall_units().regexes().size(),
                  rules.groups().size());
    return rules;
  } catch (const YAML::Exception& e) {
    throw RuleError(fmt::format("rules are not valid YAML: {}", e.what()));
  }
}

RuleSet load_rules(const std::filesystem::path& file){
  std::ifstream in(file);
  if (!in) throw RuleError("rules file not found: " + file.string());
  std::ostringstream ss;
  ss << in.rdbuf();
  try {
    return parse_rules(ss.str());
  } catch (const RuleError& e) {
    throw RuleError(fmt::format("{}: {}", file.string(), e.what()));
  }
}

} // namespace unitrisk

#include <unitrisk/matcher.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace unitrisk {

Matcher::Matcher(std::vector<std::string> prefixes,
                 std::vector<std::string> fulls,
                 std::vector<Pattern> regexes)
: prefixes_(std::move(prefixes)), fulls_(std::move(fulls)), regexes_(std::move(regexes)) {}

static bool starts_with(std::string_view s, std::string_view pre){
  if (s.size() < pre.size()) return false;
  return std::equal(pre.begin(), pre.end(), s.begin());
}

bool Matcher::matches(std::string_view what) const {
  if (what.empty()) return false;

  for (const auto& p : prefixes_) {
    if (starts_with(what, p)) return true;
  }
  for (const auto& f : fulls_) {
    if (what == f) return true;
  }
  if (regexes_.empty()) return false;
  if (what.size() > kMaxRegexInput) {
    spdlog::warn("{}-byte candidate exceeds {} bytes; regex rules skipped", what.size(), kMaxRegexInput);
    return false;
  }
  for (const auto& r : regexes_) {
    try {
      if (std::regex_match(what.begin(), what.end(), r.re)) return true;
    } catch (const std::regex_error& e) {
      // Backtracking limits on hostile input; counts as no match.
      spdlog::warn("regex '{}' could not be evaluated against '{}': {}", r.source, what, e.what());
    }
  }
  return false;
}

bool Matcher::empty() const {
  return prefixes_.empty() && fulls_.empty() && regexes_.empty();
}

Pattern Matcher::compile(const std::string& source){
  return Pattern{source, std::regex(source, std::regex::ECMAScript)};
}

} // namespace unitrisk

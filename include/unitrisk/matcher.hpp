#pragma once
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace unitrisk {

// Longest candidate handed to the regex engine. libstdc++ matches recursively,
// one frame per input character, so long strings overflow the stack. systemd
// caps unit names at 256 bytes; longer candidates only get prefix and exact checks.
inline constexpr size_t kMaxRegexInput = 256;

// One compiled pattern, kept together with its source text for diagnostics.
struct Pattern {
  std::string source;
  std::regex re;
};

// Union of three string tests: literal prefix, exact name, whole-string regex.
// Immutable after construction, so concurrent matches need no locking.
class Matcher {
public:
  Matcher() = default;
  Matcher(std::vector<std::string> prefixes,
          std::vector<std::string> fulls,
          std::vector<Pattern> regexes);

  bool matches(std::string_view what) const;

  bool empty() const;
  const std::vector<std::string>& prefixes() const { return prefixes_; }
  const std::vector<std::string>& fulls() const { return fulls_; }
  const std::vector<Pattern>& regexes() const { return regexes_; }

  // Throws std::regex_error for malformed input.
  static Pattern compile(const std::string& source);

private:
  std::vector<std::string> prefixes_;
  std::vector<std::string> fulls_;
  std::vector<Pattern> regexes_;
};

} // namespace unitrisk

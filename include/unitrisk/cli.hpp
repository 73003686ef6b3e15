#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace unitrisk {

inline constexpr unsigned kMaxThreads = 256;

struct Cli {
  std::filesystem::path rules_file;
  std::optional<std::string> paths_file; // "-" is stdin
  std::optional<std::string> units_file;
  unsigned threads = 0;
  bool classify_only = false;
  bool verbose = false;
  bool help = false;
};

struct ParseResult {
  std::optional<Cli> cli;
  std::string error;
};

ParseResult parse_cli(int argc, char** argv);

} // namespace unitrisk

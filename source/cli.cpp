#include <unitrisk/cli.hpp>

#include <cctype>
#include <string_view>

namespace unitrisk {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static bool all_digits(std::string_view s){
  if (s.empty()) return false;
  for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

ParseResult parse_cli(int argc, char** argv){
  ParseResult r{};
  Cli cli;
  for (int i=1;i<argc;i++){
    std::string_view a = argv[i];
    const bool takes_value = a=="--rules" || a=="-r" || a=="--paths" || a=="-p"
                          || a=="--units" || a=="-u" || a=="--threads";
    if (takes_value && !has_arg(i, argc)) {
      r.error = std::string(a) + ": missing value";
      return r;
    }
    if (a=="--rules" || a=="-r") {
      cli.rules_file = argv[++i];
    } else if (a=="--paths" || a=="-p") {
      cli.paths_file = argv[++i];
    } else if (a=="--units" || a=="-u") {
      cli.units_file = argv[++i];
    } else if (a=="--threads") {
      std::string_view n = argv[++i];
      if (!all_digits(n) || n.size() > 4 || std::stoul(std::string(n)) > kMaxThreads) {
        r.error = "--threads: expected a number from 0 to " + std::to_string(kMaxThreads);
        return r;
      }
      cli.threads = static_cast<unsigned>(std::stoul(std::string(n)));
    } else if (a=="--classify") {
      cli.classify_only = true;
    } else if (a=="--verbose" || a=="-v") {
      cli.verbose = true;
    } else if (a=="--help" || a=="-h") {
      cli.help = true;
      r.cli = cli;
      return r;
    } else {
      r.error = "unknown argument: " + std::string(a);
      return r;
    }
  }
  if (cli.rules_file.empty()) {
    r.error = "--rules <FILE> is required";
    return r;
  }
  if (cli.paths_file && cli.units_file && *cli.paths_file == "-" && *cli.units_file == "-") {
    r.error = "only one of --paths and --units may read stdin";
    return r;
  }
  r.cli = cli;
  return r;
}

} // namespace unitrisk

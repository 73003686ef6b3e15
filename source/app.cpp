#include <unitrisk/app.hpp>
#include <unitrisk/batch.hpp>
#include <unitrisk/cli.hpp>
#include <unitrisk/io.hpp>
#include <unitrisk/report.hpp>
#include <unitrisk/rules.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace unitrisk {

static void print_help() {
  std::cout <<
      R"(unitrisk - group units that need restarting by restart impact

Usage:
  unitrisk --rules FILE [--paths FILE] [--units FILE]
           [--threads N] [--classify] [--verbose]

  --rules FILE    YAML rule file (ignore_paths, catchall_units, group_services)
  --paths FILE    paths held open by stale processes, one per line ("-" = stdin)
  --units FILE    unit names, one per line ("-" = stdin)
  --threads N     worker threads, 0 = one per CPU (default)
  --classify      print one verdict per input line instead of the report
)";
}

int App::run(int argc, char** argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cli) {
    spdlog::error("{}", pr.error);
    print_help();
    return 2;
  }
  const Cli& cli = *pr.cli;
  if (cli.help) {
    print_help();
    return 0;
  }
  if (cli.verbose) spdlog::set_level(spdlog::level::debug);

  std::optional<RuleSet> rules;
  try {
    rules.emplace(load_rules(cli.rules_file));
  } catch (const RuleError& e) {
    spdlog::error("invalid rules: {}", e.what());
    return 1;
  }

  std::vector<std::string> paths, units;
  try {
    if (cli.paths_file) paths = io::read_list(*cli.paths_file);
    if (cli.units_file) units = io::read_list(*cli.units_file);
  } catch (const std::runtime_error& e) {
    spdlog::error("reading input failed: {}", e.what());
    return 1;
  }
  spdlog::debug("classifying {} paths and {} units", paths.size(), units.size());

  PathFilter filter(*rules);
  UnitClassifier classifier(*rules);
  std::vector<bool> ignored;
  std::vector<Classification> results;
  try {
    ThreadPool pool(cli.threads);
    ignored = filter_paths(filter, paths, pool);
    results = classify_units(classifier, units, pool);
  } catch (const std::exception& e) {
    spdlog::error("classification failed: {}", e.what());
    return 1;
  }

  if (cli.classify_only) {
    for (size_t i=0;i<paths.size();++i)
      std::cout << fmt::format("{}\t{}\n", paths[i], ignored[i] ? "ignored" : "significant");
    for (size_t i=0;i<units.size();++i)
      std::cout << fmt::format("{}\t{}\n", units[i], to_string(results[i]));
    return 0;
  }

  std::cout << render_paths(paths, ignored);
  std::cout << render_report(group_units(units, results));
  return 0;
}

} // namespace unitrisk

#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <unitrisk/cli.hpp>
#include <unitrisk/io.hpp>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace unitrisk;

static ParseResult parse(std::vector<std::string> args){
  args.insert(args.begin(), "unitrisk");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

TEST_CASE("Full command line") {
  auto pr = parse({"--rules", "r.yml", "--paths", "p.txt", "--units", "-",
                   "--threads", "8", "--classify", "-v"});
  REQUIRE(pr.error.empty());
  REQUIRE(pr.cli);
  REQUIRE(pr.cli->rules_file.string() == "r.yml");
  REQUIRE(*pr.cli->paths_file == "p.txt");
  REQUIRE(*pr.cli->units_file == "-");
  REQUIRE(pr.cli->threads == 8);
  REQUIRE(pr.cli->classify_only);
  REQUIRE(pr.cli->verbose);
}

TEST_CASE("Defaults") {
  auto pr = parse({"-r", "r.yml"});
  REQUIRE(pr.cli);
  REQUIRE_FALSE(pr.cli->paths_file);
  REQUIRE_FALSE(pr.cli->units_file);
  REQUIRE(pr.cli->threads == 0);
  REQUIRE_FALSE(pr.cli->classify_only);
}

TEST_CASE("Help needs no rules") {
  auto pr = parse({"--help"});
  REQUIRE(pr.cli);
  REQUIRE(pr.cli->help);
}

TEST_CASE("Bad command lines") {
  REQUIRE_FALSE(parse({}).cli);
  REQUIRE_FALSE(parse({"--paths", "p.txt"}).cli);
  REQUIRE_FALSE(parse({"--rules"}).cli);
  REQUIRE_FALSE(parse({"--rules", "r.yml", "--bogus"}).cli);
  REQUIRE_FALSE(parse({"--rules", "r.yml", "--threads", "many"}).cli);
  REQUIRE_FALSE(parse({"--rules", "r.yml", "--paths", "-", "--units", "-"}).cli);
  REQUIRE(parse({"--rules", "r.yml", "--bogus"}).error == "unknown argument: --bogus");
}

TEST_CASE("Options without a value say so") {
  REQUIRE(parse({"--rules"}).error == "--rules: missing value");
  REQUIRE(parse({"--rules", "r.yml", "--paths"}).error == "--paths: missing value");
  REQUIRE(parse({"-r", "r.yml", "-u"}).error == "-u: missing value");
  REQUIRE(parse({"--rules", "r.yml", "--threads"}).error == "--threads: missing value");
}

TEST_CASE("Thread count is capped") {
  auto ok = parse({"--rules", "r.yml", "--threads", "256"});
  REQUIRE(ok.cli);
  REQUIRE(ok.cli->threads == kMaxThreads);
  REQUIRE_FALSE(parse({"--rules", "r.yml", "--threads", "257"}).cli);
  REQUIRE_FALSE(parse({"--rules", "r.yml", "--threads", "9999"}).cli);
  REQUIRE_FALSE(parse({"--rules", "r.yml", "--threads", "99999"}).cli);
}

TEST_CASE("Input lists are trimmed and skip blanks") {
  std::istringstream in("  nginx.service\n\n\tcron.service \r\n   \n");
  auto lines = io::read_lines(in);
  REQUIRE(lines == std::vector<std::string>{"nginx.service", "cron.service"});
}

TEST_CASE("Missing input file") {
  REQUIRE_THROWS_AS(io::read_list("/nonexistent/unitrisk/units.txt"), std::runtime_error);
}

TEST_CASE("A directory is not an input list") {
  REQUIRE_THROWS_AS(io::read_list(std::filesystem::temp_directory_path().string()), std::runtime_error);
}

TEST_CASE("A failing stream is an error, not an empty list") {
  std::istringstream in("nginx.service\n");
  in.setstate(std::ios::badbit);
  REQUIRE_THROWS_AS(io::read_lines(in), std::runtime_error);
}

#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <unitrisk/path_filter.hpp>

using namespace unitrisk;

TEST_CASE("Shipped prefixes drop pseudo and temporary paths") {
  auto rules = load_rules(UNITRISK_RULES_FILE);
  PathFilter f(rules);
  REQUIRE(f.is_ignored("/proc/1234/fd/9"));
  REQUIRE(f.is_ignored("/dev/shm/pulse-shm-1"));
  REQUIRE(f.is_ignored("/tmp/"));
  REQUIRE(f.is_ignored("/tmp/x/y"));
  REQUIRE(f.is_ignored("/run/systemd/journal/socket"));
  REQUIRE(f.is_ignored("/memfd:wayland-cursor"));
  REQUIRE(f.is_ignored("/SYSV00000000"));
  REQUIRE(f.is_ignored("/[aio]"));
  REQUIRE(f.is_ignored("[vdso]"));
  REQUIRE(f.is_ignored("/anon_hugepage"));

  REQUIRE_FALSE(f.is_ignored("/etc/nginx/nginx.conf"));
  REQUIRE_FALSE(f.is_ignored("/usr/lib/x86_64-linux-gnu/libssl.so.3"));
  REQUIRE_FALSE(f.is_ignored("/tmp"));
  REQUIRE_FALSE(f.is_ignored("/Proc/1/maps"));
}

TEST_CASE("Prefixes are not regexes") {
  RuleSet rules(Matcher({"/var/.*"}, {}, {}), {}, {});
  PathFilter f(rules);
  REQUIRE(f.is_ignored("/var/.*/x"));
  REQUIRE_FALSE(f.is_ignored("/var/lib/x"));
}

TEST_CASE("No prefixes means every path is significant") {
  RuleSet rules({}, {}, {});
  PathFilter f(rules);
  REQUIRE_FALSE(f.is_ignored("/proc/1/maps"));
  REQUIRE_FALSE(f.is_ignored(""));
}

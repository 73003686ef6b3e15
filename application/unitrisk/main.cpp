#include <unitrisk/app.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

int main(int argc, char** argv) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("unitrisk"));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  return unitrisk::App{}.run(argc, argv);
}

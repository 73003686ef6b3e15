#pragma once

namespace unitrisk {

struct App {
  int run(int argc, char** argv);
};

} // namespace unitrisk

#pragma once
#include <istream>
#include <string>
#include <vector>

namespace unitrisk {
namespace io {
  // One entry per line, whitespace-trimmed, blank lines dropped.
  // Throws std::runtime_error when the stream reports a read error.
  std::vector<std::string> read_lines(std::istream& in);
  // "-" reads stdin. Throws std::runtime_error when the file can't be opened
  // or read, including when it names a directory.
  std::vector<std::string> read_list(const std::string& source);
}
} // namespace unitrisk

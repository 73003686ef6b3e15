#include <unitrisk/io.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace unitrisk {
namespace io {

static std::string trim(const std::string& s){
  size_t i=0, j=s.size();
  while (i<j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  while (j>i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
  return s.substr(i, j-i);
}

std::vector<std::string> read_lines(std::istream& in){
  std::vector<std::string> out;
  std::string line;
  while (std::getline(in, line)) {
    auto s = trim(line);
    if (!s.empty()) out.push_back(std::move(s));
  }
  if (in.bad()) throw std::runtime_error("read error");
  return out;
}

std::vector<std::string> read_list(const std::string& source){
  if (source == "-") return read_lines(std::cin);
  std::error_code ec;
  if (std::filesystem::is_directory(source, ec))
    throw std::runtime_error("open: " + source + ": is a directory");
  std::ifstream in(source);
  if (!in) throw std::runtime_error("open: " + source);
  try {
    return read_lines(in);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(source + ": " + e.what());
  }
}

} // namespace io
} // namespace unitrisk

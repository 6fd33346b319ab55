#include "condor/engine/tick_file_reader.hpp"
#include "condor/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace condor {

std::vector<domain::Tick> readTickFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("cannot open tick file " + path);
  }

  std::vector<domain::Tick> ticks;
  std::string line;
  std::size_t line_no = 0;
  std::size_t skipped = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') {
      continue;
    }
    try {
      ticks.push_back(nlohmann::json::parse(line).get<domain::Tick>());
    } catch (const nlohmann::json::exception& e) {
      ++skipped;
      std::cerr << "[TickFileReader] WARNING: " << path << ":" << line_no
                << " skipped: " << e.what() << "\n";
    }
  }

  std::cout << "[TickFileReader] loaded " << ticks.size() << " tick(s) from "
            << path;
  if (skipped > 0) {
    std::cout << " (" << skipped << " malformed line(s) skipped)";
  }
  std::cout << "\n";
  return ticks;
}

}  // namespace condor

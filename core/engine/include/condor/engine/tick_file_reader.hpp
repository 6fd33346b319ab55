#pragma once

#include "condor/domain/tick.hpp"

#include <string>
#include <vector>

namespace condor {

// Reads a JSON-lines tick file: one object per line with instrument_id,
// timestamp_ms and any of last_price, bid, ask, volume. Blank lines and lines
// starting with '#' are skipped. A malformed line is logged and skipped; a
// missing file throws std::runtime_error.
std::vector<domain::Tick> readTickFile(const std::string& path);

}  // namespace condor

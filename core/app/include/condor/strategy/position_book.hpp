#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// PositionBook
// -----------------------------------------------------------------------------
// Which open Position holds which instruments. Enforces that no two open
// Positions reference the same instrument_id, so two strategies (or two
// positions of one) can never hedge the same leg twice.
//
// Decision loop only. Not thread-safe.
// -----------------------------------------------------------------------------
class PositionBook {
 public:
  // false, and nothing reserved, if any instrument is held by another
  // Position. Re-reserving for the same Position adds to its set.
  bool reserve(const std::string& position_id,
               const std::vector<std::string>& instrument_ids);

  void release(const std::string& position_id);

  bool inUse(const std::string& instrument_id) const {
    return owner_.count(instrument_id) != 0;
  }

  std::size_t openCount() const { return held_.size(); }

 private:
  std::map<std::string, std::set<std::string>> held_;  // position -> ids
  std::map<std::string, std::string> owner_;           // id -> position
};

}  // namespace condor

#include "condor/strategy/position_book.hpp"

namespace condor {

bool PositionBook::reserve(const std::string& position_id,
                           const std::vector<std::string>& instrument_ids) {
  for (const auto& id : instrument_ids) {
    auto it = owner_.find(id);
    if (it != owner_.end() && it->second != position_id) {
      return false;
    }
  }
  auto& held = held_[position_id];
  for (const auto& id : instrument_ids) {
    owner_[id] = position_id;
    held.insert(id);
  }
  return true;
}

void PositionBook::release(const std::string& position_id) {
  auto it = held_.find(position_id);
  if (it == held_.end()) {
    return;
  }
  for (const auto& id : it->second) {
    owner_.erase(id);
  }
  held_.erase(it);
}

}  // namespace condor

#include "condor/persistence/journal_reconciler.hpp"
#include "condor/persistence/position_archive.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace condor {

JournalReconciler::JournalReconciler(std::string persistence_dir,
                                     std::string order_log_path)
    : persistence_dir_(std::move(persistence_dir)),
      order_log_path_(std::move(order_log_path)) {}

void JournalReconciler::load() {
  if (loaded_) {
    return;
  }
  records_ = OrderEventLog::readAll(order_log_path_);
  loaded_ = true;
  std::cout << "[JournalReconciler] " << records_.size()
            << " order-log records read from " << order_log_path_ << "\n";
}

std::vector<domain::Position> JournalReconciler::reconcilePositions() {
  namespace fs = std::filesystem;
  const std::string dir = persistence_dir_;
  auto open = PositionArchive::readOpenSnapshot(
      (fs::path(dir) / "open_positions.json").string());
  auto closed = PositionArchive::readArchive(
      (fs::path(dir) / "positions_archive.jsonl").string());

  std::set<std::string> closed_ids;
  for (const auto& p : closed) {
    closed_ids.insert(p.id);
  }

  std::vector<domain::Position> result;
  for (auto& p : open) {
    if (closed_ids.count(p.id) != 0 ||
        p.state == domain::PositionState::Closed) {
      continue;
    }
    result.push_back(std::move(p));
  }
  std::cout << "[JournalReconciler] " << result.size()
            << " open position(s) to resume.\n";
  return result;
}

std::vector<domain::Order> JournalReconciler::reconcileOrders() {
  load();
  std::map<domain::OrderId, domain::Order> latest;
  for (const auto& rec : records_) {
    latest[rec.order.id] = rec.order;
  }

  std::vector<domain::Order> open;
  for (auto& [id, order] : latest) {
    if (!domain::isTerminal(order.status)) {
      open.push_back(std::move(order));
    }
  }
  return open;
}

std::vector<FillKey> JournalReconciler::reconcileFillKeys() {
  load();
  // A fill journalled before the ack carries no venue id; key it by the id
  // the order was acknowledged with later, as the ExecutionManager does.
  std::map<domain::OrderId, std::string> venue_ids;
  for (const auto& rec : records_) {
    if (!rec.order.broker_order_id.empty()) {
      venue_ids[rec.order.id] = rec.order.broker_order_id;
    }
  }

  std::vector<FillKey> keys;
  for (const auto& rec : records_) {
    if (!rec.fill) {
      continue;
    }
    auto known = venue_ids.find(rec.order.id);
    std::string venue_id = known != venue_ids.end()
                               ? known->second
                               : "client-" + std::to_string(rec.order.id);
    keys.emplace_back(std::move(venue_id), rec.fill->fill_seq);
  }
  return keys;
}

std::uint64_t JournalReconciler::maxOrderId() {
  load();
  std::uint64_t max_id = 0;
  for (const auto& rec : records_) {
    max_id = std::max<std::uint64_t>(max_id, rec.order.id);
  }
  return max_id;
}

}  // namespace condor

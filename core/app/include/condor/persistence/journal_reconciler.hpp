#pragma once

#include "condor/persistence/i_reconciler.hpp"
#include "condor/persistence/order_event_log.hpp"

#include <string>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// JournalReconciler
// -----------------------------------------------------------------------------
// Rebuilds engine state from the local journal: the order-event log and the
// PositionArchive's open-position snapshot. The order log is read once, on
// first use.
//
// Only the last record per order counts. Positions come from the snapshot;
// a Position that the snapshot still lists but the archive already holds
// (closed between the two writes) is dropped.
// -----------------------------------------------------------------------------
class JournalReconciler : public IReconciler {
 public:
  JournalReconciler(std::string persistence_dir, std::string order_log_path);

  std::vector<domain::Position> reconcilePositions() override;
  std::vector<domain::Order> reconcileOrders() override;
  std::vector<FillKey> reconcileFillKeys() override;
  std::uint64_t maxOrderId() override;

 private:
  void load();

  std::string persistence_dir_;
  std::string order_log_path_;
  bool loaded_{false};
  std::vector<OrderLogRecord> records_;
};

}  // namespace condor

#pragma once

#include "condor/domain/order.hpp"
#include "condor/events/order_update_event.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace condor {

struct OrderLogRecord {
  std::int64_t timestamp_ms{0};
  std::string kind;
  domain::Order order;
  std::optional<FillDetail> fill;
};

// -----------------------------------------------------------------------------
// OrderEventLog
// -----------------------------------------------------------------------------
//
// @brief  Append-only audit trail of every order state transition.
//
// @details
// One JSON object per line:
//   {"ts":..., "kind":"fill", "order":{...}, "fill":{...}}
//
// Every append is flushed, so the file is complete up to the last
// transition if the process dies. The log is write-only during a session and
// read back by JournalReconciler on the next startup.
//
// Thread-safety: append() and flush() are serialized by an internal mutex.
// -----------------------------------------------------------------------------
class OrderEventLog {
 public:
  // Opens (creating if needed) `path` for append. Throws std::runtime_error
  // when the file cannot be opened.
  explicit OrderEventLog(std::string path);
  ~OrderEventLog();

  OrderEventLog(const OrderEventLog&) = delete;
  OrderEventLog& operator=(const OrderEventLog&) = delete;

  void append(const std::string& kind, const domain::Order& order,
              std::int64_t timestamp_ms,
              const std::optional<FillDetail>& fill = std::nullopt);

  void flush();

  std::size_t recordsWritten() const;
  const std::string& path() const { return path_; }

  // Reads every well-formed record of a log file. A missing file yields an
  // empty vector; malformed lines (e.g. a torn final line) are skipped with
  // a warning.
  static std::vector<OrderLogRecord> readAll(const std::string& path);

 private:
  std::string path_;
  mutable std::mutex mutex_;
  std::ofstream out_;
  std::size_t written_{0};
};

}  // namespace condor

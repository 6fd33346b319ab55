#include "condor/persistence/order_event_log.hpp"
#include "condor/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

namespace condor {

OrderEventLog::OrderEventLog(std::string path) : path_(std::move(path)) {
  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_.is_open()) {
    throw std::runtime_error("cannot open order event log: " + path_);
  }
}

OrderEventLog::~OrderEventLog() { flush(); }

void OrderEventLog::append(const std::string& kind,
                           const domain::Order& order,
                           std::int64_t timestamp_ms,
                           const std::optional<FillDetail>& fill) {
  nlohmann::json record;
  record["ts"] = timestamp_ms;
  record["kind"] = kind;
  record["order"] = order;
  if (fill) {
    record["fill"] = *fill;
  }

  std::lock_guard lock(mutex_);
  out_ << record.dump() << '\n';
  out_.flush();
  if (!out_) {
    std::cerr << "[OrderEventLog] ERROR: write failed on " << path_ << "\n";
    out_.clear();
    return;
  }
  ++written_;
}

void OrderEventLog::flush() {
  std::lock_guard lock(mutex_);
  out_.flush();
}

std::size_t OrderEventLog::recordsWritten() const {
  std::lock_guard lock(mutex_);
  return written_;
}

std::vector<OrderLogRecord> OrderEventLog::readAll(const std::string& path) {
  std::vector<OrderLogRecord> records;
  std::ifstream in(path);
  if (!in.is_open()) {
    return records;
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    try {
      auto j = nlohmann::json::parse(line);
      OrderLogRecord rec;
      rec.timestamp_ms = j.at("ts").get<std::int64_t>();
      rec.kind = j.at("kind").get<std::string>();
      rec.order = j.at("order").get<domain::Order>();
      if (j.contains("fill")) {
        rec.fill = j.at("fill").get<FillDetail>();
      }
      records.push_back(std::move(rec));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[OrderEventLog] WARNING: skipping malformed line "
                << line_no << " of " << path << ": " << e.what() << "\n";
    }
  }
  return records;
}

}  // namespace condor

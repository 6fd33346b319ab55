#pragma once

#include "condor/execution/i_broker_client.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace condor {

struct BrokerEndpoints {
  std::string request_endpoint{"tcp://127.0.0.1:5560"};
  std::string report_endpoint{"tcp://127.0.0.1:5561"};
  int request_timeout_ms{2000};
};

// -----------------------------------------------------------------------------
// ZmqBrokerClient
// -----------------------------------------------------------------------------
//
// @brief  IBrokerClient for a venue gateway speaking JSON over ZeroMQ.
//
// @details
// Two sockets:
//   - REQ to request_endpoint: one JSON command per request, one JSON reply.
//       {"op":"place","token":...,"client_order_id":7,"instrument_id":...,
//        "side":"SELL","quantity":75,"order_type":"MARKET","limit_price":0}
//       {"op":"cancel","token":...,"broker_order_id":"B-1"}
//       {"op":"modify","token":...,"broker_order_id":"B-1","quantity":75,
//        "price":101.5}
//       {"op":"orders","token":...,"orders":[{"client_order_id":7,
//        "broker_order_id":"B-1"}]}
//     Replies carry "ok". A failed reply carries "code" (RejectCode name)
//     and "reason"; it is rethrown as BrokerError.
//   - SUB to report_endpoint: execution reports, e.g.
//       {"type":"fill","client_order_id":7,"broker_order_id":"B-1",
//        "fill_seq":1,"quantity":75,"price":101.5,"ts":...}
//
// A REQ socket that times out is unusable (strict send/recv alternation),
// so it is closed and reopened before the Timeout is thrown.
//
// The session token is opaque; an AUTH_EXPIRED reply is surfaced to the
// ExecutionManager like any other reject code.
//
// Thread model: routing thread only.
// -----------------------------------------------------------------------------
class ZmqBrokerClient : public IBrokerClient {
 public:
  ZmqBrokerClient(BrokerEndpoints endpoints, std::string session_token);
  ~ZmqBrokerClient() override;

  ZmqBrokerClient(const ZmqBrokerClient&) = delete;
  ZmqBrokerClient& operator=(const ZmqBrokerClient&) = delete;

  std::string place(const domain::Order& order) override;
  void cancel(const std::string& broker_order_id) override;
  void modify(const std::string& broker_order_id, std::int64_t new_quantity,
              double new_price) override;
  std::vector<BrokerOrderStatus> fetchOrderStatus(
      const std::vector<domain::Order>& orders) override;
  std::vector<BrokerReportEvent> poll() override;

  // --- Wire codec ------------------------------------------------------------
  static nlohmann::json encodePlace(const domain::Order& order,
                                    const std::string& token);
  // Throws BrokerError when the reply is a failure.
  static void checkReply(const nlohmann::json& reply);
  static std::optional<BrokerReportEvent> decodeReport(
      const std::string& payload);
  static std::vector<BrokerOrderStatus> decodeOrderBook(
      const nlohmann::json& reply);

 private:
  nlohmann::json request(const nlohmann::json& command);
  void openRequestSocket();

  BrokerEndpoints endpoints_;
  std::string token_;

  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> req_socket_;
  zmq::socket_t report_socket_{context_, zmq::socket_type::sub};
};

}  // namespace condor

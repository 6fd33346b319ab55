#pragma once

#include "condor/feed/i_feed_transport.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace condor {

struct FeedEndpoints {
  std::string data_endpoint{"tcp://127.0.0.1:5555"};
  std::string control_endpoint{"tcp://127.0.0.1:5556"};
  int control_timeout_ms{2000};
};

// -----------------------------------------------------------------------------
// ZmqFeedTransport
// -----------------------------------------------------------------------------
//
// @brief  IFeedTransport over ZeroMQ: a SUB socket for the quote stream and a
//         REQ socket for control commands.
//
// @details
// Stream messages are JSON objects:
//   {"type":"tick","instrument_id":"NIFTY-22300-CE","last_price":41.5,
//    "bid":41.4,"ask":41.6,"volume":1200,"timestamp_ms":...}
//   {"type":"heartbeat","timestamp_ms":...}
//   {"type":"close"}                       publisher is going away
//
// Control commands (REQ/REP):
//   {"op":"subscribe","token":...,"instruments":[...]}    -> {"ok":true}
//   {"op":"snapshot","instruments":[...]}                 -> {"ok":true,
//                                                            "ticks":[...]}
//   {"op":"unsubscribe","instruments":[...]}              -> {"ok":true}
//
// The sockets are created by open() and destroyed by close(), so a
// reconnect always starts from fresh sockets.
//
// Malformed stream messages are logged and skipped.
// -----------------------------------------------------------------------------
class ZmqFeedTransport : public IFeedTransport {
 public:
  ZmqFeedTransport(FeedEndpoints endpoints, std::string session_token);
  ~ZmqFeedTransport() override;

  ZmqFeedTransport(const ZmqFeedTransport&) = delete;
  ZmqFeedTransport& operator=(const ZmqFeedTransport&) = delete;

  void open(const std::vector<std::string>& instruments) override;
  void close() override;
  std::optional<FeedMessage> receive(int timeout_ms) override;
  std::vector<domain::Tick> requestSnapshot(
      const std::vector<std::string>& instruments) override;

  // Decodes one stream message. std::nullopt for malformed or unknown
  // messages; throws ConnectionError for {"type":"close"}.
  static std::optional<FeedMessage> decodeMessage(const std::string& payload);

 private:
  // Throws ConnectionError on timeout or a failed reply.
  nlohmann::json control(const nlohmann::json& command);

  FeedEndpoints endpoints_;
  std::string token_;
  std::vector<std::string> subscribed_;

  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> sub_socket_;
  std::unique_ptr<zmq::socket_t> control_socket_;
};

}  // namespace condor

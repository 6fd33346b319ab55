#include "condor/feed/zmq_feed_transport.hpp"
#include "condor/domain/errors.hpp"
#include "condor/persistence/json_codec.hpp"

#include <iostream>
#include <utility>

namespace condor {

ZmqFeedTransport::ZmqFeedTransport(FeedEndpoints endpoints,
                                   std::string session_token)
    : endpoints_(std::move(endpoints)), token_(std::move(session_token)) {}

ZmqFeedTransport::~ZmqFeedTransport() { close(); }

// -----------------------------------------------------------------------------
// open(): fresh sockets plus subscribe handshake
// -----------------------------------------------------------------------------
void ZmqFeedTransport::open(const std::vector<std::string>& instruments) {
  close();

  try {
    sub_socket_ =
        std::make_unique<zmq::socket_t>(context_, zmq::socket_type::sub);
    sub_socket_->set(zmq::sockopt::subscribe, "");
    sub_socket_->set(zmq::sockopt::linger, 0);
    sub_socket_->connect(endpoints_.data_endpoint);

    control_socket_ =
        std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
    control_socket_->set(zmq::sockopt::rcvtimeo,
                         endpoints_.control_timeout_ms);
    control_socket_->set(zmq::sockopt::sndtimeo,
                         endpoints_.control_timeout_ms);
    control_socket_->set(zmq::sockopt::linger, 0);
    control_socket_->connect(endpoints_.control_endpoint);
  } catch (const zmq::error_t& e) {
    sub_socket_.reset();
    control_socket_.reset();
    throw ConnectionError(std::string("feed socket setup failed: ") +
                          e.what());
  }

  control({{"op", "subscribe"}, {"token", token_}, {"instruments", instruments}});
  subscribed_ = instruments;

  std::cout << "[ZmqFeedTransport] subscribed on " << endpoints_.data_endpoint
            << "\n";
}

// -----------------------------------------------------------------------------
// close(): best-effort unsubscribe, then drop the sockets
// -----------------------------------------------------------------------------
void ZmqFeedTransport::close() {
  if (control_socket_ && !subscribed_.empty()) {
    try {
      control({{"op", "unsubscribe"}, {"instruments", subscribed_}});
    } catch (const ConnectionError& e) {
      std::cerr << "[ZmqFeedTransport] unsubscribe failed: " << e.what()
                << "\n";
    }
  }
  subscribed_.clear();
  control_socket_.reset();
  sub_socket_.reset();
}

// -----------------------------------------------------------------------------
// receive()
// -----------------------------------------------------------------------------
std::optional<FeedMessage> ZmqFeedTransport::receive(int timeout_ms) {
  if (!sub_socket_) {
    throw ConnectionError("feed transport is not open");
  }

  zmq::message_t msg;
  zmq::recv_result_t result;
  try {
    sub_socket_->set(zmq::sockopt::rcvtimeo, timeout_ms);
    result = sub_socket_->recv(msg, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return std::nullopt;
    }
    throw ConnectionError(std::string("feed receive failed: ") + e.what());
  }

  if (!result.has_value()) {
    return std::nullopt;
  }
  return decodeMessage(msg.to_string());
}

std::vector<domain::Tick> ZmqFeedTransport::requestSnapshot(
    const std::vector<std::string>& instruments) {
  nlohmann::json reply =
      control({{"op", "snapshot"}, {"instruments", instruments}});

  std::vector<domain::Tick> ticks;
  try {
    for (const auto& t : reply.at("ticks")) {
      ticks.push_back(t.get<domain::Tick>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConnectionError(std::string("malformed snapshot: ") + e.what());
  }
  return ticks;
}

// -----------------------------------------------------------------------------
// control(): one REQ/REP round trip
// -----------------------------------------------------------------------------
nlohmann::json ZmqFeedTransport::control(const nlohmann::json& command) {
  const std::string payload = command.dump();
  const std::string op = command.value("op", "");
  if (!control_socket_) {
    throw ConnectionError("feed control socket is closed (" + op + ")");
  }

  try {
    zmq::message_t out(payload.data(), payload.size());
    if (!control_socket_->send(out, zmq::send_flags::none)) {
      throw ConnectionError("feed control send timed out (" + op + ")");
    }
    zmq::message_t reply_msg;
    if (!control_socket_->recv(reply_msg, zmq::recv_flags::none)) {
      // The REQ socket is stuck waiting for this reply; it cannot be reused.
      control_socket_.reset();
      throw ConnectionError("no reply to feed " + op + " within " +
                            std::to_string(endpoints_.control_timeout_ms) +
                            " ms");
    }

    nlohmann::json reply = nlohmann::json::parse(reply_msg.to_string());
    if (!reply.value("ok", false)) {
      throw ConnectionError("feed refused " + op + ": " +
                            reply.value("reason", "no reason given"));
    }
    return reply;
  } catch (const zmq::error_t& e) {
    control_socket_.reset();
    throw ConnectionError("feed control error (" + op + "): " + e.what());
  } catch (const nlohmann::json::exception& e) {
    throw ConnectionError("malformed feed control reply (" + op +
                          "): " + e.what());
  }
}

// -----------------------------------------------------------------------------
// decodeMessage()
// -----------------------------------------------------------------------------
std::optional<FeedMessage> ZmqFeedTransport::decodeMessage(
    const std::string& payload) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqFeedTransport] JSON parse error: " << e.what()
              << " - payload: " << payload << "\n";
    return std::nullopt;
  }

  const std::string type = j.value("type", "tick");
  if (type == "close") {
    throw ConnectionError("publisher closed the stream");
  }

  try {
    if (type == "heartbeat") {
      return FeedMessage{Heartbeat{j.value("timestamp_ms", std::int64_t{0})}};
    }
    if (type == "tick") {
      return FeedMessage{j.get<domain::Tick>()};
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqFeedTransport] bad " << type << " message: " << e.what()
              << " - payload: " << payload << "\n";
    return std::nullopt;
  }

  std::cerr << "[ZmqFeedTransport] unknown message type '" << type
            << "'. Dropped.\n";
  return std::nullopt;
}

}  // namespace condor

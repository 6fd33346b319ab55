#include "condor/execution/zmq_broker_client.hpp"
#include "condor/domain/errors.hpp"
#include "condor/persistence/json_codec.hpp"

#include <iostream>
#include <utility>

namespace condor {

namespace {

VenueOrderState parseVenueState(const std::string& text) {
  if (text == "open") return VenueOrderState::Open;
  if (text == "filled") return VenueOrderState::Filled;
  if (text == "rejected") return VenueOrderState::Rejected;
  if (text == "cancelled") return VenueOrderState::Cancelled;
  return VenueOrderState::NotFound;
}

domain::RejectCode codeOf(const nlohmann::json& j) {
  if (!j.contains("code")) {
    return domain::RejectCode::Unknown;
  }
  return domain::parseRejectCode(j.at("code").get<std::string>())
      .value_or(domain::RejectCode::Unknown);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: REQ for commands, SUB for reports
// -----------------------------------------------------------------------------
ZmqBrokerClient::ZmqBrokerClient(BrokerEndpoints endpoints,
                                 std::string session_token)
    : endpoints_(std::move(endpoints)), token_(std::move(session_token)) {
  openRequestSocket();

  report_socket_.set(zmq::sockopt::subscribe, "");
  report_socket_.set(zmq::sockopt::rcvtimeo, 0);
  report_socket_.connect(endpoints_.report_endpoint);

  std::cout << "[ZmqBrokerClient] REQ=" << endpoints_.request_endpoint
            << " SUB=" << endpoints_.report_endpoint << "\n";
}

ZmqBrokerClient::~ZmqBrokerClient() = default;

void ZmqBrokerClient::openRequestSocket() {
  req_socket_ = std::make_unique<zmq::socket_t>(context_,
                                                zmq::socket_type::req);
  req_socket_->set(zmq::sockopt::rcvtimeo, endpoints_.request_timeout_ms);
  req_socket_->set(zmq::sockopt::sndtimeo, endpoints_.request_timeout_ms);
  req_socket_->set(zmq::sockopt::linger, 0);
  req_socket_->connect(endpoints_.request_endpoint);
}

// -----------------------------------------------------------------------------
// request(): one round trip
// -----------------------------------------------------------------------------
nlohmann::json ZmqBrokerClient::request(const nlohmann::json& command) {
  const std::string payload = command.dump();

  try {
    zmq::message_t out(payload.data(), payload.size());
    if (!req_socket_->send(out, zmq::send_flags::none)) {
      openRequestSocket();
      throw BrokerError(domain::RejectCode::Timeout, "broker send timed out");
    }

    zmq::message_t reply;
    if (!req_socket_->recv(reply, zmq::recv_flags::none)) {
      openRequestSocket();
      throw BrokerError(domain::RejectCode::Timeout,
                        "no reply from broker within " +
                            std::to_string(endpoints_.request_timeout_ms) +
                            " ms");
    }
    return nlohmann::json::parse(reply.to_string());
  } catch (const zmq::error_t& e) {
    openRequestSocket();
    throw BrokerError(domain::RejectCode::NetworkError, e.what());
  } catch (const nlohmann::json::exception& e) {
    throw BrokerError(domain::RejectCode::Unknown,
                      std::string("malformed broker reply: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// IBrokerClient
// -----------------------------------------------------------------------------
std::string ZmqBrokerClient::place(const domain::Order& order) {
  nlohmann::json reply = request(encodePlace(order, token_));
  checkReply(reply);
  return reply.at("broker_order_id").get<std::string>();
}

void ZmqBrokerClient::cancel(const std::string& broker_order_id) {
  nlohmann::json reply = request({{"op", "cancel"},
                                  {"token", token_},
                                  {"broker_order_id", broker_order_id}});
  checkReply(reply);
}

void ZmqBrokerClient::modify(const std::string& broker_order_id,
                             std::int64_t new_quantity, double new_price) {
  nlohmann::json reply = request({{"op", "modify"},
                                  {"token", token_},
                                  {"broker_order_id", broker_order_id},
                                  {"quantity", new_quantity},
                                  {"price", new_price}});
  checkReply(reply);
}

std::vector<BrokerOrderStatus> ZmqBrokerClient::fetchOrderStatus(
    const std::vector<domain::Order>& orders) {
  nlohmann::json ids = nlohmann::json::array();
  for (const auto& order : orders) {
    ids.push_back({{"client_order_id", order.id},
                   {"broker_order_id", order.broker_order_id}});
  }
  nlohmann::json reply =
      request({{"op", "orders"}, {"token", token_}, {"orders", ids}});
  checkReply(reply);
  try {
    return decodeOrderBook(reply);
  } catch (const nlohmann::json::exception& e) {
    throw BrokerError(domain::RejectCode::Unknown,
                      std::string("malformed order book: ") + e.what());
  }
}

std::vector<BrokerReportEvent> ZmqBrokerClient::poll() {
  std::vector<BrokerReportEvent> reports;
  while (true) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = report_socket_.recv(msg, zmq::recv_flags::dontwait);
    } catch (const zmq::error_t& e) {
      throw BrokerError(domain::RejectCode::NetworkError, e.what());
    }
    if (!result.has_value()) {
      break;
    }
    if (auto report = decodeReport(msg.to_string())) {
      reports.push_back(std::move(*report));
    }
  }
  return reports;
}

// -----------------------------------------------------------------------------
// Wire codec
// -----------------------------------------------------------------------------
nlohmann::json ZmqBrokerClient::encodePlace(const domain::Order& order,
                                            const std::string& token) {
  return nlohmann::json{{"op", "place"},
                        {"token", token},
                        {"client_order_id", order.id},
                        {"instrument_id", order.instrument_id},
                        {"side", order.side},
                        {"quantity", order.quantity},
                        {"order_type", order.order_type},
                        {"limit_price", order.limit_price}};
}

void ZmqBrokerClient::checkReply(const nlohmann::json& reply) {
  if (reply.value("ok", false)) {
    return;
  }
  throw BrokerError(codeOf(reply), reply.value("reason", "broker refused"));
}

std::optional<BrokerReportEvent> ZmqBrokerClient::decodeReport(
    const std::string& payload) {
  try {
    auto j = nlohmann::json::parse(payload);
    const std::string type = j.at("type").get<std::string>();

    BrokerReportEvent report;
    if (type == "ack") {
      report.kind = BrokerReportEvent::Kind::Ack;
    } else if (type == "fill") {
      report.kind = BrokerReportEvent::Kind::Fill;
      report.fill_seq = j.at("fill_seq").get<std::uint64_t>();
      report.fill_quantity = j.at("quantity").get<std::int64_t>();
      report.fill_price = j.at("price").get<double>();
    } else if (type == "reject") {
      report.kind = BrokerReportEvent::Kind::Reject;
      report.code = codeOf(j);
      report.reason = j.value("reason", "");
    } else if (type == "cancelled") {
      report.kind = BrokerReportEvent::Kind::Cancelled;
    } else {
      std::cerr << "[ZmqBrokerClient] unknown report type '" << type
                << "'. Dropped.\n";
      return std::nullopt;
    }
    report.client_order_id = j.value("client_order_id", std::uint64_t{0});
    report.broker_order_id = j.value("broker_order_id", "");
    report.timestamp_ms = j.value("ts", std::int64_t{0});
    return report;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqBrokerClient] JSON parse error: " << e.what()
              << " - payload: " << payload << "\n";
    return std::nullopt;
  }
}

std::vector<BrokerOrderStatus> ZmqBrokerClient::decodeOrderBook(
    const nlohmann::json& reply) {
  std::vector<BrokerOrderStatus> rows;
  for (const auto& o : reply.at("orders")) {
    BrokerOrderStatus row;
    row.client_order_id = o.value("client_order_id", std::uint64_t{0});
    row.broker_order_id = o.value("broker_order_id", "");
    row.state = parseVenueState(o.value("state", "not_found"));
    if (o.contains("fills")) {
      for (const auto& f : o.at("fills")) {
        row.fills.push_back(BrokerFill{f.at("fill_seq").get<std::uint64_t>(),
                                       f.at("quantity").get<std::int64_t>(),
                                       f.at("price").get<double>()});
      }
    }
    row.code = codeOf(o);
    row.reason = o.value("reason", "");
    rows.push_back(std::move(row));
  }
  return rows;
}

}  // namespace condor

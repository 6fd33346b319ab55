#include "condor/persistence/json_codec.hpp"

namespace condor {
namespace domain {

void to_json(nlohmann::json& j, const Tick& tick) {
  j = nlohmann::json{{"instrument_id", tick.instrument_id},
                     {"last_price", tick.last_price},
                     {"bid", tick.bid},
                     {"ask", tick.ask},
                     {"volume", tick.volume},
                     {"timestamp_ms", tick.timestamp_ms}};
}

// bid/ask/volume are optional on input; a tick file may carry trades only.
void from_json(const nlohmann::json& j, Tick& tick) {
  j.at("instrument_id").get_to(tick.instrument_id);
  j.at("timestamp_ms").get_to(tick.timestamp_ms);
  tick.last_price = j.value("last_price", 0.0);
  tick.bid = j.value("bid", 0.0);
  tick.ask = j.value("ask", 0.0);
  tick.volume = j.value("volume", 0.0);
}

void to_json(nlohmann::json& j, const OptionLeg& leg) {
  j = nlohmann::json{{"strike", leg.strike},
                     {"option_type", leg.option_type},
                     {"expiry_ms", leg.expiry_ms},
                     {"instrument_id", leg.instrument_id},
                     {"side", leg.side},
                     {"quantity", leg.quantity},
                     {"entry_price", leg.entry_price},
                     {"role", leg.role},
                     {"open_quantity", leg.open_quantity},
                     {"closed_quantity", leg.closed_quantity},
                     {"exit_price", leg.exit_price}};
}

void from_json(const nlohmann::json& j, OptionLeg& leg) {
  j.at("strike").get_to(leg.strike);
  j.at("option_type").get_to(leg.option_type);
  j.at("expiry_ms").get_to(leg.expiry_ms);
  j.at("instrument_id").get_to(leg.instrument_id);
  j.at("side").get_to(leg.side);
  j.at("quantity").get_to(leg.quantity);
  j.at("entry_price").get_to(leg.entry_price);
  j.at("role").get_to(leg.role);
  j.at("open_quantity").get_to(leg.open_quantity);
  leg.closed_quantity = j.value("closed_quantity", std::int64_t{0});
  leg.exit_price = j.value("exit_price", 0.0);
}

void to_json(nlohmann::json& j, const Order& order) {
  j = nlohmann::json{{"id", order.id},
                     {"position_id", order.position_id},
                     {"leg_index", order.leg_index},
                     {"purpose", order.purpose},
                     {"instrument_id", order.instrument_id},
                     {"side", order.side},
                     {"quantity", order.quantity},
                     {"order_type", order.order_type},
                     {"limit_price", order.limit_price},
                     {"status", order.status},
                     {"broker_order_id", order.broker_order_id},
                     {"retries", order.retries},
                     {"filled_quantity", order.filled_quantity},
                     {"avg_fill_price", order.avg_fill_price},
                     {"created_ms", order.created_ms},
                     {"cancel_requested", order.cancel_requested},
                     {"reject_reason", order.reject_reason}};
  if (order.reject_code) {
    j["reject_code"] = *order.reject_code;
  }
}

void from_json(const nlohmann::json& j, Order& order) {
  j.at("id").get_to(order.id);
  j.at("position_id").get_to(order.position_id);
  j.at("leg_index").get_to(order.leg_index);
  j.at("purpose").get_to(order.purpose);
  j.at("instrument_id").get_to(order.instrument_id);
  j.at("side").get_to(order.side);
  j.at("quantity").get_to(order.quantity);
  j.at("order_type").get_to(order.order_type);
  order.limit_price = j.value("limit_price", 0.0);
  j.at("status").get_to(order.status);
  order.broker_order_id = j.value("broker_order_id", std::string{});
  order.retries = j.value("retries", 0);
  j.at("filled_quantity").get_to(order.filled_quantity);
  order.avg_fill_price = j.value("avg_fill_price", 0.0);
  order.created_ms = j.value("created_ms", std::int64_t{0});
  order.cancel_requested = j.value("cancel_requested", false);
  order.reject_reason = j.value("reject_reason", std::string{});
  if (j.contains("reject_code")) {
    order.reject_code = j.at("reject_code").get<RejectCode>();
  }
}

void to_json(nlohmann::json& j, const Position& position) {
  j = nlohmann::json{{"id", position.id},
                     {"strategy_name", position.strategy_name},
                     {"index", position.index},
                     {"legs", position.legs},
                     {"state", position.state},
                     {"entry_time_ms", position.entry_time_ms},
                     {"realized_pnl", position.realized_pnl},
                     {"unrealized_pnl", position.unrealized_pnl},
                     {"closed_time_ms", position.closed_time_ms},
                     {"exit_attempts", position.exit_attempts}};
  if (position.roll) {
    nlohmann::json replacements = nlohmann::json::array();
    for (const auto& r : position.roll->replacements) {
      replacements.push_back(
          {{"leg_index", r.leg_index}, {"replacement", r.replacement}});
    }
    j["roll"] = {{"replacements", std::move(replacements)},
                 {"breach_delta", position.roll->breach_delta},
                 {"started_ms", position.roll->started_ms}};
  }
  if (position.last_rejection) {
    j["last_rejection"] = *position.last_rejection;
  }
  if (position.exit_reason) {
    j["exit_reason"] = *position.exit_reason;
  }
}

void from_json(const nlohmann::json& j, Position& position) {
  j.at("id").get_to(position.id);
  j.at("strategy_name").get_to(position.strategy_name);
  j.at("index").get_to(position.index);
  j.at("legs").get_to(position.legs);
  j.at("state").get_to(position.state);
  j.at("entry_time_ms").get_to(position.entry_time_ms);
  j.at("realized_pnl").get_to(position.realized_pnl);
  position.unrealized_pnl = j.value("unrealized_pnl", 0.0);
  position.closed_time_ms = j.value("closed_time_ms", std::int64_t{0});
  position.exit_attempts = j.value("exit_attempts", 0);

  position.roll.reset();
  if (j.contains("roll")) {
    const auto& r = j.at("roll");
    RollPlan plan;
    for (const auto& item : r.at("replacements")) {
      LegReplacement rep;
      item.at("leg_index").get_to(rep.leg_index);
      item.at("replacement").get_to(rep.replacement);
      plan.replacements.push_back(std::move(rep));
    }
    plan.breach_delta = r.value("breach_delta", 0.0);
    plan.started_ms = r.value("started_ms", std::int64_t{0});
    position.roll = std::move(plan);
  }
  position.last_rejection.reset();
  if (j.contains("last_rejection")) {
    position.last_rejection = j.at("last_rejection").get<RejectCode>();
  }
  position.exit_reason.reset();
  if (j.contains("exit_reason")) {
    position.exit_reason = j.at("exit_reason").get<ExitReason>();
  }
}

}  // namespace domain

void to_json(nlohmann::json& j, const FillDetail& fill) {
  j = nlohmann::json{{"quantity", fill.quantity},
                     {"price", fill.price},
                     {"fill_seq", fill.fill_seq}};
}

void from_json(const nlohmann::json& j, FillDetail& fill) {
  j.at("quantity").get_to(fill.quantity);
  j.at("price").get_to(fill.price);
  j.at("fill_seq").get_to(fill.fill_seq);
}

}  // namespace condor

#include "trade_types.hpp"

#include <nlohmann/json.hpp>

const char* venue_name(Venue v) {
    return v == Venue::Kalshi ? "kalshi" : "polymarket";
}

const char* side_name(TradeSide s) {
    return s == TradeSide::Buy ? "buy" : "sell";
}

const char* lifetime_tag(OrderLifetime l) {
    return l == OrderLifetime::FillOrKill ? "FOK" : "GTC";
}

TradeResult TradeResult::ok(Venue v, std::string order_id) {
    TradeResult r;
    r.success = true;
    r.venue = v;
    r.order_id = std::move(order_id);
    return r;
}

TradeResult TradeResult::failed(Venue v, ErrorKind kind, std::string message) {
    TradeResult r;
    r.success = false;
    r.venue = v;
    r.error_kind = kind;
    r.error_message = std::move(message);
    return r;
}

nlohmann::json TradeResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    j["venue"] = venue_name(venue);
    if (!order_id.empty()) j["orderId"] = order_id;
    if (!tx_hash.empty()) j["txHash"] = tx_hash;
    if (error_kind) {
        j["error"] = {{"code", error_code(*error_kind)}, {"message", error_message}};
    }
    return j;
}

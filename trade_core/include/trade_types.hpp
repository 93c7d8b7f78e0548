#pragma once
#include "trade_errors.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>

enum class Venue { Kalshi, Polymarket };
enum class TradeSide { Buy, Sell };

// Order lifetime tag: resting good-till-cancelled or fill-or-kill
enum class OrderLifetime { GoodTillCancel, FillOrKill };

const char* venue_name(Venue v);
const char* side_name(TradeSide s);
const char* lifetime_tag(OrderLifetime l);

struct MarketRef {
    Venue venue{Venue::Polymarket};
    std::string id;              // Kalshi ticker / Polymarket condition id
    std::string title;
    bool neg_risk{false};        // Polymarket negative-risk instrument
    double min_order_size{0.0};  // venue minimum in shares, 0 = unknown
};

struct OutcomeRef {
    std::string name;            // "Yes" / "No" / named outcome
    std::string token_id;        // Polymarket outcome token (decimal uint256)
    double price{0.0};           // probability price in (0, 1)
};

struct TradeRequest {
    MarketRef market;
    OutcomeRef outcome;
    double amount{0.0};          // USD notional
    TradeSide side{TradeSide::Buy};
    OrderLifetime lifetime{OrderLifetime::GoodTillCancel};
};

struct TradeResult {
    bool success{false};
    Venue venue{Venue::Polymarket};
    std::string order_id;
    std::string tx_hash;
    std::optional<ErrorKind> error_kind;
    std::string error_message;

    static TradeResult ok(Venue v, std::string order_id);
    static TradeResult failed(Venue v, ErrorKind kind, std::string message);

    nlohmann::json to_json() const;
};

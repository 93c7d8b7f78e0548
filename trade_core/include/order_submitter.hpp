#pragma once
#include "kalshi_client.hpp"
#include "order_signer.hpp"
#include "polymarket_client.hpp"
#include "trade_types.hpp"

#include <string>

// Turns a validated TradeRequest into a venue order and submits it once.
// Venue rejection surfaces as VenueRejectedOrderError; nothing is retried.
class OrderSubmitter {
public:
    // Either venue may be absent (nullptr); submitting to it then throws ConfigurationError
    OrderSubmitter(KalshiClient* kalshi, PolymarketClient* polymarket, const OrderTypedDataSigner* order_signer);

    // Throws InvalidOrderError: amount outside [$1, $100000], price outside (0, 1),
    // missing instrument, or below the venue minimum
    static void validate(const TradeRequest& req);

    static KalshiOrderRequest plan_kalshi_order(const TradeRequest& req);

    // Fresh salt, 24h expiry, maker = proxy, signer = owner EOA
    static OrderFields plan_polymarket_order(const TradeRequest& req, const std::string& proxy,
                                             const std::string& owner);

    // proxy is ignored for Kalshi
    TradeResult build_and_submit(const TradeRequest& req, const std::string& proxy = "");

private:
    KalshiClient* kalshi_;
    PolymarketClient* polymarket_;
    const OrderTypedDataSigner* order_signer_;
};

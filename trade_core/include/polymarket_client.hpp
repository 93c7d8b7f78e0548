#pragma once
#include "builder_signer.hpp"
#include "http_client.hpp"
#include "order_signer.hpp"
#include "trade_config.hpp"
#include "trade_types.hpp"

#include <nlohmann/json.hpp>

#include <string>

struct ClobOrderAck {
    std::string order_id;
    std::string status;
};

// Polymarket CLOB order endpoint. Requests carry builder attribution headers.
class PolymarketClient {
public:
    // builder may be null; orders are then posted without attribution
    PolymarketClient(IHttpClient& http, IBuilderHeaderSigner* builder, const TradeConfig& cfg);

    // {order, owner, orderType, negRisk}
    static nlohmann::json order_body(const SignedOrder& order, const std::string& owner,
                                     OrderLifetime lifetime, bool neg_risk);

    // Throws VenueRejectedOrderError with the CLOB's message on non-2xx,
    // success:false or a reply without an order id
    ClobOrderAck post_order(const SignedOrder& order, OrderLifetime lifetime, bool neg_risk);

private:
    IHttpClient& http_;
    IBuilderHeaderSigner* builder_;
    std::string base_url_;
    long timeout_ms_;
};

#pragma once
#include "http_client.hpp"
#include "kalshi_request_signer.hpp"
#include "trade_config.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

struct KalshiOrderRequest {
    std::string ticker;
    std::string side = "yes";      // yes / no
    std::string action = "buy";    // buy / sell
    long long count{0};            // contracts
    std::string type = "market";   // market / limit
    std::optional<int> price_cents; // 1..99, required for limit orders
};

struct KalshiOrderAck {
    std::string order_id;
    std::string status;
};

// Kalshi trade API v2. All authenticated requests are RSA-PSS signed over
// the full URL path (including the /trade-api/v2 prefix).
class KalshiClient {
public:
    // Without credentials the client is constructed unconfigured; every
    // authenticated call then throws ConfigurationError without touching the network.
    // Malformed credentials throw ConfigurationError here.
    KalshiClient(IHttpClient& http, const TradeConfig& cfg);

    bool configured() const { return signer_ != nullptr; }

    // Throws InvalidOrderError for an order the venue would reject on shape
    static nlohmann::json build_order_body(const KalshiOrderRequest& o);

    KalshiOrderAck place_order(const KalshiOrderRequest& o);

    // Available cash in USD
    double get_balance();

private:
    // Non-2xx: VenueRejectedOrderError for POST, TransportError otherwise
    nlohmann::json request(const std::string& method, const std::string& endpoint,
                           const std::string& body = "");

    IHttpClient& http_;
    std::string base_url_;
    long timeout_ms_;
    std::unique_ptr<KalshiRequestSigner> signer_;
};

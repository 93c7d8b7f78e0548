#include "kalshi_client.hpp"
#include "json_fields.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"

#include <chrono>

static std::string now_ms_string() {
    using namespace std::chrono;
    return std::to_string(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

KalshiClient::KalshiClient(IHttpClient& http, const TradeConfig& cfg)
    : http_(http), base_url_(cfg.kalshi_api_url), timeout_ms_(cfg.http_timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();

    if (cfg.kalshi.present()) {
        signer_ = std::make_unique<KalshiRequestSigner>(cfg.kalshi);
        log_info("KALSHI", "credentials loaded for key " + signer_->key_id());
    } else {
        log_info("KALSHI", "no API credentials, Kalshi trading disabled");
    }
}

nlohmann::json KalshiClient::build_order_body(const KalshiOrderRequest& o) {
    if (o.ticker.empty()) throw InvalidOrderError("Kalshi order needs a market ticker");
    if (o.side != "yes" && o.side != "no") throw InvalidOrderError("Kalshi side must be yes or no, got '" + o.side + "'");
    if (o.action != "buy" && o.action != "sell") throw InvalidOrderError("Kalshi action must be buy or sell");
    if (o.count <= 0) throw InvalidOrderError("Amount too small for minimum contract size");
    if (o.type != "market" && o.type != "limit") throw InvalidOrderError("Kalshi order type must be market or limit");
    if (o.type == "limit" && !o.price_cents) throw InvalidOrderError("Kalshi limit order needs a price");
    if (o.price_cents && (*o.price_cents < 1 || *o.price_cents > 99)) {
        throw InvalidOrderError("Kalshi price must be between 1 and 99 cents, got " + std::to_string(*o.price_cents));
    }

    nlohmann::json j;
    j["ticker"] = o.ticker;
    j["side"] = o.side;
    j["action"] = o.action;
    j["count"] = o.count;
    j["type"] = o.type;
    if (o.price_cents) {
        j[o.side == "yes" ? "yes_price" : "no_price"] = *o.price_cents;
    }
    return j;
}

nlohmann::json KalshiClient::request(const std::string& method, const std::string& endpoint,
                                     const std::string& body) {
    if (!signer_) throw ConfigurationError("Kalshi API credentials not configured");

    HttpRequest req;
    req.method = method;
    req.url = base_url_ + endpoint;
    req.body = body;
    req.timeout_ms = timeout_ms_;
    req.headers = signer_->auth_headers(now_ms_string(), method, split_url(req.url).path);

    HttpResponse resp = http_.send(req);

    nlohmann::json j = nlohmann::json::parse(resp.body, nullptr, false);
    if (!resp.ok()) {
        std::string msg = j.is_discarded() ? resp.body : first_text(j, kErrorMessageFields);
        if (msg.empty()) msg = j.dump();
        const std::string text = "Kalshi API error: " + std::to_string(resp.status) + " - " + msg;
        if (method == "POST") throw VenueRejectedOrderError(text);
        throw TransportError(text);
    }
    if (j.is_discarded()) {
        throw TransportError("Kalshi returned a non-JSON body for " + method + " " + endpoint);
    }
    return j;
}

KalshiOrderAck KalshiClient::place_order(const KalshiOrderRequest& o) {
    const nlohmann::json body = build_order_body(o);
    if (!signer_) throw ConfigurationError("Kalshi API credentials not configured");

    log_info("KALSHI", "order " + o.action + " " + std::to_string(o.count) + "x " + o.ticker + " " + o.side);
    const nlohmann::json j = request("POST", "/portfolio/orders", body.dump());

    KalshiOrderAck ack;
    ack.order_id = first_text(j, kOrderIdFields);
    ack.status = first_text(j, {"/order/status", "/status"});
    if (ack.order_id.empty()) {
        throw VenueRejectedOrderError("Kalshi accepted the request but returned no order id");
    }
    log_info("KALSHI", "order accepted id=" + ack.order_id);
    return ack;
}

double KalshiClient::get_balance() {
    const nlohmann::json j = request("GET", "/portfolio/balance");

    const std::string cents = first_text(j, {"/balance", "/available_balance"});
    if (cents.empty()) throw TransportError("Kalshi balance reply has no balance field");
    return std::stod(cents) / 100.0;
}

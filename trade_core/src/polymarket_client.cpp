#include "polymarket_client.hpp"
#include "json_fields.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"

PolymarketClient::PolymarketClient(IHttpClient& http, IBuilderHeaderSigner* builder, const TradeConfig& cfg)
    : http_(http), builder_(builder), base_url_(cfg.clob_url), timeout_ms_(cfg.http_timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

nlohmann::json PolymarketClient::order_body(const SignedOrder& order, const std::string& owner,
                                            OrderLifetime lifetime, bool neg_risk) {
    nlohmann::json j;
    j["order"] = order.to_json();
    j["owner"] = owner;
    j["orderType"] = lifetime_tag(lifetime);
    j["negRisk"] = neg_risk;
    return j;
}

ClobOrderAck PolymarketClient::post_order(const SignedOrder& order, OrderLifetime lifetime, bool neg_risk) {
    const std::string body = order_body(order, order.fields().signer, lifetime, neg_risk).dump();
    const std::string path = "/order";

    HttpRequest req;
    req.method = "POST";
    req.url = base_url_ + path;
    req.body = body;
    req.timeout_ms = timeout_ms_;
    if (builder_) {
        req.headers = builder_->headers({"POST", path, body, now_unix_seconds()});
    }

    HttpResponse resp = http_.send(req);

    nlohmann::json j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded()) {
        throw VenueRejectedOrderError("CLOB returned HTTP " + std::to_string(resp.status) + " with a non-JSON body");
    }
    if (!resp.ok() || (j.is_object() && j.contains("success") && j["success"].is_boolean() && !j["success"].get<bool>())) {
        std::string msg = first_text(j, kErrorMessageFields);
        if (msg.empty()) msg = "HTTP " + std::to_string(resp.status);
        log_warn("CLOB", "order rejected: " + msg);
        throw VenueRejectedOrderError(msg);
    }

    ClobOrderAck ack;
    ack.order_id = first_text(j, kOrderIdFields);
    ack.status = first_text(j, {"/status"});
    if (ack.status.empty()) ack.status = "PENDING";
    if (ack.order_id.empty()) throw VenueRejectedOrderError("CLOB accepted the request but returned no order id");

    log_info("CLOB", "order accepted id=" + ack.order_id + " status=" + ack.status);
    return ack;
}

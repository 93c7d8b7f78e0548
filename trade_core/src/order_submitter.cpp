#include "order_submitter.hpp"
#include "contracts.hpp"
#include "crypto_utils.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

static long long to_base_units(double v) {
    return std::llround(v * std::pow(10.0, kUsdcDecimals));
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string fmt_usd(double v) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(2);
    os << v;
    return os.str();
}

OrderSubmitter::OrderSubmitter(KalshiClient* kalshi, PolymarketClient* polymarket,
                               const OrderTypedDataSigner* order_signer)
    : kalshi_(kalshi), polymarket_(polymarket), order_signer_(order_signer)
{}

void OrderSubmitter::validate(const TradeRequest& req) {
    if (!(req.amount > 0.0)) throw InvalidOrderError("amount must be positive");
    if (req.amount < kMinOrderAmountUsd) throw InvalidOrderError("minimum order is $" + fmt_usd(kMinOrderAmountUsd));
    if (req.amount > kMaxOrderAmountUsd) throw InvalidOrderError("maximum order is $" + fmt_usd(kMaxOrderAmountUsd));
    if (!(req.outcome.price > 0.0 && req.outcome.price < 1.0)) {
        throw InvalidOrderError("outcome price must be between 0 and 1");
    }

    if (req.market.venue == Venue::Kalshi) {
        if (req.market.id.empty()) throw InvalidOrderError("Kalshi order needs a market ticker");
        if (std::floor(req.amount / req.outcome.price + 1e-9) < 1.0) {
            throw InvalidOrderError("Amount too small for minimum contract size");
        }
        return;
    }

    if (req.outcome.token_id.empty()) throw InvalidOrderError("Polymarket order needs an outcome token id");
    const double shares = req.amount / req.outcome.price;
    if (req.market.min_order_size > 0.0 && shares + 1e-9 < req.market.min_order_size) {
        std::ostringstream os;
        os << "order of " << shares << " shares is below the market minimum of " << req.market.min_order_size;
        throw InvalidOrderError(os.str());
    }
}

KalshiOrderRequest OrderSubmitter::plan_kalshi_order(const TradeRequest& req) {
    KalshiOrderRequest o;
    o.ticker = req.market.id;
    o.side = lower(req.outcome.name) == "yes" ? "yes" : "no";
    o.action = side_name(req.side);
    o.count = static_cast<long long>(std::floor(req.amount / req.outcome.price + 1e-9));
    if (req.lifetime == OrderLifetime::FillOrKill) {
        o.type = "market";
    } else {
        o.type = "limit";
        o.price_cents = static_cast<int>(std::lround(req.outcome.price * 100.0));
    }
    return o;
}

OrderFields OrderSubmitter::plan_polymarket_order(const TradeRequest& req, const std::string& proxy,
                                                  const std::string& owner) {
    const long long cost = to_base_units(req.amount);
    const long long shares = to_base_units(req.amount / req.outcome.price);

    OrderFields f;
    f.salt = generate_salt();
    f.maker = proxy;
    f.signer = owner;
    f.taker = kZeroAddress;
    f.token_id = req.outcome.token_id;
    if (req.side == TradeSide::Buy) {
        f.side = OrderSide::Buy;
        f.maker_amount = std::to_string(cost);
        f.taker_amount = std::to_string(shares);
    } else {
        f.side = OrderSide::Sell;
        f.maker_amount = std::to_string(shares);
        f.taker_amount = std::to_string(cost);
    }
    f.expiration = now_unix_seconds() + kOrderLifetimeSeconds;
    f.nonce = "0";
    f.fee_rate_bps = "0";
    f.signature_type = SignatureType::PolyGnosisSafe;
    return f;
}

TradeResult OrderSubmitter::build_and_submit(const TradeRequest& req, const std::string& proxy) {
    validate(req);

    if (req.market.venue == Venue::Kalshi) {
        if (!kalshi_ || !kalshi_->configured()) throw ConfigurationError("Kalshi trading is not configured");
        const KalshiOrderAck ack = kalshi_->place_order(plan_kalshi_order(req));
        return TradeResult::ok(Venue::Kalshi, ack.order_id);
    }

    if (!polymarket_ || !order_signer_) throw ConfigurationError("Polymarket trading is not configured");
    if (proxy.empty()) throw ProxyNotDeployedError("no proxy wallet address for Polymarket order");

    const RiskCategory risk = req.market.neg_risk ? RiskCategory::NegRisk : RiskCategory::Standard;
    const OrderFields f = plan_polymarket_order(req, proxy, order_signer_->wallet_address());
    const SignedOrder order = order_signer_->sign(f, risk);

    log_info("ORDER", std::string(side_name(req.side)) + " $" + fmt_usd(req.amount) + " token=" + f.token_id +
                      " maker=" + f.maker_amount + " taker=" + f.taker_amount +
                      (risk == RiskCategory::NegRisk ? " neg-risk" : ""));

    const ClobOrderAck ack = polymarket_->post_order(order, req.lifetime, req.market.neg_risk);
    return TradeResult::ok(Venue::Polymarket, ack.order_id);
}

#include "trade_orchestrator.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"

#include <sstream>

static std::string usd(double v) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(2);
    os << "$" << v;
    return os.str();
}

TradeOrchestrator::TradeOrchestrator(OrderSubmitter& submitter, KalshiClient* kalshi,
                                     ProxyWalletManager* wallets, IWalletSigner* owner_wallet)
    : submitter_(submitter), kalshi_(kalshi), wallets_(wallets), owner_wallet_(owner_wallet)
{}

TradeResult TradeOrchestrator::execute_trade(const TradeRequest& req, const CancelToken* cancel) {
    const Venue venue = req.market.venue;
    try {
        OrderSubmitter::validate(req);
        TradeResult r = (venue == Venue::Kalshi) ? execute_kalshi(req) : execute_polymarket(req, cancel);
        log_info("TRADE", std::string(venue_name(venue)) + " " + side_name(req.side) + " " + usd(req.amount) +
                          " ok order=" + r.order_id);
        return r;
    } catch (const TradeError& e) {
        log_warn("TRADE", std::string(venue_name(venue)) + " " + side_name(req.side) + " failed [" +
                          e.code() + "] " + e.what());
        return TradeResult::failed(venue, e.kind(), e.what());
    } catch (const std::exception& e) {
        log_error("TRADE", std::string("unexpected failure: ") + e.what());
        return TradeResult::failed(venue, ErrorKind::Network, e.what());
    }
}

TradeResult TradeOrchestrator::execute_kalshi(const TradeRequest& req) {
    if (!kalshi_ || !kalshi_->configured()) throw ConfigurationError("Kalshi trading is not configured");

    if (req.side == TradeSide::Buy) {
        const double balance = kalshi_->get_balance();
        if (balance < req.amount) {
            throw InsufficientBalanceError("Kalshi balance " + usd(balance) + " is below order amount " + usd(req.amount));
        }
    }
    return submitter_.build_and_submit(req);
}

TradeResult TradeOrchestrator::execute_polymarket(const TradeRequest& req, const CancelToken* cancel) {
    if (!wallets_ || !owner_wallet_) throw ConfigurationError("Polymarket trading is not configured (no wallet)");

    const std::string owner = owner_wallet_->address();

    std::optional<ProxyWalletRecord> rec = wallets_->record(owner);
    // a deploy whose proxy lookup failed leaves Deployed with no address
    if (!rec || rec->state == WalletState::Unknown || (rec->deployed() && rec->proxy_address.empty())) {
        rec = wallets_->check_status(owner);
    }
    if (!rec->deployed() || rec->proxy_address.empty()) {
        throw ProxyNotDeployedError(std::string("proxy wallet is ") + wallet_state_name(rec->state) +
                                    "; deploy it before trading");
    }

    if (req.side == TradeSide::Buy) {
        const double balance = wallets_->usdc_balance(owner);
        if (balance < req.amount) {
            throw InsufficientBalanceError("proxy wallet balance " + usd(balance) + " is below order amount " +
                                           usd(req.amount));
        }
        ensure_allowance(owner, req, cancel);
    }

    return submitter_.build_and_submit(req, rec->proxy_address);
}

void TradeOrchestrator::ensure_allowance(const std::string& owner, const TradeRequest& req,
                                         const CancelToken* cancel) {
    const ApprovalTarget target = req.market.neg_risk ? ApprovalTarget::NegRisk : ApprovalTarget::Standard;

    double allowance = wallets_->refresh_allowance(owner, target);
    if (allowance >= req.amount) return;

    log_info("TRADE", std::string("allowance ") + usd(allowance) + " short for " + approval_target_name(target) +
                      ", approving");
    const ProxyWalletRecord after = wallets_->approve(*owner_wallet_, target, cancel);

    if (after.approval(target).state != ApprovalState::Approved) {
        if (!after.last_error) throw InsufficientAllowanceError("USDC approval failed: unknown error");
        const WalletError& err = *after.last_error;
        switch (err.kind) {
            case ErrorKind::Cancelled:
                throw CancelledError("USDC approval cancelled");
            case ErrorKind::RelayerRejected:
                throw InsufficientAllowanceError("USDC approval failed: " + err.message);
            case ErrorKind::RelayTimeout:
                throw TradeError(err.kind, "USDC approval outcome unknown: " + err.message);
            default:
                throw TradeError(err.kind, "USDC approval failed: " + err.message);
        }
    }

    allowance = wallets_->refresh_allowance(owner, target);
    if (allowance < req.amount) {
        throw InsufficientAllowanceError("allowance " + usd(allowance) + " still below " + usd(req.amount) +
                                         " after a confirmed approval");
    }
}

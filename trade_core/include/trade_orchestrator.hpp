#pragma once
#include "cancel_token.hpp"
#include "kalshi_client.hpp"
#include "order_submitter.hpp"
#include "proxy_wallet_manager.hpp"
#include "trade_types.hpp"
#include "wallet_signer.hpp"

// Venue-agnostic entry point: checks preconditions, then hands the order to
// the submitter. Never deploys a proxy wallet; it may run one USDC approval.
class TradeOrchestrator {
public:
    // kalshi / wallets / owner_wallet may be null when that venue is not configured
    TradeOrchestrator(OrderSubmitter& submitter, KalshiClient* kalshi,
                      ProxyWalletManager* wallets, IWalletSigner* owner_wallet);

    // All failures are reported in the result; nothing is thrown
    TradeResult execute_trade(const TradeRequest& req, const CancelToken* cancel = nullptr);

private:
    TradeResult execute_kalshi(const TradeRequest& req);
    TradeResult execute_polymarket(const TradeRequest& req, const CancelToken* cancel);

    void ensure_allowance(const std::string& owner, const TradeRequest& req, const CancelToken* cancel);

    OrderSubmitter& submitter_;
    KalshiClient* kalshi_;
    ProxyWalletManager* wallets_;
    IWalletSigner* owner_wallet_;
};

#pragma once
#include "cancel_token.hpp"
#include "chain_reader.hpp"
#include "proxy_wallet.hpp"
#include "relay_client.hpp"
#include "trade_config.hpp"
#include "wallet_signer.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class WalletStateDB;

// Owns one ProxyWalletRecord per owner address.
//
// At most one operation runs per owner; a concurrent second call for the same
// owner throws WalletBusyError. Different owners proceed independently.
//
// check_status throws on relay failure (record left Unknown with the error).
// deploy / approve never throw for relay or signing failures: the outcome,
// including the preserved error, is in the returned record.
class ProxyWalletManager {
public:
    ProxyWalletManager(RelayClient& relay, IChainReader& chain, const TradeConfig& cfg,
                       WalletStateDB* journal = nullptr);

    // Seeds records from a journal reload
    void restore(const std::vector<ProxyWalletRecord>& rows);

    std::optional<ProxyWalletRecord> record(const std::string& owner) const;

    ProxyWalletRecord check_status(const std::string& owner);

    // Valid from NotDeployed, or from Failed as a new explicit attempt.
    // Throws InvalidStateError otherwise.
    ProxyWalletRecord deploy(IWalletSigner& owner_wallet, const CancelToken* cancel = nullptr);

    // Single-call batch USDC.approve(spender, max). Throws ProxyNotDeployedError
    // unless the record is Deployed with a known proxy address.
    ProxyWalletRecord approve(IWalletSigner& owner_wallet, ApprovalTarget target,
                              const CancelToken* cancel = nullptr);

    // Reads the on-chain allowance of the proxy for target and stores it
    double refresh_allowance(const std::string& owner, ApprovalTarget target);

    // USDC held by the owner's proxy wallet
    double usdc_balance(const std::string& owner);

private:
    class InFlight {
    public:
        InFlight(ProxyWalletManager& m, std::string key);
        ~InFlight();
        InFlight(const InFlight&) = delete;
        InFlight& operator=(const InFlight&) = delete;
    private:
        ProxyWalletManager& m_;
        std::string key_;
    };

    ProxyWalletRecord update(const std::string& key, const std::function<void(ProxyWalletRecord&)>& fn);
    ProxyWalletRecord snapshot(const std::string& key) const;
    ProxyWalletRecord deployed_or_throw(const std::string& key) const;

    RelayClient& relay_;
    IChainReader& chain_;
    const TradeConfig& cfg_;
    WalletStateDB* journal_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, ProxyWalletRecord> records_;
    std::unordered_set<std::string> in_flight_;
};

#include "proxy_wallet_manager.hpp"
#include "contracts.hpp"
#include "safe_transactions.hpp"
#include "trade_log.hpp"
#include "wallet_state_db.hpp"

#include <chrono>

static std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

ProxyWalletManager::InFlight::InFlight(ProxyWalletManager& m, std::string key)
    : m_(m), key_(std::move(key))
{
    std::lock_guard<std::mutex> lk(m_.mtx_);
    if (!m_.in_flight_.insert(key_).second) {
        throw WalletBusyError("another wallet operation is in progress for " + key_);
    }
}

ProxyWalletManager::InFlight::~InFlight() {
    std::lock_guard<std::mutex> lk(m_.mtx_);
    m_.in_flight_.erase(key_);
}

ProxyWalletManager::ProxyWalletManager(RelayClient& relay, IChainReader& chain, const TradeConfig& cfg,
                                       WalletStateDB* journal)
    : relay_(relay), chain_(chain), cfg_(cfg), journal_(journal)
{}

void ProxyWalletManager::restore(const std::vector<ProxyWalletRecord>& rows) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& r : rows) {
        records_[wallet_key(r.owner)] = r;
    }
    log_info("WALLET", "restored " + std::to_string(rows.size()) + " wallet records");
}

std::optional<ProxyWalletRecord> ProxyWalletManager::record(const std::string& owner) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(wallet_key(owner));
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

ProxyWalletRecord ProxyWalletManager::update(const std::string& key,
                                             const std::function<void(ProxyWalletRecord&)>& fn) {
    ProxyWalletRecord copy;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto& rec = records_[key];
        if (rec.owner.empty()) rec.owner = key;
        fn(rec);
        rec.updated_ms = now_ms();
        copy = rec;
    }
    if (journal_) journal_->push(copy);
    return copy;
}

ProxyWalletRecord ProxyWalletManager::snapshot(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        ProxyWalletRecord r;
        r.owner = key;
        return r;
    }
    return it->second;
}

ProxyWalletRecord ProxyWalletManager::deployed_or_throw(const std::string& key) const {
    ProxyWalletRecord rec = snapshot(key);
    if (!rec.deployed()) {
        throw ProxyNotDeployedError("proxy wallet for " + key + " is " + wallet_state_name(rec.state) +
                                    "; deploy it before trading");
    }
    if (rec.proxy_address.empty()) {
        throw ProxyNotDeployedError("proxy wallet for " + key + " is deployed but its address is unresolved");
    }
    return rec;
}

// ------------------------ status ------------------------

ProxyWalletRecord ProxyWalletManager::check_status(const std::string& owner) {
    const std::string key = wallet_key(owner);
    InFlight guard(*this, key);

    update(key, [](ProxyWalletRecord& r) { r.state = WalletState::Checking; });

    DeployedStatus st;
    try {
        st = relay_.get_deployed(owner);
    } catch (const TradeError& e) {
        update(key, [&](ProxyWalletRecord& r) {
            r.state = WalletState::Unknown;
            r.last_error = WalletError{e.kind(), e.what()};
        });
        log_warn("WALLET", "status check for " + key + " failed: " + e.what());
        throw;
    } catch (const std::exception& e) {
        update(key, [&](ProxyWalletRecord& r) {
            r.state = WalletState::Unknown;
            r.last_error = WalletError{ErrorKind::Network, e.what()};
        });
        log_error("WALLET", "status check for " + key + " failed: " + e.what());
        throw TransportError(std::string("status check failed: ") + e.what());
    }

    if (!st.deployed) {
        log_info("WALLET", key + " has no proxy wallet");
        return update(key, [](ProxyWalletRecord& r) {
            r.state = WalletState::NotDeployed;
            r.proxy_address.clear();
            r.last_error.reset();
        });
    }

    std::string proxy = st.proxy_address;
    try {
        NonceInfo n = relay_.get_nonce(owner);
        if (!n.proxy_address.empty()) proxy = n.proxy_address;
    } catch (const TradeError& e) {
        log_warn("WALLET", std::string("proxy address lookup via nonce failed (using primary): ") + e.what());
    }

    log_info("WALLET", key + " proxy deployed at " + (proxy.empty() ? "<unresolved>" : proxy));
    return update(key, [&](ProxyWalletRecord& r) {
        r.state = WalletState::Deployed;
        if (!proxy.empty()) r.proxy_address = proxy;
        r.last_error.reset();
    });
}

// ------------------------ deploy ------------------------

ProxyWalletRecord ProxyWalletManager::deploy(IWalletSigner& owner_wallet, const CancelToken* cancel) {
    const std::string owner = owner_wallet.address();
    const std::string key = wallet_key(owner);
    InFlight guard(*this, key);

    const ProxyWalletRecord cur = snapshot(key);
    if (cur.state != WalletState::NotDeployed && cur.state != WalletState::Failed) {
        throw InvalidStateError(std::string("deploy needs a not_deployed or failed wallet, ") + key + " is " +
                                wallet_state_name(cur.state) + (cur.state == WalletState::Unknown ? " (check status first)" : ""));
    }

    update(key, [](ProxyWalletRecord& r) {
        r.state = WalletState::Deploying;
        r.last_error.reset();
        r.last_tx_id.clear();
        r.last_tx_hash.clear();
    });
    log_info("WALLET", "deploying proxy wallet for " + key);

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        log_error("WALLET", "deploy for " + key + " failed: " + msg);
        return update(key, [&](ProxyWalletRecord& r) {
            r.state = WalletState::Failed;
            r.last_error = WalletError{kind, msg};
        });
    };

    try {
        const std::string tx_id = relay_.submit(RelayAction::DeployWallet,
                                                build_create_proxy_payload(owner_wallet, cfg_.chain_id));
        update(key, [&](ProxyWalletRecord& r) { r.last_tx_id = tx_id; });

        PollSettings ps;
        ps.max_attempts = cfg_.poll.deploy_max_attempts;
        ps.interval = std::chrono::milliseconds(cfg_.poll.interval_ms);
        const RelayerTransaction tx = relay_.poll_until_terminal(tx_id, ps, cancel);

        if (tx.state == RelayTxState::Failed) {
            return fail(ErrorKind::RelayerRejected,
                        "proxy wallet deployment failed on-chain" + (tx.error.empty() ? "" : ": " + tx.error));
        }

        std::string proxy = tx.proxy_address;
        if (proxy.empty()) {
            try {
                proxy = relay_.get_deployed(owner).proxy_address;
            } catch (const std::exception& e) {
                log_warn("WALLET", std::string("deployed, proxy address not yet visible: ") + e.what());
            }
        }

        log_info("WALLET", key + " proxy deployed at " + (proxy.empty() ? "<unresolved>" : proxy));
        return update(key, [&](ProxyWalletRecord& r) {
            r.state = WalletState::Deployed;
            r.proxy_address = proxy;
            r.last_tx_hash = tx.tx_hash;
        });
    } catch (const TradeError& e) {
        return fail(e.kind(), e.what());
    } catch (const std::exception& e) {
        return fail(ErrorKind::Network, e.what());
    }
}

// ------------------------ approve ------------------------

ProxyWalletRecord ProxyWalletManager::approve(IWalletSigner& owner_wallet, ApprovalTarget target,
                                              const CancelToken* cancel) {
    const std::string owner = owner_wallet.address();
    const std::string key = wallet_key(owner);
    InFlight guard(*this, key);

    const ProxyWalletRecord cur = deployed_or_throw(key);
    const std::string proxy = cur.proxy_address;
    const std::string spender = approval_spender(target);

    update(key, [&](ProxyWalletRecord& r) {
        r.approval(target).state = ApprovalState::Approving;
        r.last_error.reset();
    });
    log_info("WALLET", std::string("approving USDC for ") + approval_target_name(target) + " spender=" + spender);

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        log_error("WALLET", std::string("approval (") + approval_target_name(target) + ") failed: " + msg);
        return update(key, [&](ProxyWalletRecord& r) {
            r.approval(target).state = ApprovalState::Unapproved;
            r.last_error = WalletError{kind, msg};
        });
    };

    try {
        const NonceInfo n = relay_.get_nonce(owner);

        SafeCall call;
        call.to = kUsdcAddress;
        call.data = encode_approve_max(spender);

        const std::string tx_id = relay_.submit(
            RelayAction::ExecuteBatch,
            build_safe_call_payload(owner_wallet, proxy, call, n.nonce, cfg_.chain_id,
                                    std::string("USDC approval for ") + approval_target_name(target)));
        update(key, [&](ProxyWalletRecord& r) { r.last_tx_id = tx_id; });

        PollSettings ps;
        ps.max_attempts = cfg_.poll.approve_max_attempts;
        ps.interval = std::chrono::milliseconds(cfg_.poll.interval_ms);
        const RelayerTransaction tx = relay_.poll_until_terminal(tx_id, ps, cancel);

        if (tx.state == RelayTxState::Failed) {
            return fail(ErrorKind::RelayerRejected,
                        "approval transaction failed on-chain" + (tx.error.empty() ? "" : ": " + tx.error));
        }

        double allowance = cur.approval(target).allowance;
        try {
            allowance = chain_.usdc_allowance(proxy, spender);
        } catch (const TradeError& e) {
            log_warn("WALLET", std::string("allowance re-read after approval failed: ") + e.what());
        }

        return update(key, [&](ProxyWalletRecord& r) {
            r.approval(target).state = ApprovalState::Approved;
            r.approval(target).allowance = allowance;
            r.last_tx_hash = tx.tx_hash;
        });
    } catch (const TradeError& e) {
        return fail(e.kind(), e.what());
    } catch (const std::exception& e) {
        return fail(ErrorKind::Network, e.what());
    }
}

// ------------------------ reads ------------------------

double ProxyWalletManager::refresh_allowance(const std::string& owner, ApprovalTarget target) {
    const std::string key = wallet_key(owner);
    InFlight guard(*this, key);

    const ProxyWalletRecord cur = deployed_or_throw(key);
    const double allowance = chain_.usdc_allowance(cur.proxy_address, approval_spender(target));

    update(key, [&](ProxyWalletRecord& r) {
        r.approval(target).allowance = allowance;
        r.approval(target).state = allowance > 0.0 ? ApprovalState::Approved : ApprovalState::Unapproved;
    });
    return allowance;
}

double ProxyWalletManager::usdc_balance(const std::string& owner) {
    const ProxyWalletRecord cur = deployed_or_throw(wallet_key(owner));
    return chain_.usdc_balance(cur.proxy_address);
}

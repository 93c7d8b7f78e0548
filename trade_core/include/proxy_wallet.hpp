#pragma once
#include "trade_errors.hpp"

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class WalletState { Unknown, Checking, NotDeployed, Deploying, Deployed, Failed };

enum class ApprovalState { Unapproved, Approving, Approved };

// standard -> Conditional Tokens, neg-risk -> Neg-Risk Adapter
enum class ApprovalTarget { Standard = 0, NegRisk = 1 };

const char* wallet_state_name(WalletState s);
WalletState parse_wallet_state(const std::string& s);
const char* approval_state_name(ApprovalState s);
ApprovalState parse_approval_state(const std::string& s);
const char* approval_target_name(ApprovalTarget t);
const char* approval_spender(ApprovalTarget t);

struct ApprovalStatus {
    ApprovalState state{ApprovalState::Unapproved};
    double allowance{0.0};   // USDC
};

struct WalletError {
    ErrorKind kind;
    std::string message;
};

struct ProxyWalletRecord {
    std::string owner;
    std::string proxy_address;
    WalletState state{WalletState::Unknown};
    std::array<ApprovalStatus, 2> approvals{};
    std::optional<WalletError> last_error;
    std::string last_tx_id;
    std::string last_tx_hash;
    std::int64_t updated_ms{0};

    bool deployed() const { return state == WalletState::Deployed; }

    ApprovalStatus& approval(ApprovalTarget t) { return approvals[static_cast<size_t>(t)]; }
    const ApprovalStatus& approval(ApprovalTarget t) const { return approvals[static_cast<size_t>(t)]; }
};

// lowercase 0x address used as the record key
std::string wallet_key(const std::string& owner);

// {owner, proxyAddress, state, approvals{standard, neg_risk}, lastError?, lastTxId?, lastTxHash?}
nlohmann::json wallet_record_json(const ProxyWalletRecord& r);

#include "proxy_wallet.hpp"
#include "contracts.hpp"

#include <nlohmann/json.hpp>

#include <cctype>

const char* wallet_state_name(WalletState s) {
    switch (s) {
        case WalletState::Unknown:     return "unknown";
        case WalletState::Checking:    return "checking";
        case WalletState::NotDeployed: return "not_deployed";
        case WalletState::Deploying:   return "deploying";
        case WalletState::Deployed:    return "deployed";
        case WalletState::Failed:      return "failed";
    }
    return "unknown";
}

WalletState parse_wallet_state(const std::string& s) {
    if (s == "checking")     return WalletState::Checking;
    if (s == "not_deployed") return WalletState::NotDeployed;
    if (s == "deploying")    return WalletState::Deploying;
    if (s == "deployed")     return WalletState::Deployed;
    if (s == "failed")       return WalletState::Failed;
    return WalletState::Unknown;
}

const char* approval_state_name(ApprovalState s) {
    switch (s) {
        case ApprovalState::Unapproved: return "unapproved";
        case ApprovalState::Approving:  return "approving";
        case ApprovalState::Approved:   return "approved";
    }
    return "unapproved";
}

ApprovalState parse_approval_state(const std::string& s) {
    if (s == "approving") return ApprovalState::Approving;
    if (s == "approved")  return ApprovalState::Approved;
    return ApprovalState::Unapproved;
}

const char* approval_target_name(ApprovalTarget t) {
    return t == ApprovalTarget::NegRisk ? "neg_risk" : "standard";
}

const char* approval_spender(ApprovalTarget t) {
    return t == ApprovalTarget::NegRisk ? kNegRiskAdapterAddress : kConditionalTokensAddress;
}

std::string wallet_key(const std::string& owner) {
    std::string k = owner;
    for (auto& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (k.rfind("0x", 0) != 0) k = "0x" + k;
    return k;
}

nlohmann::json wallet_record_json(const ProxyWalletRecord& r) {
    nlohmann::json j;
    j["owner"] = r.owner;
    j["proxyAddress"] = r.proxy_address;
    j["state"] = wallet_state_name(r.state);
    for (ApprovalTarget t : {ApprovalTarget::Standard, ApprovalTarget::NegRisk}) {
        j["approvals"][approval_target_name(t)] = {
            {"state", approval_state_name(r.approval(t).state)},
            {"allowance", r.approval(t).allowance},
        };
    }
    if (r.last_error) {
        j["lastError"] = {{"code", error_code(r.last_error->kind)}, {"message", r.last_error->message}};
    }
    if (!r.last_tx_id.empty()) j["lastTxId"] = r.last_tx_id;
    if (!r.last_tx_hash.empty()) j["lastTxHash"] = r.last_tx_hash;
    return j;
}

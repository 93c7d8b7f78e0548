#pragma once
#include "typed_data.hpp"
#include "wallet_signer.hpp"

#include <nlohmann/json.hpp>

#include <string>

// One call executed by the Safe proxy
struct SafeCall {
    std::string to;
    std::string value = "0";
    std::string data = "0x";
    int operation = 0;   // 0 = Call, 1 = DelegateCall
};

// CreateProxy(address paymentToken,uint256 payment,address paymentReceiver)
// against the Safe proxy factory, zero payment
Bytes32 create_proxy_digest(long long chain_id);

// SafeTx hash with the proxy itself as verifying contract, no gas refund
Bytes32 safe_tx_digest(const std::string& proxy, const SafeCall& call,
                       const std::string& nonce, long long chain_id);

// POST /submit bodies; the relay client adds "type"
nlohmann::json build_create_proxy_payload(IWalletSigner& wallet, long long chain_id);

nlohmann::json build_safe_call_payload(IWalletSigner& wallet, const std::string& proxy,
                                       const SafeCall& call, const std::string& nonce,
                                       long long chain_id, const std::string& metadata);

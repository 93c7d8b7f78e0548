#include "safe_transactions.hpp"
#include "contracts.hpp"

static const TypedSchema& create_proxy_schema() {
    static const TypedSchema schema{
        {"CreateProxy", {
            {"paymentToken", "address"},
            {"payment", "uint256"},
            {"paymentReceiver", "address"},
        }},
    };
    return schema;
}

static const TypedSchema& safe_tx_schema() {
    static const TypedSchema schema{
        {"SafeTx", {
            {"to", "address"},
            {"value", "uint256"},
            {"data", "bytes"},
            {"operation", "uint8"},
            {"safeTxGas", "uint256"},
            {"baseGas", "uint256"},
            {"gasPrice", "uint256"},
            {"gasToken", "address"},
            {"refundReceiver", "address"},
            {"nonce", "uint256"},
        }},
    };
    return schema;
}

Bytes32 create_proxy_digest(long long chain_id) {
    Eip712Domain d;
    d.name = kSafeFactoryDomainName;
    d.chain_id = chain_id;
    d.verifying_contract = kSafeProxyFactoryAddress;

    const nlohmann::json msg = {
        {"paymentToken", kZeroAddress},
        {"payment", "0"},
        {"paymentReceiver", kZeroAddress},
    };
    return typed_data_digest(d, create_proxy_schema(), "CreateProxy", msg);
}

Bytes32 safe_tx_digest(const std::string& proxy, const SafeCall& call,
                       const std::string& nonce, long long chain_id) {
    Eip712Domain d;
    d.chain_id = chain_id;
    d.verifying_contract = proxy;

    const nlohmann::json msg = {
        {"to", call.to},
        {"value", call.value},
        {"data", call.data},
        {"operation", call.operation},
        {"safeTxGas", "0"},
        {"baseGas", "0"},
        {"gasPrice", "0"},
        {"gasToken", kZeroAddress},
        {"refundReceiver", kZeroAddress},
        {"nonce", nonce},
    };
    return typed_data_digest(d, safe_tx_schema(), "SafeTx", msg);
}

nlohmann::json build_create_proxy_payload(IWalletSigner& wallet, long long chain_id) {
    const std::string sig = wallet.sign_digest(create_proxy_digest(chain_id));
    return {
        {"from", wallet.address()},
        {"to", kSafeProxyFactoryAddress},
        {"data", "0x"},
        {"signature", sig},
        {"signatureParams", {
            {"paymentToken", kZeroAddress},
            {"payment", "0"},
            {"paymentReceiver", kZeroAddress},
        }},
        {"metadata", "Safe deployment"},
    };
}

nlohmann::json build_safe_call_payload(IWalletSigner& wallet, const std::string& proxy,
                                       const SafeCall& call, const std::string& nonce,
                                       long long chain_id, const std::string& metadata) {
    const std::string sig = wallet.sign_digest(safe_tx_digest(proxy, call, nonce, chain_id));
    return {
        {"from", wallet.address()},
        {"to", call.to},
        {"proxyWallet", proxy},
        {"data", call.data},
        {"nonce", nonce},
        {"signature", sig},
        {"signatureParams", {
            {"gasPrice", "0"},
            {"operation", std::to_string(call.operation)},
            {"safeTxnGas", "0"},
            {"baseGas", "0"},
            {"gasToken", kZeroAddress},
            {"refundReceiver", kZeroAddress},
        }},
        {"metadata", metadata},
    };
}

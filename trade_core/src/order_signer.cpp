#include "order_signer.hpp"
#include "contracts.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"

const char* exchange_address(RiskCategory risk) {
    return risk == RiskCategory::NegRisk ? kNegRiskExchangeAddress : kCtfExchangeAddress;
}

Eip712Domain exchange_domain(RiskCategory risk, long long chain_id) {
    Eip712Domain d;
    d.name = kExchangeDomainName;
    d.version = kExchangeDomainVersion;
    d.chain_id = chain_id;
    d.verifying_contract = exchange_address(risk);
    return d;
}

const TypedSchema& order_schema() {
    static const TypedSchema schema{
        {"Order", {
            {"salt", "uint256"},
            {"maker", "address"},
            {"signer", "address"},
            {"taker", "address"},
            {"tokenId", "uint256"},
            {"makerAmount", "uint256"},
            {"takerAmount", "uint256"},
            {"expiration", "uint256"},
            {"nonce", "uint256"},
            {"feeRateBps", "uint256"},
            {"side", "uint8"},
            {"signatureType", "uint8"},
        }},
    };
    return schema;
}

nlohmann::json order_message(const OrderFields& f) {
    return {
        {"salt", f.salt},
        {"maker", f.maker},
        {"signer", f.signer},
        {"taker", f.taker},
        {"tokenId", f.token_id},
        {"makerAmount", f.maker_amount},
        {"takerAmount", f.taker_amount},
        {"expiration", f.expiration},
        {"nonce", f.nonce},
        {"feeRateBps", f.fee_rate_bps},
        {"side", static_cast<int>(f.side)},
        {"signatureType", static_cast<int>(f.signature_type)},
    };
}

nlohmann::json SignedOrder::to_json() const {
    const auto& f = fields_;
    return {
        {"salt", f.salt},
        {"maker", f.maker},
        {"signer", f.signer},
        {"taker", f.taker},
        {"tokenId", f.token_id},
        {"makerAmount", f.maker_amount},
        {"takerAmount", f.taker_amount},
        {"expiration", std::to_string(f.expiration)},
        {"nonce", f.nonce},
        {"feeRateBps", f.fee_rate_bps},
        {"side", f.side == OrderSide::Buy ? "BUY" : "SELL"},
        {"signatureType", static_cast<int>(f.signature_type)},
        {"signature", signature_},
    };
}

OrderTypedDataSigner::OrderTypedDataSigner(IWalletSigner& wallet, long long chain_id)
    : wallet_(wallet), chain_id_(chain_id), wallet_address_(wallet.address())
{}

Bytes32 OrderTypedDataSigner::digest(const OrderFields& f, RiskCategory risk) const {
    return typed_data_digest(exchange_domain(risk, chain_id_), order_schema(), "Order", order_message(f));
}

SignedOrder OrderTypedDataSigner::sign(const OrderFields& f, RiskCategory risk) const {
    if (!same_address(f.signer, wallet_address_)) {
        throw SignatureError("order signer " + f.signer + " is not the connected wallet");
    }

    const Bytes32 d = digest(f, risk);
    std::string sig = wallet_.sign_digest(d);

    log_debug("ORDER", "signed order salt=" + std::to_string(f.salt) +
                       " exchange=" + exchange_address(risk));
    return SignedOrder(f, std::move(sig), risk);
}

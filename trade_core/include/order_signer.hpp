#pragma once
#include "typed_data.hpp"
#include "wallet_signer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

enum class RiskCategory { Standard, NegRisk };

enum class SignatureType : int {
    Eoa = 0,
    PolyProxy = 1,
    PolyGnosisSafe = 2
};

enum class OrderSide : int { Buy = 0, Sell = 1 };

// Unsigned CLOB order; amounts are 6-decimal base units as decimal strings
struct OrderFields {
    std::uint64_t salt{0};
    std::string maker;        // proxy wallet holding the funds
    std::string signer;       // owner EOA
    std::string taker = "0x0000000000000000000000000000000000000000";
    std::string token_id;
    std::string maker_amount;
    std::string taker_amount;
    std::int64_t expiration{0};
    std::string nonce = "0";
    std::string fee_rate_bps = "0";
    OrderSide side{OrderSide::Buy};
    SignatureType signature_type{SignatureType::PolyGnosisSafe};
};

// Read-only once produced by OrderTypedDataSigner
class SignedOrder {
public:
    const OrderFields& fields() const { return fields_; }
    const std::string& signature() const { return signature_; }
    RiskCategory risk() const { return risk_; }

    // CLOB wire form: salt as number, amounts as strings, side "BUY"/"SELL"
    nlohmann::json to_json() const;

private:
    friend class OrderTypedDataSigner;
    SignedOrder(OrderFields f, std::string sig, RiskCategory risk)
        : fields_(std::move(f)), signature_(std::move(sig)), risk_(risk) {}

    OrderFields fields_;
    std::string signature_;
    RiskCategory risk_;
};

const char* exchange_address(RiskCategory risk);
Eip712Domain exchange_domain(RiskCategory risk, long long chain_id);
const TypedSchema& order_schema();
nlohmann::json order_message(const OrderFields& f);

class OrderTypedDataSigner {
public:
    OrderTypedDataSigner(IWalletSigner& wallet, long long chain_id);

    Bytes32 digest(const OrderFields& f, RiskCategory risk) const;

    // Throws SignatureError if the order's signer is not the wallet address
    // or the wallet fails to sign
    SignedOrder sign(const OrderFields& f, RiskCategory risk) const;

    const std::string& wallet_address() const { return wallet_address_; }

private:
    IWalletSigner& wallet_;
    long long chain_id_;
    std::string wallet_address_;
};

#pragma once
#include "http_client.hpp"

#include <string>

// ---- fixed ERC-20 calldata (0x-prefixed hex) ----
std::string encode_balance_of(const std::string& holder);
std::string encode_allowance(const std::string& owner, const std::string& spender);
std::string encode_approve_max(const std::string& spender);

// 32-byte big-endian word (hex) of 6-decimal base units -> USDC
double base_units_to_usdc(const std::string& word_hex);

// Read-only view of USDC funds held by a wallet
class IChainReader {
public:
    virtual ~IChainReader() = default;

    virtual double usdc_balance(const std::string& holder) = 0;
    virtual double usdc_allowance(const std::string& owner, const std::string& spender) = 0;
};

// eth_call against a Polygon JSON-RPC endpoint.
// Throws TransportError for transport or RPC-level failures.
class RpcChainReader : public IChainReader {
public:
    RpcChainReader(IHttpClient& http, std::string rpc_url, std::string usdc_address,
                   long timeout_ms = 15000);

    double usdc_balance(const std::string& holder) override;
    double usdc_allowance(const std::string& owner, const std::string& spender) override;

private:
    std::string eth_call(const std::string& to, const std::string& data);

    IHttpClient& http_;
    std::string rpc_url_;
    std::string usdc_;
    long timeout_ms_;
};

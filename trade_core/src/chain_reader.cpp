#include "chain_reader.hpp"
#include "crypto_utils.hpp"
#include "trade_errors.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdlib>

static const char* kBalanceOfSelector = "70a08231";  // balanceOf(address)
static const char* kAllowanceSelector = "dd62ed3e";  // allowance(address,address)
static const char* kApproveSelector   = "095ea7b3";  // approve(address,uint256)

std::string encode_balance_of(const std::string& holder) {
    return std::string("0x") + kBalanceOfSelector + to_hex(address_word(holder), false);
}

std::string encode_allowance(const std::string& owner, const std::string& spender) {
    return std::string("0x") + kAllowanceSelector +
           to_hex(address_word(owner), false) + to_hex(address_word(spender), false);
}

std::string encode_approve_max(const std::string& spender) {
    return std::string("0x") + kApproveSelector + to_hex(address_word(spender), false) +
           std::string(64, 'f');
}

double base_units_to_usdc(const std::string& word_hex) {
    Bytes raw;
    try {
        raw = from_hex(word_hex);
    } catch (const SignatureError&) {
        throw TransportError("eth_call result is not hex: " + word_hex);
    }
    if (raw.empty()) return 0.0;

    BIGNUM* bn = BN_bin2bn(raw.data(), static_cast<int>(raw.size()), nullptr);
    if (!bn) throw TransportError("cannot decode eth_call result");
    char* dec = BN_bn2dec(bn);
    BN_free(bn);
    if (!dec) throw TransportError("cannot decode eth_call result");

    const double units = std::strtod(dec, nullptr);
    OPENSSL_free(dec);
    return units / 1e6;
}

RpcChainReader::RpcChainReader(IHttpClient& http, std::string rpc_url, std::string usdc_address,
                               long timeout_ms)
    : http_(http), rpc_url_(std::move(rpc_url)), usdc_(std::move(usdc_address)), timeout_ms_(timeout_ms)
{}

std::string RpcChainReader::eth_call(const std::string& to, const std::string& data) {
    static std::atomic<long long> next_id{1};

    nlohmann::json body = {
        {"jsonrpc", "2.0"},
        {"id", next_id.fetch_add(1)},
        {"method", "eth_call"},
        {"params", nlohmann::json::array({{{"to", to}, {"data", data}}, "latest"})},
    };

    HttpRequest req;
    req.method = "POST";
    req.url = rpc_url_;
    req.body = body.dump();
    req.timeout_ms = timeout_ms_;

    HttpResponse resp = http_.send(req);
    if (!resp.ok()) throw TransportError("RPC HTTP " + std::to_string(resp.status));

    nlohmann::json j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw TransportError("RPC returned non-JSON body");
    if (j.contains("error")) {
        const auto& e = j["error"];
        throw TransportError("RPC error: " + (e.is_object() ? e.value("message", e.dump()) : e.dump()));
    }
    if (!j.contains("result") || !j["result"].is_string()) throw TransportError("RPC reply has no result");
    return j["result"].get<std::string>();
}

double RpcChainReader::usdc_balance(const std::string& holder) {
    return base_units_to_usdc(eth_call(usdc_, encode_balance_of(holder)));
}

double RpcChainReader::usdc_allowance(const std::string& owner, const std::string& spender) {
    return base_units_to_usdc(eth_call(usdc_, encode_allowance(owner, spender)));
}

#pragma once
#include <nlohmann/json_fwd.hpp>

#include <string>

struct KalshiCredentials {
    std::string api_key_id;
    std::string private_key_pem;

    bool present() const { return !api_key_id.empty() && !private_key_pem.empty(); }
};

struct BuilderCredentials {
    std::string key;
    std::string secret;       // base64, standard or URL-safe alphabet
    std::string passphrase;

    bool present() const { return !key.empty() && !secret.empty() && !passphrase.empty(); }
};

struct RelayPollSettings {
    int deploy_max_attempts = 30;
    int approve_max_attempts = 20;
    int interval_ms = 2000;
};

// Built once at startup, then passed by const reference.
// Secrets come only from the environment, never from the config file.
struct TradeConfig {
    KalshiCredentials kalshi;
    BuilderCredentials builder;
    std::string builder_signing_server_url;
    std::string wallet_private_key;      // hex, optional (bot mode)

    std::string kalshi_api_url  = "https://trading-api.kalshi.com/trade-api/v2";
    std::string clob_url        = "https://clob.polymarket.com";
    std::string relayer_url     = "https://relayer-v2.polymarket.com";
    std::string polygon_rpc_url = "https://polygon-rpc.com";
    int chain_id = 137;

    RelayPollSettings poll;
    long http_timeout_ms = 15000;

    std::string journal_path = "wallet_state.db";
    std::string log_level = "info";
    int signer_port = 8080;

    // Applies non-secret keys from a parsed config.json; missing keys keep defaults
    void apply_json(const nlohmann::json& j);

    // Reads secrets and URL overrides from the environment
    void apply_env();

    // Defaults <- config file (if readable) <- environment.
    // Throws ConfigurationError when a config key has the wrong type.
    static TradeConfig load(const std::string& config_path);
};

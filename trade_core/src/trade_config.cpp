#include "trade_config.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

static std::string env_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return (v && *v) ? std::string(v) : def;
}

// PEM keys pasted into a single-line env var carry literal "\n"
static std::string expand_escaped_newlines(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size() && s[i + 1] == 'n') {
            out.push_back('\n');
            ++i;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

void TradeConfig::apply_json(const nlohmann::json& j) {
    kalshi_api_url  = j.value("kalshi_api_url", kalshi_api_url);
    clob_url        = j.value("clob_url", clob_url);
    relayer_url     = j.value("relayer_url", relayer_url);
    polygon_rpc_url = j.value("polygon_rpc_url", polygon_rpc_url);
    builder_signing_server_url = j.value("builder_signing_server_url", builder_signing_server_url);
    chain_id        = j.value("chain_id", chain_id);
    http_timeout_ms = j.value("http_timeout_ms", http_timeout_ms);
    journal_path    = j.value("journal_path", journal_path);
    log_level       = j.value("log_level", log_level);
    signer_port     = j.value("signer_port", signer_port);

    if (j.contains("relay_poll") && j["relay_poll"].is_object()) {
        const auto& p = j["relay_poll"];
        poll.deploy_max_attempts  = p.value("deploy_max_attempts", poll.deploy_max_attempts);
        poll.approve_max_attempts = p.value("approve_max_attempts", poll.approve_max_attempts);
        poll.interval_ms          = p.value("interval_ms", poll.interval_ms);
    }
}

void TradeConfig::apply_env() {
    kalshi.api_key_id      = env_or("KALSHI_API_KEY_ID", kalshi.api_key_id);
    kalshi.private_key_pem = expand_escaped_newlines(env_or("KALSHI_PRIVATE_KEY", kalshi.private_key_pem));

    builder.key        = env_or("POLY_BUILDER_API_KEY", builder.key);
    builder.secret     = env_or("POLY_BUILDER_SECRET", builder.secret);
    builder.passphrase = env_or("POLY_BUILDER_PASSPHRASE", builder.passphrase);
    builder_signing_server_url = env_or("BUILDER_SIGNING_SERVER_URL", builder_signing_server_url);

    wallet_private_key = env_or("POLY_PRIVATE_KEY", wallet_private_key);

    kalshi_api_url  = env_or("KALSHI_API_URL", kalshi_api_url);
    clob_url        = env_or("POLY_CLOB_URL", clob_url);
    relayer_url     = env_or("POLY_RELAYER_URL", relayer_url);
    polygon_rpc_url = env_or("POLYGON_RPC_URL", polygon_rpc_url);
}

TradeConfig TradeConfig::load(const std::string& config_path) {
    TradeConfig cfg;

    std::ifstream f(config_path);
    if (f.good()) {
        nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            log_warn("CONFIG", "ignoring unparsable " + config_path);
        } else {
            try {
                cfg.apply_json(j);
            } catch (const nlohmann::json::exception& e) {
                throw ConfigurationError(config_path + ": " + e.what());
            }
            log_info("CONFIG", "loaded " + config_path);
        }
    }

    cfg.apply_env();

    log_info("CONFIG", std::string("kalshi credentials ") + (cfg.kalshi.present() ? "present" : "absent") +
                       ", builder credentials " + (cfg.builder.present() ? "present" : "absent") +
                       ", wallet key " + (cfg.wallet_private_key.empty() ? "absent" : "present"));
    return cfg;
}

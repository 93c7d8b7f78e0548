#include "builder_signer.hpp"
#include "json_fields.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"

#include <chrono>

std::int64_t now_unix_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// ------------------------ local ------------------------

LocalBuilderSigner::LocalBuilderSigner(const BuilderCredentials& creds)
    : key_(creds.key), passphrase_(creds.passphrase)
{
    if (!creds.present()) {
        throw ConfigurationError("builder credentials not configured (POLY_BUILDER_API_KEY / _SECRET / _PASSPHRASE)");
    }
    if (!base64_decode(creds.secret, secret_) || secret_.empty()) {
        throw ConfigurationError("POLY_BUILDER_SECRET is not valid base64");
    }
}

std::string LocalBuilderSigner::signature(const BuilderSignRequest& req) const {
    if (req.method.empty() || req.path.empty()) throw SignatureError("builder signature needs method and path");

    const std::string msg = std::to_string(req.timestamp) + req.method + req.path + req.body;
    const Bytes mac = hmac_sha256(secret_, msg);
    return base64_to_url_safe(base64_encode(mac.data(), mac.size()));
}

HeaderList LocalBuilderSigner::headers(const BuilderSignRequest& req) {
    return {
        {"POLY_BUILDER_API_KEY", key_},
        {"POLY_BUILDER_PASSPHRASE", passphrase_},
        {"POLY_BUILDER_SIGNATURE", signature(req)},
        {"POLY_BUILDER_TIMESTAMP", std::to_string(req.timestamp)},
    };
}

// ------------------------ remote ------------------------

RemoteBuilderSigner::RemoteBuilderSigner(IHttpClient& http, std::string server_url, long timeout_ms)
    : http_(http), url_(std::move(server_url)), timeout_ms_(timeout_ms)
{
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
    if (url_.empty()) throw ConfigurationError("builder signing server URL is empty");
}

HeaderList RemoteBuilderSigner::headers(const BuilderSignRequest& req) {
    nlohmann::json j;
    j["method"] = req.method;
    j["path"] = req.path;
    if (!req.body.empty()) j["body"] = req.body;
    j["timestamp"] = req.timestamp;

    HttpRequest hr;
    hr.method = "POST";
    hr.url = url_ + "/sign";
    hr.body = j.dump();
    hr.timeout_ms = timeout_ms_;

    HttpResponse resp = http_.send(hr);

    if (resp.status == 503) throw ConfigurationError("remote builder signer has no credentials");

    nlohmann::json out = nlohmann::json::parse(resp.body, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        throw TransportError("remote builder signer returned a non-JSON body (HTTP " + std::to_string(resp.status) + ")");
    }
    const auto success = out.find("success");
    if (!resp.ok() || success == out.end() || !success->is_boolean() || !success->get<bool>()) {
        std::string msg = first_text(out, kErrorMessageFields);
        if (msg.empty()) msg = "HTTP " + std::to_string(resp.status);
        throw SignatureError("remote builder signer refused: " + msg);
    }
    if (!out.contains("headers") || !out["headers"].is_object()) {
        throw SignatureError("remote builder signer reply has no headers");
    }

    HeaderList h;
    for (auto it = out["headers"].begin(); it != out["headers"].end(); ++it) {
        if (it.value().is_string()) h.emplace_back(it.key(), it.value().get<std::string>());
    }
    return h;
}

// ------------------------ factory ------------------------

std::unique_ptr<IBuilderHeaderSigner> make_builder_signer(const TradeConfig& cfg, IHttpClient& http) {
    if (cfg.builder.present()) {
        log_info("BUILDER", "using local HMAC signer");
        return std::make_unique<LocalBuilderSigner>(cfg.builder);
    }
    if (!cfg.builder_signing_server_url.empty()) {
        log_info("BUILDER", "using remote signer at " + cfg.builder_signing_server_url);
        return std::make_unique<RemoteBuilderSigner>(http, cfg.builder_signing_server_url, cfg.http_timeout_ms);
    }
    throw ConfigurationError("no builder credentials and no builder signing server configured");
}

// ------------------------ /sign handler ------------------------

static nlohmann::json error_body(const std::string& msg) {
    return {{"success", false}, {"error", msg}};
}

SignReply handle_sign_request(const std::string& request_body, IBuilderHeaderSigner* signer,
                              std::int64_t now_seconds) {
    if (!signer) return {503, error_body("Builder credentials not configured")};

    nlohmann::json j = nlohmann::json::parse(request_body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return {400, error_body("Invalid JSON body")};

    const auto method = j.find("method");
    const auto path = j.find("path");
    if (method == j.end() || path == j.end() || !method->is_string() || !path->is_string() ||
        method->get<std::string>().empty() || path->get<std::string>().empty()) {
        return {400, error_body("Missing method or path")};
    }

    BuilderSignRequest req;
    req.method = method->get<std::string>();
    req.path = path->get<std::string>();
    req.timestamp = now_seconds;

    if (j.contains("body")) {
        const auto& b = j["body"];
        if (b.is_string()) req.body = b.get<std::string>();
        else if (!b.is_null()) req.body = b.dump();
    }
    // absent, null or "" -> server time; anything else must be integral unix seconds
    if (j.contains("timestamp")) {
        const auto& t = j["timestamp"];
        if (t.is_number_integer()) {
            req.timestamp = t.get<std::int64_t>();
        } else if (t.is_string() && !t.get<std::string>().empty()) {
            const std::string ts = t.get<std::string>();
            size_t pos = 0;
            try {
                req.timestamp = std::stoll(ts, &pos);
            } catch (const std::exception&) {
                return {400, error_body("timestamp must be unix seconds")};
            }
            if (pos != ts.size()) return {400, error_body("timestamp must be unix seconds")};
        } else if (!t.is_null() && !t.is_string()) {
            return {400, error_body("timestamp must be unix seconds")};
        }
    }

    HeaderList headers;
    try {
        headers = signer->headers(req);
    } catch (const TradeError& e) {
        return {500, error_body(e.what())};
    }

    nlohmann::json hj = nlohmann::json::object();
    for (const auto& h : headers) hj[h.first] = h.second;

    return {200, {{"success", true}, {"headers", hj}, {"timestamp", req.timestamp}}};
}

nlohmann::json sign_endpoint_status(bool configured) {
    return {
        {"configured", configured},
        {"message", configured ? "Builder signing is available"
                               : "Set POLY_BUILDER_API_KEY, POLY_BUILDER_SECRET and POLY_BUILDER_PASSPHRASE"},
    };
}

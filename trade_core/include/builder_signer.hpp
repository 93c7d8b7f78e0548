#pragma once
#include "crypto_utils.hpp"
#include "http_client.hpp"
#include "trade_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>

struct BuilderSignRequest {
    std::string method;
    std::string path;
    std::string body;          // empty = no body
    std::int64_t timestamp{0}; // unix seconds
};

// POLY_BUILDER_* attribution headers for relay and CLOB requests
class IBuilderHeaderSigner {
public:
    virtual ~IBuilderHeaderSigner() = default;

    virtual HeaderList headers(const BuilderSignRequest& req) = 0;
};

// Holds the builder secret in-process
class LocalBuilderSigner : public IBuilderHeaderSigner {
public:
    // Throws ConfigurationError if credentials are absent or the secret is not base64
    explicit LocalBuilderSigner(const BuilderCredentials& creds);

    HeaderList headers(const BuilderSignRequest& req) override;

    // URL-safe base64 HMAC-SHA256 over timestamp + method + path + body
    std::string signature(const BuilderSignRequest& req) const;

private:
    std::string key_;
    std::string passphrase_;
    Bytes secret_;
};

// Delegates to a signing server exposing POST /sign
class RemoteBuilderSigner : public IBuilderHeaderSigner {
public:
    RemoteBuilderSigner(IHttpClient& http, std::string server_url, long timeout_ms = 10000);

    HeaderList headers(const BuilderSignRequest& req) override;

private:
    IHttpClient& http_;
    std::string url_;
    long timeout_ms_;
};

// Local when the secret is configured, remote when a server URL is configured.
// Throws ConfigurationError when neither is available.
std::unique_ptr<IBuilderHeaderSigner> make_builder_signer(const TradeConfig& cfg, IHttpClient& http);

std::int64_t now_unix_seconds();

// ---- POST /sign handler, transport independent ----

struct SignReply {
    int status{200};
    nlohmann::json body;
};

// signer == nullptr means the endpoint has no credentials (503)
SignReply handle_sign_request(const std::string& request_body, IBuilderHeaderSigner* signer,
                              std::int64_t now_seconds);

// GET /sign status document
nlohmann::json sign_endpoint_status(bool configured);

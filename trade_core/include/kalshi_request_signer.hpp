#pragma once
#include "http_client.hpp"
#include "trade_config.hpp"

#include <openssl/evp.h>

#include <string>

// RSA-PSS request signer for the Kalshi trading API.
// The key is parsed once at construction; the PEM text is not retained.
class KalshiRequestSigner {
public:
    // Throws ConfigurationError if credentials are absent or the key is not RSA
    explicit KalshiRequestSigner(const KalshiCredentials& creds);
    ~KalshiRequestSigner();

    KalshiRequestSigner(const KalshiRequestSigner&) = delete;
    KalshiRequestSigner& operator=(const KalshiRequestSigner&) = delete;

    // timestamp_ms + METHOD + path, query string removed
    static std::string canonical_message(const std::string& timestamp_ms,
                                         const std::string& method,
                                         const std::string& path);

    // base64 RSA-PSS(SHA-256, MGF1-SHA-256, salt = digest length).
    // Throws SignatureError for malformed input.
    std::string sign(const std::string& timestamp_ms,
                     const std::string& method,
                     const std::string& path) const;

    // KALSHI-ACCESS-KEY / -SIGNATURE / -TIMESTAMP, all from the same timestamp
    HeaderList auth_headers(const std::string& timestamp_ms,
                            const std::string& method,
                            const std::string& path) const;

    const std::string& key_id() const { return key_id_; }

private:
    std::string key_id_;
    EVP_PKEY* pkey_{nullptr};
};

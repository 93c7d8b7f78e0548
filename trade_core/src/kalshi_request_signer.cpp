#include "kalshi_request_signer.hpp"
#include "crypto_utils.hpp"
#include "trade_errors.hpp"

#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <cctype>
#include <memory>

KalshiRequestSigner::KalshiRequestSigner(const KalshiCredentials& creds)
    : key_id_(creds.api_key_id)
{
    if (!creds.present()) {
        throw ConfigurationError("Kalshi API credentials not configured (KALSHI_API_KEY_ID / KALSHI_PRIVATE_KEY)");
    }

    BIO* bio = BIO_new_mem_buf(creds.private_key_pem.data(), static_cast<int>(creds.private_key_pem.size()));
    if (!bio) throw ConfigurationError("cannot allocate BIO for Kalshi private key");
    pkey_ = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!pkey_) throw ConfigurationError("Kalshi private key is not a readable PEM private key");
    if (EVP_PKEY_base_id(pkey_) != EVP_PKEY_RSA) {
        EVP_PKEY_free(pkey_);
        pkey_ = nullptr;
        throw ConfigurationError("Kalshi private key must be an RSA key");
    }
}

KalshiRequestSigner::~KalshiRequestSigner() {
    EVP_PKEY_free(pkey_);
}

std::string KalshiRequestSigner::canonical_message(const std::string& timestamp_ms,
                                                   const std::string& method,
                                                   const std::string& path) {
    const auto q = path.find('?');
    const std::string bare = (q == std::string::npos) ? path : path.substr(0, q);
    return timestamp_ms + method + bare;
}

struct MdCtxFree {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};

std::string KalshiRequestSigner::sign(const std::string& timestamp_ms,
                                      const std::string& method,
                                      const std::string& path) const {
    if (timestamp_ms.empty()) throw SignatureError("empty timestamp");
    for (char c : timestamp_ms) {
        if (!std::isdigit(static_cast<unsigned char>(c))) throw SignatureError("timestamp must be decimal milliseconds");
    }
    if (method.empty()) throw SignatureError("empty HTTP method");
    if (path.empty() || path[0] != '/') throw SignatureError("request path must start with '/'");

    const std::string msg = canonical_message(timestamp_ms, method, path);

    std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx(EVP_MD_CTX_new());
    if (!ctx) throw SignatureError("EVP_MD_CTX_new failed");

    EVP_PKEY_CTX* pctx = nullptr;  // owned by ctx
    if (EVP_DigestSignInit(ctx.get(), &pctx, EVP_sha256(), nullptr, pkey_) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1 ||
        EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) != 1 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) != 1) {
        throw SignatureError("RSA-PSS signer setup failed");
    }

    size_t siglen = 0;
    const auto* data = reinterpret_cast<const unsigned char*>(msg.data());
    if (EVP_DigestSign(ctx.get(), nullptr, &siglen, data, msg.size()) != 1) {
        throw SignatureError("RSA-PSS signature size query failed");
    }
    Bytes sig(siglen);
    if (EVP_DigestSign(ctx.get(), sig.data(), &siglen, data, msg.size()) != 1) {
        throw SignatureError("RSA-PSS signing failed");
    }
    sig.resize(siglen);
    return base64_encode(sig.data(), sig.size());
}

HeaderList KalshiRequestSigner::auth_headers(const std::string& timestamp_ms,
                                             const std::string& method,
                                             const std::string& path) const {
    return {
        {"KALSHI-ACCESS-KEY", key_id_},
        {"KALSHI-ACCESS-SIGNATURE", sign(timestamp_ms, method, path)},
        {"KALSHI-ACCESS-TIMESTAMP", timestamp_ms},
    };
}

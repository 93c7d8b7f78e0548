#pragma once
#include "crypto_utils.hpp"

#include <openssl/ec.h>

#include <string>

// The user's wallet: holds the owner key and signs 32-byte digests.
// In the browser flow this is the injected wallet; bots use LocalWalletSigner.
class IWalletSigner {
public:
    virtual ~IWalletSigner() = default;

    // EIP-55 checksummed owner address
    virtual std::string address() const = 0;

    // 0x-prefixed 65-byte r ‖ s ‖ v with v in {27, 28}.
    // Throws SignatureError if signing fails.
    virtual std::string sign_digest(const Bytes32& digest) = 0;
};

class LocalWalletSigner : public IWalletSigner {
public:
    // 32-byte secp256k1 key as hex; throws ConfigurationError if malformed
    explicit LocalWalletSigner(const std::string& private_key_hex);
    ~LocalWalletSigner() override;

    LocalWalletSigner(const LocalWalletSigner&) = delete;
    LocalWalletSigner& operator=(const LocalWalletSigner&) = delete;

    std::string address() const override { return address_; }
    std::string sign_digest(const Bytes32& digest) override;

    // Signer address for a digest/signature pair; throws SignatureError if unrecoverable
    static std::string recover_address(const Bytes32& digest, const std::string& signature_hex);

private:
    EC_GROUP* group_{nullptr};
    BIGNUM* priv_{nullptr};
    std::string address_;
};

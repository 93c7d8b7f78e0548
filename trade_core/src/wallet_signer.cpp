#include "wallet_signer.hpp"
#include "trade_errors.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/obj_mac.h>

#include <memory>

struct BnFree    { void operator()(BIGNUM* p) const { BN_clear_free(p); } };
struct CtxFree   { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct PointFree { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct GroupFree { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };

using Bn    = std::unique_ptr<BIGNUM, BnFree>;
using BnCtx = std::unique_ptr<BN_CTX, CtxFree>;
using Point = std::unique_ptr<EC_POINT, PointFree>;
using Group = std::unique_ptr<EC_GROUP, GroupFree>;

static Bn bn_new() {
    Bn b(BN_new());
    if (!b) throw SignatureError("BN_new failed");
    return b;
}

static std::string address_of_point(const EC_GROUP* group, const EC_POINT* pt, BN_CTX* ctx) {
    std::uint8_t buf[65];
    size_t n = EC_POINT_point2oct(group, pt, POINT_CONVERSION_UNCOMPRESSED, buf, sizeof(buf), ctx);
    if (n != sizeof(buf)) throw SignatureError("public key encoding failed");

    const Bytes32 h = keccak256(buf + 1, 64);
    return to_checksum_address(to_hex(h.data() + 12, 20));
}

LocalWalletSigner::LocalWalletSigner(const std::string& private_key_hex) {
    Bytes raw;
    try {
        raw = from_hex(private_key_hex);
    } catch (const SignatureError&) {
        throw ConfigurationError("wallet private key is not valid hex");
    }
    if (raw.size() != 32) throw ConfigurationError("wallet private key must be 32 bytes");

    Group group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!group) throw ConfigurationError("secp256k1 unavailable in libcrypto");

    Bn priv(BN_bin2bn(raw.data(), static_cast<int>(raw.size()), nullptr));
    OPENSSL_cleanse(raw.data(), raw.size());
    if (!priv || BN_is_zero(priv.get()) || BN_cmp(priv.get(), EC_GROUP_get0_order(group.get())) >= 0) {
        throw ConfigurationError("wallet private key out of range");
    }

    BnCtx ctx(BN_CTX_new());
    Point pub(EC_POINT_new(group.get()));
    if (!ctx || !pub || !EC_POINT_mul(group.get(), pub.get(), priv.get(), nullptr, nullptr, ctx.get())) {
        throw ConfigurationError("public key derivation failed");
    }

    address_ = address_of_point(group.get(), pub.get(), ctx.get());
    group_ = group.release();
    priv_ = priv.release();
}

LocalWalletSigner::~LocalWalletSigner() {
    BN_clear_free(priv_);
    EC_GROUP_free(group_);
}

std::string LocalWalletSigner::sign_digest(const Bytes32& digest) {
    BnCtx ctx(BN_CTX_new());
    if (!ctx) throw SignatureError("BN_CTX_new failed");

    const BIGNUM* n = EC_GROUP_get0_order(group_);
    Bn half_n = bn_new();
    BN_rshift1(half_n.get(), n);

    Bn z(BN_bin2bn(digest.data(), 32, nullptr));
    if (!z) throw SignatureError("digest conversion failed");

    Bn k = bn_new(), x = bn_new(), y = bn_new(), r = bn_new(), s = bn_new(), t = bn_new();
    Point R(EC_POINT_new(group_));
    if (!R) throw SignatureError("EC_POINT_new failed");

    for (int attempt = 0; attempt < 16; ++attempt) {
        if (!BN_priv_rand_range(k.get(), n) || BN_is_zero(k.get())) continue;

        if (!EC_POINT_mul(group_, R.get(), k.get(), nullptr, nullptr, ctx.get()) ||
            !EC_POINT_get_affine_coordinates(group_, R.get(), x.get(), y.get(), ctx.get())) {
            throw SignatureError("nonce point computation failed");
        }

        // R.x >= n has probability ~2^-128; retry rather than encode recid 2/3
        if (BN_cmp(x.get(), n) >= 0) continue;
        BN_copy(r.get(), x.get());
        if (BN_is_zero(r.get())) continue;

        int recid = BN_is_odd(y.get()) ? 1 : 0;

        // s = k^-1 (z + r*d) mod n
        Bn kinv(BN_mod_inverse(nullptr, k.get(), n, ctx.get()));
        if (!kinv ||
            !BN_mod_mul(t.get(), r.get(), priv_, n, ctx.get()) ||
            !BN_mod_add(t.get(), t.get(), z.get(), n, ctx.get()) ||
            !BN_mod_mul(s.get(), t.get(), kinv.get(), n, ctx.get())) {
            throw SignatureError("ECDSA arithmetic failed");
        }
        if (BN_is_zero(s.get())) continue;

        // low-s form
        if (BN_cmp(s.get(), half_n.get()) > 0) {
            BN_sub(s.get(), n, s.get());
            recid ^= 1;
        }

        std::uint8_t sig[65];
        BN_bn2binpad(r.get(), sig, 32);
        BN_bn2binpad(s.get(), sig + 32, 32);
        sig[64] = static_cast<std::uint8_t>(27 + recid);
        return to_hex(sig, sizeof(sig));
    }
    throw SignatureError("could not produce a signature");
}

std::string LocalWalletSigner::recover_address(const Bytes32& digest, const std::string& signature_hex) {
    const Bytes sig = from_hex(signature_hex);
    if (sig.size() != 65) throw SignatureError("signature must be 65 bytes");

    int v = sig[64];
    if (v >= 27) v -= 27;
    if (v != 0 && v != 1) throw SignatureError("unsupported recovery id");

    Group group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    BnCtx ctx(BN_CTX_new());
    if (!group || !ctx) throw SignatureError("secp256k1 unavailable in libcrypto");
    const BIGNUM* n = EC_GROUP_get0_order(group.get());

    Bn r(BN_bin2bn(sig.data(), 32, nullptr));
    Bn s(BN_bin2bn(sig.data() + 32, 32, nullptr));
    Bn z(BN_bin2bn(digest.data(), 32, nullptr));
    if (!r || !s || !z || BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
        BN_cmp(r.get(), n) >= 0 || BN_cmp(s.get(), n) >= 0) {
        throw SignatureError("signature scalar out of range");
    }

    Point R(EC_POINT_new(group.get()));
    if (!R || !EC_POINT_set_compressed_coordinates(group.get(), R.get(), r.get(), v, ctx.get())) {
        throw SignatureError("signature does not map to a curve point");
    }

    // Q = r^-1 (s*R - z*G)
    Bn rinv(BN_mod_inverse(nullptr, r.get(), n, ctx.get()));
    Bn u1 = bn_new(), u2 = bn_new(), zn = bn_new();
    if (!rinv ||
        !BN_nnmod(zn.get(), z.get(), n, ctx.get()) ||
        !BN_mod_sub(zn.get(), n, zn.get(), n, ctx.get()) ||
        !BN_mod_mul(u1.get(), zn.get(), rinv.get(), n, ctx.get()) ||
        !BN_mod_mul(u2.get(), s.get(), rinv.get(), n, ctx.get())) {
        throw SignatureError("recovery arithmetic failed");
    }

    Point Q(EC_POINT_new(group.get()));
    if (!Q || !EC_POINT_mul(group.get(), Q.get(), u1.get(), R.get(), u2.get(), ctx.get()) ||
        EC_POINT_is_at_infinity(group.get(), Q.get())) {
        throw SignatureError("public key recovery failed");
    }
    return address_of_point(group.get(), Q.get(), ctx.get());
}

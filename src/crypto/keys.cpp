// Copyright (c) 2024 The QUORUM developers
// Distributed under the MIT software license

#include <quorum/crypto/keys.h>
#include <quorum/crypto/keccak.h>

#include <cstring>
#include <memory>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

namespace quorum {

// ============================================================================
// OpenSSL Handles
// ============================================================================

namespace {

struct BnDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
struct BnCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct EcKeyDeleter { void operator()(EC_KEY* p) const { EC_KEY_free(p); } };
struct EcdsaSigDeleter { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using EcKeyPtr = std::unique_ptr<EC_KEY, EcKeyDeleter>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;

GroupPtr NewSecp256k1Group() {
    return GroupPtr(EC_GROUP_new_by_curve_name(NID_secp256k1));
}

/// Write a BIGNUM as a fixed 32-byte big-endian value
bool WriteScalar(const BIGNUM* bn, Byte* out) {
    return BN_bn2binpad(bn, out, 32) == 32;
}

/// Serialize a point in uncompressed form
bool WritePoint(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx,
                std::array<Byte, PublicKey::SIZE>& out) {
    size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                    out.data(), out.size(), ctx);
    return len == PublicKey::SIZE;
}

} // anonymous namespace

// ============================================================================
// PublicKey Implementation
// ============================================================================

PublicKey::PublicKey() {
    data_.fill(0);
}

PublicKey::PublicKey(const Byte* data, size_t len) {
    data_.fill(0);
    if (!data || len != SIZE || data[0] != 0x04) {
        return;
    }

    GroupPtr group = NewSecp256k1Group();
    BnCtxPtr ctx(BN_CTX_new());
    if (!group || !ctx) {
        return;
    }

    PointPtr point(EC_POINT_new(group.get()));
    if (!point ||
        !EC_POINT_oct2point(group.get(), point.get(), data, len, ctx.get())) {
        return;
    }

    std::memcpy(data_.data(), data, SIZE);
    valid_ = true;
}

Address PublicKey::GetAddress() const {
    if (!valid_) {
        return Address();
    }
    Hash256 digest = Keccak256Hash(data_.data() + 1, SIZE - 1);
    return Address(digest.data() + 12, Address::SIZE);
}

bool PublicKey::operator==(const PublicKey& other) const {
    return valid_ == other.valid_ && data_ == other.data_;
}

std::optional<PublicKey> PublicKey::RecoverCompact(const Hash256& hash,
                                                   const std::vector<Byte>& signature) {
    if (signature.size() != COMPACT_SIGNATURE_SIZE) {
        return std::nullopt;
    }

    int recid = signature[64];
    if (recid >= 27) {
        recid -= 27;
    }
    if (recid < 0 || recid > 3) {
        return std::nullopt;
    }

    GroupPtr group = NewSecp256k1Group();
    BnCtxPtr ctx(BN_CTX_new());
    if (!group || !ctx) {
        return std::nullopt;
    }

    BnPtr order(BN_new());
    BnPtr fieldPrime(BN_new());
    BnPtr r(BN_bin2bn(signature.data(), 32, nullptr));
    BnPtr s(BN_bin2bn(signature.data() + 32, 32, nullptr));
    BnPtr e(BN_bin2bn(hash.data(), 32, nullptr));
    if (!order || !fieldPrime || !r || !s || !e) {
        return std::nullopt;
    }

    if (!EC_GROUP_get_order(group.get(), order.get(), ctx.get()) ||
        !EC_GROUP_get_curve(group.get(), fieldPrime.get(), nullptr, nullptr, ctx.get())) {
        return std::nullopt;
    }

    // r and s must lie in [1, n-1]
    if (BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
        BN_cmp(r.get(), order.get()) >= 0 || BN_cmp(s.get(), order.get()) >= 0) {
        return std::nullopt;
    }

    // R.x = r + (recid / 2) * n, which must still be a field element
    BnPtr x(BN_dup(r.get()));
    if (!x) {
        return std::nullopt;
    }
    if ((recid & 2) && !BN_add(x.get(), x.get(), order.get())) {
        return std::nullopt;
    }
    if (BN_cmp(x.get(), fieldPrime.get()) >= 0) {
        return std::nullopt;
    }

    PointPtr R(EC_POINT_new(group.get()));
    if (!R || !EC_POINT_set_compressed_coordinates(group.get(), R.get(), x.get(),
                                                   recid & 1, ctx.get())) {
        return std::nullopt;
    }

    // Q = r^-1 * (s*R - e*G) = (-e * r^-1) * G + (s * r^-1) * R
    BnPtr rInv(BN_mod_inverse(nullptr, r.get(), order.get(), ctx.get()));
    BnPtr u1(BN_new());
    BnPtr u2(BN_new());
    if (!rInv || !u1 || !u2) {
        return std::nullopt;
    }
    if (!BN_mod_mul(u1.get(), e.get(), rInv.get(), order.get(), ctx.get()) ||
        !BN_mod_mul(u2.get(), s.get(), rInv.get(), order.get(), ctx.get())) {
        return std::nullopt;
    }
    if (!BN_is_zero(u1.get()) && !BN_sub(u1.get(), order.get(), u1.get())) {
        return std::nullopt;
    }

    PointPtr Q(EC_POINT_new(group.get()));
    if (!Q || !EC_POINT_mul(group.get(), Q.get(), u1.get(), R.get(), u2.get(), ctx.get())) {
        return std::nullopt;
    }
    if (EC_POINT_is_at_infinity(group.get(), Q.get())) {
        return std::nullopt;
    }

    std::array<Byte, SIZE> encoded{};
    if (!WritePoint(group.get(), Q.get(), ctx.get(), encoded)) {
        return std::nullopt;
    }

    PublicKey key(encoded.data(), encoded.size());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::PrivateKey() {
    data_.fill(0);
}

PrivateKey::PrivateKey(const Byte* data, size_t len) {
    data_.fill(0);
    if (!data || len != SIZE) {
        return;
    }

    GroupPtr group = NewSecp256k1Group();
    BnPtr order(BN_new());
    BnPtr d(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!group || !order || !d ||
        !EC_GROUP_get_order(group.get(), order.get(), nullptr)) {
        return;
    }

    if (BN_is_zero(d.get()) || BN_cmp(d.get(), order.get()) >= 0) {
        return;
    }

    std::memcpy(data_.data(), data, SIZE);
    valid_ = true;
}

PrivateKey::~PrivateKey() {
    OPENSSL_cleanse(data_.data(), data_.size());
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }

    GroupPtr group = NewSecp256k1Group();
    BnCtxPtr ctx(BN_CTX_new());
    BnPtr d(BN_bin2bn(data_.data(), SIZE, nullptr));
    if (!group || !ctx || !d) {
        return PublicKey();
    }

    // pubkey = d * G
    PointPtr point(EC_POINT_new(group.get()));
    if (!point ||
        !EC_POINT_mul(group.get(), point.get(), d.get(), nullptr, nullptr, ctx.get())) {
        return PublicKey();
    }

    std::array<Byte, PublicKey::SIZE> encoded{};
    if (!WritePoint(group.get(), point.get(), ctx.get(), encoded)) {
        return PublicKey();
    }
    return PublicKey(encoded.data(), encoded.size());
}

std::vector<Byte> PrivateKey::SignCompact(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }

    PublicKey pubkey = GetPublicKey();
    if (!pubkey.IsValid()) {
        return {};
    }

    EcKeyPtr eckey(EC_KEY_new_by_curve_name(NID_secp256k1));
    BnPtr d(BN_bin2bn(data_.data(), SIZE, nullptr));
    if (!eckey || !d || !EC_KEY_set_private_key(eckey.get(), d.get())) {
        return {};
    }

    EcdsaSigPtr sig(ECDSA_do_sign(hash.data(), static_cast<int>(hash.size()), eckey.get()));
    if (!sig) {
        return {};
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    // Normalize to low-s: s' = n - s when s > n/2
    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());
    BnPtr order(BN_new());
    BnPtr halfOrder(BN_new());
    BnPtr lowS(BN_dup(s));
    if (!order || !halfOrder || !lowS ||
        !EC_GROUP_get_order(group, order.get(), nullptr) ||
        !BN_rshift1(halfOrder.get(), order.get())) {
        return {};
    }
    if (BN_cmp(lowS.get(), halfOrder.get()) > 0 &&
        !BN_sub(lowS.get(), order.get(), lowS.get())) {
        return {};
    }

    std::vector<Byte> compact(COMPACT_SIGNATURE_SIZE, 0);
    if (!WriteScalar(r, compact.data()) || !WriteScalar(lowS.get(), compact.data() + 32)) {
        return {};
    }

    // Find the recovery id that yields our own key
    for (Byte recid = 0; recid < 2; ++recid) {
        compact[64] = static_cast<Byte>(27 + recid);
        auto recovered = PublicKey::RecoverCompact(hash, compact);
        if (recovered && *recovered == pubkey) {
            return compact;
        }
    }

    return {};
}

} // namespace quorum

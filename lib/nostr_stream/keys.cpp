// SPDX-License-Identifier: MIT

#include "nostr_stream/keys.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cstring>
#include <memory>
#include <stdexcept>

namespace nostr_stream {

namespace {

struct BnDeleter {
    void operator()(BIGNUM* b) const { BN_clear_free(b); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* c) const { BN_CTX_free(c); }
};
struct PointDeleter {
    void operator()(EC_POINT* p) const { EC_POINT_free(p); }
};
struct GroupDeleter {
    void operator()(EC_GROUP* g) const { EC_GROUP_free(g); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;

struct Curve {
    GroupPtr group;
    BnPtr p;               // field prime
    const BIGNUM* n;       // group order, owned by group
};

const Curve& Secp256k1() {
    static const Curve curve = [] {
        Curve c;
        c.group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
        if (!c.group) {
            throw std::runtime_error("secp256k1 is not available in this OpenSSL build");
        }
        c.p.reset(BN_new());
        BnCtxPtr ctx(BN_CTX_new());
        if (!c.p || !ctx ||
            EC_GROUP_get_curve(c.group.get(), c.p.get(), nullptr, nullptr, ctx.get()) != 1) {
            throw std::runtime_error("Failed to read secp256k1 parameters");
        }
        c.n = EC_GROUP_get0_order(c.group.get());
        return c;
    }();
    return curve;
}

BnPtr NewBn() {
    BnPtr bn(BN_new());
    if (!bn) throw std::bad_alloc();
    return bn;
}

BnPtr BnFromBytes(const std::uint8_t* data, size_t len) {
    BnPtr bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!bn) throw std::bad_alloc();
    return bn;
}

void BnToBytes32(const BIGNUM* bn, std::uint8_t* out) {
    BN_bn2binpad(bn, out, 32);
}

PointPtr NewPoint() {
    PointPtr p(EC_POINT_new(Secp256k1().group.get()));
    if (!p) throw std::bad_alloc();
    return p;
}

// Secret key as scalar, rejecting 0 and values >= n
BnPtr ScalarFromKey(const SecretKey& key) {
    auto d = BnFromBytes(key.data(), key.size());
    if (BN_is_zero(d.get()) || BN_cmp(d.get(), Secp256k1().n) >= 0) return nullptr;
    return d;
}

bool Affine(const EC_POINT* point, BIGNUM* x, BIGNUM* y, BN_CTX* ctx) {
    return EC_POINT_get_affine_coordinates(Secp256k1().group.get(), point, x, y, ctx) == 1;
}

// Point with the given x coordinate and even y, or null
PointPtr LiftX(std::string_view public_key, BN_CTX* ctx) {
    auto bytes = HexDecode(public_key);
    if (!bytes || bytes->size() != kKeySize) return nullptr;
    auto x = BnFromBytes(bytes->data(), bytes->size());
    if (BN_cmp(x.get(), Secp256k1().p.get()) >= 0) return nullptr;
    auto point = NewPoint();
    if (EC_POINT_set_compressed_coordinates(Secp256k1().group.get(), point.get(),
                                            x.get(), 0, ctx) != 1) {
        return nullptr;
    }
    return point;
}

Hash32 TaggedHash(std::string_view tag, std::span<const std::uint8_t> data) {
    Hash32 tag_hash = Sha256(tag);
    std::vector<std::uint8_t> buf;
    buf.reserve(64 + data.size());
    buf.insert(buf.end(), tag_hash.begin(), tag_hash.end());
    buf.insert(buf.end(), tag_hash.begin(), tag_hash.end());
    buf.insert(buf.end(), data.begin(), data.end());
    Hash32 out;
    SHA256(buf.data(), buf.size(), out.data());
    return out;
}

Error KeyError(std::string message) {
    return Error{ErrorCode::InvalidKey, std::move(message)};
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0f]);
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> HexDecode(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;
    std::vector<std::uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = HexValue(hex[i]);
        int lo = HexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::optional<SecretKey> SecretKeyFromHex(std::string_view hex) {
    auto bytes = HexDecode(hex);
    if (!bytes || bytes->size() != kKeySize) return std::nullopt;
    SecretKey key;
    std::memcpy(key.data(), bytes->data(), kKeySize);
    return key;
}

SecretKey GenerateSecretKey() {
    SecretKey key;
    for (;;) {
        if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        if (ScalarFromKey(key)) return key;
    }
}

std::expected<std::string, Error> DerivePublicKey(const SecretKey& key) {
    auto d = ScalarFromKey(key);
    if (!d) return std::unexpected(KeyError("Secret key is out of range"));

    BnCtxPtr ctx(BN_CTX_new());
    auto point = NewPoint();
    auto x = NewBn();
    if (!ctx ||
        EC_POINT_mul(Secp256k1().group.get(), point.get(), d.get(), nullptr, nullptr,
                     ctx.get()) != 1 ||
        !Affine(point.get(), x.get(), nullptr, ctx.get())) {
        return std::unexpected(KeyError("Public key derivation failed"));
    }
    std::array<std::uint8_t, kKeySize> out;
    BnToBytes32(x.get(), out.data());
    return HexEncode(out);
}

Hash32 Sha256(std::string_view data) {
    Hash32 out;
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
    return out;
}

std::expected<Signature, Error> SchnorrSign(const SecretKey& key, const Hash32& msg,
                                            const Hash32& aux) {
    const Curve& curve = Secp256k1();
    auto d0 = ScalarFromKey(key);
    if (!d0) return std::unexpected(KeyError("Secret key is out of range"));

    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) throw std::bad_alloc();

    // P = d'G; negate d' when P has odd y
    auto p = NewPoint();
    auto px = NewBn();
    auto py = NewBn();
    if (EC_POINT_mul(curve.group.get(), p.get(), d0.get(), nullptr, nullptr, ctx.get()) != 1 ||
        !Affine(p.get(), px.get(), py.get(), ctx.get())) {
        return std::unexpected(Error{ErrorCode::SigningFailed, "Point multiplication failed"});
    }
    auto d = NewBn();
    if (BN_is_odd(py.get())) {
        BN_sub(d.get(), curve.n, d0.get());
    } else {
        BN_copy(d.get(), d0.get());
    }

    std::array<std::uint8_t, 32> d_bytes;
    std::array<std::uint8_t, 32> px_bytes;
    BnToBytes32(d.get(), d_bytes.data());
    BnToBytes32(px.get(), px_bytes.data());

    Hash32 aux_hash = TaggedHash("BIP0340/aux", aux);
    std::vector<std::uint8_t> nonce_input(96);
    for (size_t i = 0; i < 32; ++i) {
        nonce_input[i] = d_bytes[i] ^ aux_hash[i];
    }
    std::memcpy(nonce_input.data() + 32, px_bytes.data(), 32);
    std::memcpy(nonce_input.data() + 64, msg.data(), 32);
    Hash32 rand = TaggedHash("BIP0340/nonce", nonce_input);

    auto k0 = BnFromBytes(rand.data(), rand.size());
    BN_nnmod(k0.get(), k0.get(), curve.n, ctx.get());
    if (BN_is_zero(k0.get())) {
        return std::unexpected(Error{ErrorCode::SigningFailed, "Derived nonce is zero"});
    }

    auto r = NewPoint();
    auto rx = NewBn();
    auto ry = NewBn();
    if (EC_POINT_mul(curve.group.get(), r.get(), k0.get(), nullptr, nullptr, ctx.get()) != 1 ||
        !Affine(r.get(), rx.get(), ry.get(), ctx.get())) {
        return std::unexpected(Error{ErrorCode::SigningFailed, "Point multiplication failed"});
    }
    auto k = NewBn();
    if (BN_is_odd(ry.get())) {
        BN_sub(k.get(), curve.n, k0.get());
    } else {
        BN_copy(k.get(), k0.get());
    }

    Signature sig;
    BnToBytes32(rx.get(), sig.data());

    std::vector<std::uint8_t> challenge(96);
    std::memcpy(challenge.data(), sig.data(), 32);
    std::memcpy(challenge.data() + 32, px_bytes.data(), 32);
    std::memcpy(challenge.data() + 64, msg.data(), 32);
    Hash32 e_hash = TaggedHash("BIP0340/challenge", challenge);
    auto e = BnFromBytes(e_hash.data(), e_hash.size());
    BN_nnmod(e.get(), e.get(), curve.n, ctx.get());

    // s = (k + e*d) mod n
    auto s = NewBn();
    if (BN_mod_mul(s.get(), e.get(), d.get(), curve.n, ctx.get()) != 1 ||
        BN_mod_add(s.get(), s.get(), k.get(), curve.n, ctx.get()) != 1) {
        return std::unexpected(Error{ErrorCode::SigningFailed, "Scalar arithmetic failed"});
    }
    BnToBytes32(s.get(), sig.data() + 32);
    return sig;
}

bool SchnorrVerify(std::string_view public_key, const Hash32& msg, const Signature& sig) {
    const Curve& curve = Secp256k1();
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) return false;

    auto p = LiftX(public_key, ctx.get());
    if (!p) return false;

    auto r = BnFromBytes(sig.data(), 32);
    auto s = BnFromBytes(sig.data() + 32, 32);
    if (BN_cmp(r.get(), curve.p.get()) >= 0 || BN_cmp(s.get(), curve.n) >= 0) {
        return false;
    }

    auto pk_bytes = HexDecode(public_key);
    std::vector<std::uint8_t> challenge(96);
    std::memcpy(challenge.data(), sig.data(), 32);
    std::memcpy(challenge.data() + 32, pk_bytes->data(), 32);
    std::memcpy(challenge.data() + 64, msg.data(), 32);
    Hash32 e_hash = TaggedHash("BIP0340/challenge", challenge);
    auto e = BnFromBytes(e_hash.data(), e_hash.size());
    BN_nnmod(e.get(), e.get(), curve.n, ctx.get());

    // R = sG - eP
    auto neg_e = NewBn();
    BN_sub(neg_e.get(), curve.n, e.get());
    BN_nnmod(neg_e.get(), neg_e.get(), curve.n, ctx.get());

    auto point = NewPoint();
    if (EC_POINT_mul(curve.group.get(), point.get(), s.get(), p.get(), neg_e.get(),
                     ctx.get()) != 1) {
        return false;
    }
    if (EC_POINT_is_at_infinity(curve.group.get(), point.get())) return false;

    auto rx = NewBn();
    auto ry = NewBn();
    if (!Affine(point.get(), rx.get(), ry.get(), ctx.get())) return false;
    return !BN_is_odd(ry.get()) && BN_cmp(rx.get(), r.get()) == 0;
}

std::expected<Hash32, Error> SharedSecretX(const SecretKey& key, std::string_view public_key) {
    auto d = ScalarFromKey(key);
    if (!d) return std::unexpected(KeyError("Secret key is out of range"));

    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) throw std::bad_alloc();
    auto p = LiftX(public_key, ctx.get());
    if (!p) return std::unexpected(KeyError("Public key is not a valid x-only key"));

    auto shared = NewPoint();
    auto x = NewBn();
    if (EC_POINT_mul(Secp256k1().group.get(), shared.get(), nullptr, p.get(), d.get(),
                     ctx.get()) != 1 ||
        !Affine(shared.get(), x.get(), nullptr, ctx.get())) {
        return std::unexpected(KeyError("ECDH failed"));
    }
    Hash32 out;
    BnToBytes32(x.get(), out.data());
    return out;
}

}  // namespace nostr_stream

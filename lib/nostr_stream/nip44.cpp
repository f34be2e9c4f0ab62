// SPDX-License-Identifier: MIT

#include "nostr_stream/nip44.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <bit>
#include <cstring>
#include <memory>
#include <span>
#include <vector>

#include "nostr_stream/base64.hpp"

namespace nostr_stream::nip44 {

namespace {

constexpr std::string_view kSalt = "nip44-v2";
constexpr size_t kNonceSize = 32;
constexpr size_t kMacSize = 32;
constexpr size_t kMinPayloadChars = 132;
constexpr size_t kMaxPayloadChars = 87472;
constexpr size_t kMinDecodedSize = 99;
constexpr size_t kMaxDecodedSize = 65603;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* c) const { EVP_CIPHER_CTX_free(c); }
};

struct MessageKeys {
    std::array<std::uint8_t, 32> chacha_key;
    std::array<std::uint8_t, 12> chacha_nonce;
    std::array<std::uint8_t, 32> hmac_key;
};

Hash32 HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
    Hash32 out;
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(), data.size(),
         out.data(), &len);
    return out;
}

MessageKeys GetMessageKeys(const Hash32& conversation_key, const Hash32& nonce) {
    // HKDF-expand to 76 bytes: three HMAC blocks
    std::array<std::uint8_t, 96> okm{};
    std::vector<std::uint8_t> block;
    Hash32 prev{};
    for (std::uint8_t i = 1; i <= 3; ++i) {
        block.clear();
        if (i > 1) block.insert(block.end(), prev.begin(), prev.end());
        block.insert(block.end(), nonce.begin(), nonce.end());
        block.push_back(i);
        prev = HmacSha256(conversation_key, block);
        std::memcpy(okm.data() + (i - 1) * 32, prev.data(), 32);
    }
    MessageKeys keys;
    std::memcpy(keys.chacha_key.data(), okm.data(), 32);
    std::memcpy(keys.chacha_nonce.data(), okm.data() + 32, 12);
    std::memcpy(keys.hmac_key.data(), okm.data() + 44, 32);
    return keys;
}

std::expected<std::vector<std::uint8_t>, Error> ChaCha20(const MessageKeys& keys,
                                                         std::span<const std::uint8_t> input) {
    // OpenSSL's IV is a 32-bit little-endian block counter followed by the nonce
    std::array<std::uint8_t, 16> iv{};
    std::memcpy(iv.data() + 4, keys.chacha_nonce.data(), keys.chacha_nonce.size());

    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(EVP_CIPHER_CTX_new());
    std::vector<std::uint8_t> out(input.size());
    int len = 0;
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_chacha20(), nullptr, keys.chacha_key.data(),
                           iv.data()) != 1 ||
        EVP_EncryptUpdate(ctx.get(), out.data(), &len, input.data(),
                          static_cast<int>(input.size())) != 1) {
        return std::unexpected(Error{ErrorCode::EncryptionFailed, "ChaCha20 failed"});
    }
    return out;
}

Hash32 Mac(const MessageKeys& keys, const Hash32& nonce,
           std::span<const std::uint8_t> ciphertext) {
    std::vector<std::uint8_t> data;
    data.reserve(nonce.size() + ciphertext.size());
    data.insert(data.end(), nonce.begin(), nonce.end());
    data.insert(data.end(), ciphertext.begin(), ciphertext.end());
    return HmacSha256(keys.hmac_key, data);
}

Error DecryptError(std::string message) {
    return Error{ErrorCode::DecryptionFailed, std::move(message)};
}

}  // namespace

std::expected<Hash32, Error> GetConversationKey(const SecretKey& key,
                                                std::string_view peer_public_key) {
    auto shared_x = SharedSecretX(key, peer_public_key);
    if (!shared_x) return std::unexpected(shared_x.error());
    // HKDF-extract: HMAC(salt, ikm)
    return HmacSha256(std::span<const std::uint8_t>(
                          reinterpret_cast<const std::uint8_t*>(kSalt.data()), kSalt.size()),
                      *shared_x);
}

size_t CalcPaddedLen(size_t unpadded_len) {
    if (unpadded_len <= 32) return 32;
    size_t next_power = size_t{1} << std::bit_width(unpadded_len - 1);
    size_t chunk = next_power <= 256 ? 32 : next_power / 8;
    return chunk * ((unpadded_len - 1) / chunk + 1);
}

std::expected<std::string, Error> Encrypt(std::string_view plaintext,
                                          const Hash32& conversation_key,
                                          const Hash32& nonce) {
    if (plaintext.size() < kMinPlaintextSize || plaintext.size() > kMaxPlaintextSize) {
        return std::unexpected(Error{ErrorCode::EncryptionFailed,
                                     "Invalid plaintext length " +
                                         std::to_string(plaintext.size())});
    }

    size_t len = plaintext.size();
    std::vector<std::uint8_t> padded(2 + CalcPaddedLen(len), 0);
    padded[0] = static_cast<std::uint8_t>(len >> 8);
    padded[1] = static_cast<std::uint8_t>(len & 0xff);
    std::memcpy(padded.data() + 2, plaintext.data(), len);

    auto keys = GetMessageKeys(conversation_key, nonce);
    auto ciphertext = ChaCha20(keys, padded);
    if (!ciphertext) return std::unexpected(ciphertext.error());
    Hash32 mac = Mac(keys, nonce, *ciphertext);

    Bytes payload;
    payload.reserve(1 + nonce.size() + ciphertext->size() + mac.size());
    auto append = [&payload](std::span<const std::uint8_t> s) {
        const auto* p = reinterpret_cast<const std::byte*>(s.data());
        payload.insert(payload.end(), p, p + s.size());
    };
    payload.push_back(std::byte{kVersion});
    append(nonce);
    append(*ciphertext);
    append(mac);
    return Base64Encode(payload);
}

std::expected<std::string, Error> Encrypt(std::string_view plaintext,
                                          const Hash32& conversation_key) {
    Hash32 nonce;
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        return std::unexpected(Error{ErrorCode::EncryptionFailed, "RAND_bytes failed"});
    }
    return Encrypt(plaintext, conversation_key, nonce);
}

std::expected<std::string, Error> Decrypt(std::string_view payload,
                                          const Hash32& conversation_key) {
    if (!payload.empty() && payload[0] == '#') {
        return std::unexpected(DecryptError("Unknown encryption version"));
    }
    if (payload.size() < kMinPayloadChars || payload.size() > kMaxPayloadChars) {
        return std::unexpected(DecryptError("Invalid payload size " +
                                            std::to_string(payload.size())));
    }
    auto decoded = Base64Decode(payload);
    if (!decoded) return std::unexpected(DecryptError("Invalid base64"));
    if (decoded->size() < kMinDecodedSize || decoded->size() > kMaxDecodedSize) {
        return std::unexpected(DecryptError("Invalid data size " +
                                            std::to_string(decoded->size())));
    }

    const auto* data = reinterpret_cast<const std::uint8_t*>(decoded->data());
    if (data[0] != kVersion) {
        return std::unexpected(DecryptError("Unknown encryption version " +
                                            std::to_string(data[0])));
    }
    Hash32 nonce;
    std::memcpy(nonce.data(), data + 1, kNonceSize);
    std::span<const std::uint8_t> ciphertext(data + 1 + kNonceSize,
                                             decoded->size() - 1 - kNonceSize - kMacSize);
    const std::uint8_t* mac = data + decoded->size() - kMacSize;

    auto keys = GetMessageKeys(conversation_key, nonce);
    Hash32 expected_mac = Mac(keys, nonce, ciphertext);
    if (CRYPTO_memcmp(expected_mac.data(), mac, kMacSize) != 0) {
        return std::unexpected(DecryptError("Invalid MAC"));
    }

    auto padded = ChaCha20(keys, ciphertext);
    if (!padded) return std::unexpected(DecryptError(padded.error().message));

    size_t len = (static_cast<size_t>((*padded)[0]) << 8) | (*padded)[1];
    if (len < kMinPlaintextSize || len > padded->size() - 2 ||
        padded->size() != 2 + CalcPaddedLen(len)) {
        return std::unexpected(DecryptError("Invalid padding"));
    }
    return std::string(reinterpret_cast<const char*>(padded->data() + 2), len);
}

}  // namespace nostr_stream::nip44

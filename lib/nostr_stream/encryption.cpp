// SPDX-License-Identifier: MIT

#include "nostr_stream/encryption.hpp"

#include <fmt/format.h>

#include "nostr_stream/base64.hpp"
#include "nostr_stream/log.hpp"
#include "nostr_stream/nip44.hpp"

namespace nostr_stream {

namespace {

Error UnsupportedMethod(std::string_view method) {
    return Error{ErrorCode::UnsupportedMethod,
                 fmt::format("Unsupported encryption method '{}'", method)};
}

std::string AsText(const Payload& data) {
    if (const auto* bytes = std::get_if<Bytes>(&data)) return Base64Encode(*bytes);
    return std::get<std::string>(data);
}

}  // namespace

bool DefaultEncryption::Supports(std::string_view method) const {
    return method == kEncryptionNone || method == kEncryptionNip44;
}

std::optional<size_t> DefaultEncryption::MaxChunkSize(std::string_view method) const {
    if (method == kEncryptionNip44) return kNip44MaxChunkSize;
    return std::nullopt;
}

std::expected<std::string, Error> DefaultEncryption::Encrypt(
    const Payload& data, std::string_view method, const SecretKey& sender_key,
    std::string_view receiver_public_key) {
    std::string text = AsText(data);
    if (method == kEncryptionNone) return text;
    if (method != kEncryptionNip44) return std::unexpected(UnsupportedMethod(method));

    auto conversation_key = nip44::GetConversationKey(sender_key, receiver_public_key);
    if (!conversation_key) {
        return std::unexpected(Error{
            ErrorCode::EncryptionFailed,
            "NIP-44 encryption failed: " + conversation_key.error().message});
    }
    auto payload = nip44::Encrypt(text, *conversation_key);
    if (!payload) {
        Logger()->debug("NIP-44 encryption failed: {}", payload.error().message);
        return std::unexpected(Error{ErrorCode::EncryptionFailed,
                                     "NIP-44 encryption failed: " + payload.error().message});
    }
    return std::move(*payload);
}

std::expected<Payload, Error> DefaultEncryption::Decrypt(std::string_view data,
                                                         std::string_view method, bool binary,
                                                         const SecretKey& receiver_key,
                                                         std::string_view sender_public_key) {
    std::string plaintext;
    if (method == kEncryptionNone) {
        plaintext = std::string(data);
    } else if (method == kEncryptionNip44) {
        auto conversation_key = nip44::GetConversationKey(receiver_key, sender_public_key);
        if (!conversation_key) {
            return std::unexpected(Error{
                ErrorCode::DecryptionFailed,
                "NIP-44 decryption failed: " + conversation_key.error().message});
        }
        auto decrypted = nip44::Decrypt(data, *conversation_key);
        if (!decrypted) {
            Logger()->debug("NIP-44 decryption failed: {}", decrypted.error().message);
            return std::unexpected(Error{
                ErrorCode::DecryptionFailed,
                "NIP-44 decryption failed: " + decrypted.error().message});
        }
        plaintext = std::move(*decrypted);
    } else {
        return std::unexpected(UnsupportedMethod(method));
    }

    if (!binary) return plaintext;
    auto bytes = Base64Decode(plaintext);
    if (!bytes) {
        return std::unexpected(Error{ErrorCode::DecryptionFailed,
                                     "Decrypted payload is not valid base64"});
    }
    return std::move(*bytes);
}

}  // namespace nostr_stream

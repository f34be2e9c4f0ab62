// SPDX-License-Identifier: MIT

#include "nostr_stream/metadata.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace nostr_stream {

namespace {

void ValidateCommon(const StreamMetadata& meta) {
    if (meta.stream_id.empty()) {
        throw std::invalid_argument("Stream ID is required");
    }
    if (meta.relays.empty()) {
        throw std::invalid_argument("At least one relay is required");
    }
    if (meta.version && *meta.version != kProtocolVersion) {
        throw std::invalid_argument(fmt::format(
            "Unsupported protocol version: {}. Only version \"1\" is supported.", *meta.version));
    }
    if (meta.encryption.empty()) {
        throw std::invalid_argument("Unspecified encryption");
    }
    if (meta.compression.empty()) {
        throw std::invalid_argument("Unspecified compression");
    }
    if (meta.IsEncrypted() && meta.receiver_public_key.empty()) {
        throw std::invalid_argument(
            "Recipient public key (receiver_pubkey) is required for encryption");
    }
}

Error Invalid(std::string message) {
    return Error{ErrorCode::InvalidMetadata, std::move(message)};
}

}  // namespace

void ValidateForWriter(const StreamMetadata& meta) {
    ValidateCommon(meta);
}

void ValidateForReader(const StreamMetadata& meta) {
    ValidateCommon(meta);
    if (!meta.IsEncrypted()) return;

    if (!meta.receiver_private_key) {
        throw std::invalid_argument(
            "Recipient private key (receiver_privkey) is required for decryption");
    }
    auto derived = DerivePublicKey(*meta.receiver_private_key);
    if (!derived || *derived != meta.receiver_public_key) {
        throw std::invalid_argument(
            "Recipient public key (receiver_pubkey) does not match the key derived "
            "from receiver_privkey");
    }
}

std::expected<Message, Error> CreateMetadataMessage(const StreamMetadata& meta,
                                                    ISigner& signer,
                                                    const SecretKey& sender_key) {
    Tags tags = {
        {"version", meta.version.value_or(std::string(kProtocolVersion))},
        {"encryption", meta.encryption},
        {"compression", meta.compression},
        {"binary", meta.binary ? "true" : "false"},
    };
    for (const auto& relay : meta.relays) {
        tags.push_back({"relay", relay});
    }
    if (meta.IsEncrypted() && !meta.receiver_public_key.empty()) {
        tags.push_back({"receiver_pubkey", meta.receiver_public_key});
    }
    return signer.Sign(kStreamMetadataKind, "", std::move(tags), sender_key);
}

std::expected<StreamMetadata, Error> ParseMetadataMessage(const Message& msg) {
    if (!VerifyMessage(msg)) {
        return std::unexpected(Invalid("Invalid message: signature verification failed"));
    }
    if (msg.kind != kStreamMetadataKind) {
        return std::unexpected(Invalid(fmt::format(
            "Invalid message kind: {}. Expected kind {} for stream metadata.",
            msg.kind, kStreamMetadataKind)));
    }

    auto version = FindTag(msg, "version");
    auto encryption = FindTag(msg, "encryption");
    auto compression = FindTag(msg, "compression");
    auto binary = FindTag(msg, "binary");
    auto relays = FindTags(msg, "relay");
    if (!version) return std::unexpected(Invalid("Missing 'version' tag in metadata"));
    if (!encryption) return std::unexpected(Invalid("Missing 'encryption' tag in metadata"));
    if (!compression) return std::unexpected(Invalid("Missing 'compression' tag in metadata"));
    if (!binary) return std::unexpected(Invalid("Missing 'binary' tag in metadata"));
    if (relays.empty()) return std::unexpected(Invalid("Missing 'relay' tags in metadata"));

    StreamMetadata meta;
    meta.stream_id = msg.pubkey;
    meta.version = std::string(*version);
    meta.encryption = std::string(*encryption);
    meta.compression = std::string(*compression);
    meta.binary = *binary == "true";
    meta.relays = std::move(relays);
    if (meta.IsEncrypted()) {
        if (auto receiver = FindTag(msg, "receiver_pubkey")) {
            meta.receiver_public_key = std::string(*receiver);
        }
    }
    return meta;
}

}  // namespace nostr_stream

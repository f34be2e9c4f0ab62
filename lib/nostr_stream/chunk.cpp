// SPDX-License-Identifier: MIT

#include "nostr_stream/chunk.hpp"

#include <charconv>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "nostr_stream/base64.hpp"

namespace nostr_stream {

namespace {

bool NeedsBinaryTransport(const StreamMetadata& meta) {
    return meta.binary || meta.compression != kCompressionNone;
}

}  // namespace

std::optional<ChunkStatus> ParseChunkStatus(std::string_view s) {
    if (s == "active") return ChunkStatus::Active;
    if (s == "done") return ChunkStatus::Done;
    if (s == "error") return ChunkStatus::Error;
    return std::nullopt;
}

Tags MakeChunkTags(uint64_t index, ChunkStatus status, std::string_view prev) {
    Tags tags = {
        {"i", std::to_string(index)},
        {"status", std::string(ToString(status))},
    };
    if (!prev.empty()) {
        tags.push_back({"prev", std::string(prev)});
    }
    return tags;
}

std::optional<ChunkHeader> ParseChunkHeader(const Message& msg) {
    auto index_tag = FindTag(msg, "i");
    if (!index_tag || index_tag->empty()) return std::nullopt;

    ChunkHeader header;
    const char* first = index_tag->data();
    const char* last = first + index_tag->size();
    auto [ptr, ec] = std::from_chars(first, last, header.index);
    if (ec != std::errc{} || ptr != last) return std::nullopt;

    auto status_tag = FindTag(msg, "status");
    if (!status_tag) return std::nullopt;
    auto status = ParseChunkStatus(*status_tag);
    if (!status) return std::nullopt;
    header.status = *status;

    if (auto prev = FindTag(msg, "prev")) {
        header.prev = std::string(*prev);
    }
    return header;
}

std::expected<std::string, Error> EncodeChunkContent(const Payload& batch,
                                                     const StreamMetadata& meta,
                                                     IEncryption& encryption,
                                                     const SecretKey& sender_key) {
    if (meta.IsEncrypted()) {
        // Ciphertext is never empty, so an empty batch travels as empty content
        if (PayloadSize(batch) == 0) return std::string{};
        return encryption.Encrypt(batch, meta.encryption, sender_key, meta.receiver_public_key);
    }
    if (const auto* text = std::get_if<std::string>(&batch)) {
        return *text;
    }
    const auto& bytes = std::get<Bytes>(batch);
    if (NeedsBinaryTransport(meta)) return Base64Encode(bytes);
    return ToString(bytes);
}

std::expected<Payload, Error> DecodeChunkContent(std::string_view content,
                                                 const StreamMetadata& meta,
                                                 ICompression& compression,
                                                 IEncryption& encryption,
                                                 std::optional<size_t> max_size) {
    bool binary_or_compressed = NeedsBinaryTransport(meta);
    if (meta.IsEncrypted() && content.empty()) return EmptyPayload(meta.binary);

    Payload data;
    if (!meta.IsEncrypted() && binary_or_compressed) {
        auto decoded = Base64Decode(content);
        if (!decoded) {
            return std::unexpected(Error{ErrorCode::DecodeFailed,
                                         "Failed to decode base64 content"});
        }
        data = std::move(*decoded);
    } else {
        data = std::string(content);
    }

    if (meta.IsEncrypted()) {
        if (!meta.receiver_private_key) {
            return std::unexpected(Error{ErrorCode::DecryptionFailed,
                                         "Missing receiver private key"});
        }
        auto decrypted = encryption.Decrypt(std::get<std::string>(data), meta.encryption,
                                            binary_or_compressed, *meta.receiver_private_key,
                                            meta.stream_id);
        if (!decrypted) {
            return std::unexpected(Error{ErrorCode::DecryptionFailed,
                                         "Failed to decrypt chunk: " + decrypted.error().message});
        }
        data = std::move(*decrypted);
    }

    if (meta.compression == kCompressionNone) return data;

    auto decompressed = compression.Decompress(data, meta.compression, meta.binary, max_size);
    if (!decompressed) {
        if (decompressed.error().code == ErrorCode::MaxSizeExceeded) {
            return std::unexpected(std::move(decompressed.error()));
        }
        return std::unexpected(Error{ErrorCode::DecompressionFailed,
                                     decompressed.error().message});
    }
    return std::move(*decompressed);
}

std::string EncodeErrorContent(std::string_view code, std::string_view message) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> w(buffer);
    w.StartObject();
    w.Key("code");
    w.String(code.data(), static_cast<rapidjson::SizeType>(code.size()));
    w.Key("message");
    w.String(message.data(), static_cast<rapidjson::SizeType>(message.size()));
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::expected<Error, Error> ParseErrorContent(std::string_view content) {
    Error parse_error{ErrorCode::ParseError, "Failed to parse error content"};

    rapidjson::Document doc;
    doc.Parse(content.data(), content.size());
    if (doc.HasParseError() || !doc.IsObject()) return std::unexpected(parse_error);

    auto code = doc.FindMember("code");
    auto message = doc.FindMember("message");
    if (code == doc.MemberEnd() || !code->value.IsString() ||
        message == doc.MemberEnd() || !message->value.IsString()) {
        return std::unexpected(parse_error);
    }
    return Error{
        .code = ErrorCode::RemoteError,
        .message = std::string(message->value.GetString(), message->value.GetStringLength()),
        .remote_code = std::string(code->value.GetString(), code->value.GetStringLength()),
    };
}

}  // namespace nostr_stream

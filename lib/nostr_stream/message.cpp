// SPDX-License-Identifier: MIT

#include "nostr_stream/message.hpp"

#include <algorithm>
#include <cstring>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "nostr_stream/keys.hpp"

namespace nostr_stream {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void WriteString(JsonWriter& w, std::string_view s) {
    w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
}

void WriteTags(JsonWriter& w, const Tags& tags) {
    w.StartArray();
    for (const auto& tag : tags) {
        w.StartArray();
        for (const auto& v : tag) WriteString(w, v);
        w.EndArray();
    }
    w.EndArray();
}

std::string_view View(const rapidjson::Value& v) {
    return std::string_view(v.GetString(), v.GetStringLength());
}

Error ParseFailure(std::string message) {
    return Error{ErrorCode::ParseError, std::move(message)};
}

}  // namespace

std::optional<std::string_view> FindTag(const Message& msg, std::string_view name) {
    for (const auto& tag : msg.tags) {
        if (tag.size() >= 2 && tag[0] == name) return std::string_view(tag[1]);
    }
    return std::nullopt;
}

std::vector<std::string> FindTags(const Message& msg, std::string_view name) {
    std::vector<std::string> out;
    for (const auto& tag : msg.tags) {
        if (tag.size() >= 2 && tag[0] == name) out.push_back(tag[1]);
    }
    return out;
}

std::string CanonicalSerialization(const Message& msg) {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartArray();
    w.Int(0);
    WriteString(w, msg.pubkey);
    w.Int64(msg.created_at);
    w.Int(msg.kind);
    WriteTags(w, msg.tags);
    WriteString(w, msg.content);
    w.EndArray();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string ComputeMessageId(const Message& msg) {
    return HexEncode(Sha256(CanonicalSerialization(msg)));
}

bool VerifyMessage(const Message& msg) {
    if (ComputeMessageId(msg) != msg.id) return false;
    auto id = HexDecode(msg.id);
    auto sig = HexDecode(msg.sig);
    if (!id || id->size() != 32 || !sig || sig->size() != 64) return false;
    Hash32 hash;
    Signature signature;
    std::memcpy(hash.data(), id->data(), hash.size());
    std::memcpy(signature.data(), sig->data(), signature.size());
    return SchnorrVerify(msg.pubkey, hash, signature);
}

std::string ToJson(const Message& msg) {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    w.Key("id");
    WriteString(w, msg.id);
    w.Key("pubkey");
    WriteString(w, msg.pubkey);
    w.Key("created_at");
    w.Int64(msg.created_at);
    w.Key("kind");
    w.Int(msg.kind);
    w.Key("tags");
    WriteTags(w, msg.tags);
    w.Key("content");
    WriteString(w, msg.content);
    w.Key("sig");
    WriteString(w, msg.sig);
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::expected<Message, Error> MessageFromJson(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        return std::unexpected(ParseFailure(
            std::string("Message JSON parse failed: ") +
            rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return std::unexpected(ParseFailure("Message JSON is not an object"));
    }

    auto string_field = [&](const char* name) -> const rapidjson::Value* {
        auto it = doc.FindMember(name);
        if (it == doc.MemberEnd() || !it->value.IsString()) return nullptr;
        return &it->value;
    };

    const auto* id = string_field("id");
    const auto* pubkey = string_field("pubkey");
    const auto* content = string_field("content");
    const auto* sig = string_field("sig");
    auto created_at = doc.FindMember("created_at");
    auto kind = doc.FindMember("kind");
    auto tags = doc.FindMember("tags");
    if (!id || !pubkey || !content || !sig ||
        created_at == doc.MemberEnd() || !created_at->value.IsInt64() ||
        kind == doc.MemberEnd() || !kind->value.IsInt() ||
        tags == doc.MemberEnd() || !tags->value.IsArray()) {
        return std::unexpected(ParseFailure("Message JSON is missing required fields"));
    }

    Message msg;
    msg.id = std::string(View(*id));
    msg.pubkey = std::string(View(*pubkey));
    msg.created_at = created_at->value.GetInt64();
    msg.kind = kind->value.GetInt();
    msg.content = std::string(View(*content));
    msg.sig = std::string(View(*sig));
    for (const auto& tag : tags->value.GetArray()) {
        if (!tag.IsArray()) {
            return std::unexpected(ParseFailure("Message tag is not an array"));
        }
        Tag out;
        for (const auto& v : tag.GetArray()) {
            if (!v.IsString()) {
                return std::unexpected(ParseFailure("Message tag value is not a string"));
            }
            out.emplace_back(View(v));
        }
        msg.tags.push_back(std::move(out));
    }
    return msg;
}

bool Filter::Matches(const Message& msg) const {
    if (!kinds.empty() &&
        std::find(kinds.begin(), kinds.end(), msg.kind) == kinds.end()) {
        return false;
    }
    if (!authors.empty() &&
        std::find(authors.begin(), authors.end(), msg.pubkey) == authors.end()) {
        return false;
    }
    return true;
}

}  // namespace nostr_stream

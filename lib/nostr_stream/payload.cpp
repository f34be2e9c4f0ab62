// SPDX-License-Identifier: MIT

#include "nostr_stream/payload.hpp"

#include <algorithm>

namespace nostr_stream {

namespace {

bool IsContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::vector<Payload> SplitText(const std::string& s, size_t max_part) {
    std::vector<Payload> parts;
    size_t offset = 0;
    while (offset < s.size()) {
        size_t end = std::min(offset + max_part, s.size());
        // Back off to a code point boundary
        while (end < s.size() && end > offset && IsContinuation(s[end])) {
            --end;
        }
        // A single code point wider than max_part goes out whole
        if (end == offset) {
            end = offset + 1;
            while (end < s.size() && IsContinuation(s[end])) ++end;
        }
        parts.emplace_back(s.substr(offset, end - offset));
        offset = end;
    }
    return parts;
}

std::vector<Payload> SplitBytes(const Bytes& b, size_t max_part) {
    std::vector<Payload> parts;
    size_t offset = 0;
    while (offset < b.size()) {
        size_t end = std::min(offset + max_part, b.size());
        parts.emplace_back(Bytes(b.begin() + offset, b.begin() + end));
        offset = end;
    }
    return parts;
}

// Expected sequence length for a lead byte, 0 for anything else.
size_t SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

}  // namespace

std::vector<Payload> SplitPayload(const Payload& data, size_t max_part) {
    if (PayloadSize(data) == 0) return {};
    if (max_part == 0) return {data};
    if (const auto* s = std::get_if<std::string>(&data)) {
        return SplitText(*s, max_part);
    }
    return SplitBytes(std::get<Bytes>(data), max_part);
}

size_t CompleteUtf8Prefix(std::string_view text) {
    size_t n = text.size();
    size_t pos = n;
    while (pos > 0 && n - pos < 4) {
        --pos;
        if (IsContinuation(text[pos])) continue;
        size_t want = SequenceLength(static_cast<unsigned char>(text[pos]));
        return want > n - pos ? pos : n;
    }
    return n;
}

}  // namespace nostr_stream

// SPDX-License-Identifier: MIT

#include "nostr_stream/signer.hpp"

#include <openssl/rand.h>

#include <chrono>
#include <cstring>

namespace nostr_stream {

SchnorrSigner::SchnorrSigner()
    : clock_([] {
          return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
              std::chrono::system_clock::now().time_since_epoch()).count());
      }) {}

std::expected<Message, Error> SchnorrSigner::Sign(int kind, std::string content, Tags tags,
                                                  const SecretKey& key) {
    auto pubkey = DerivePublicKey(key);
    if (!pubkey) return std::unexpected(pubkey.error());

    Message msg;
    msg.pubkey = std::move(*pubkey);
    msg.created_at = clock_();
    msg.kind = kind;
    msg.tags = std::move(tags);
    msg.content = std::move(content);
    msg.id = ComputeMessageId(msg);

    auto id = HexDecode(msg.id);
    Hash32 hash;
    std::memcpy(hash.data(), id->data(), hash.size());

    Hash32 aux;
    if (RAND_bytes(aux.data(), static_cast<int>(aux.size())) != 1) {
        return std::unexpected(Error{ErrorCode::SigningFailed, "RAND_bytes failed"});
    }
    auto sig = SchnorrSign(key, hash, aux);
    if (!sig) return std::unexpected(sig.error());
    msg.sig = HexEncode(*sig);
    return msg;
}

}  // namespace nostr_stream

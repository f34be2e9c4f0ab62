// SPDX-License-Identifier: MIT

// lib/nostr_stream/reader.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "nostr_stream/compression.hpp"
#include "nostr_stream/config.hpp"
#include "nostr_stream/encryption.hpp"
#include "nostr_stream/error.hpp"
#include "nostr_stream/event_loop.hpp"
#include "nostr_stream/message.hpp"
#include "nostr_stream/metadata.hpp"
#include "nostr_stream/payload.hpp"
#include "nostr_stream/pull_queue.hpp"
#include "nostr_stream/relay.hpp"
#include "nostr_stream/timer.hpp"

namespace nostr_stream {

/// Reader lifecycle.
enum class ReaderState {
    Idle,     ///< Constructed, not subscribed yet
    Active,   ///< Subscribed, chunks flowing
    Done,     ///< Terminal chunk delivered
    Errored,  ///< Failed; every pull reports the error
    Closed,   ///< Closed by the consumer
};

/// Consumer side of a stream.
///
/// Chunks arrive in any order and possibly several times (once per relay).
/// Each accepted chunk is buffered under its `prev` reference; the buffer
/// is then walked from the reference the reader is waiting for (initially
/// empty, meaning chunk 0), so delivery order follows the chain of message
/// ids rather than arrival order.
///
/// Decoded chunks are handed out through Next(). The subscription starts
/// on the first Next(). The transport and strategies are borrowed and must
/// outlive the reader.
///
/// Thread safety: all methods must be called from the event loop thread.
///
/// @code
/// auto reader = StreamReader::Create(loop, relay, meta, compression, encryption);
/// std::function<void()> pull = [&] {
///     reader->Next([&](auto r) {
///         if (!r) { handle(r.error()); return; }
///         if (!*r) return;  // finished
///         consume(**r);
///         pull();
///     });
/// };
/// pull();
/// @endcode
class StreamReader : public std::enable_shared_from_this<StreamReader> {
    struct PrivateTag {};

public:
    /// Next decoded chunk, nullopt once finished, or the stream's error.
    using NextResult = std::expected<std::optional<Payload>, Error>;
    using NextCallback = std::function<void(NextResult)>;

    /// @throws std::invalid_argument if the metadata is invalid, a method
    ///         is unsupported, or the receiver key pair does not match
    static std::shared_ptr<StreamReader> Create(IEventLoop& loop, IRelayTransport& transport,
                                                StreamMetadata metadata,
                                                ICompression& compression,
                                                IEncryption& encryption,
                                                ReaderConfig config = {});

    /// @internal
    StreamReader(PrivateTag, IEventLoop& loop, IRelayTransport& transport,
                 StreamMetadata metadata, ICompression& compression, IEncryption& encryption,
                 ReaderConfig config);

    ~StreamReader();

    StreamReader(const StreamReader&) = delete;
    StreamReader& operator=(const StreamReader&) = delete;

    /// Pull the next chunk. Completes inline if a chunk is buffered or the
    /// stream already ended, otherwise when the next chunk is decoded.
    void Next(NextCallback callback);

    /// Stop reading. Pending and later pulls report finished; no error.
    void Close();

    /// Ingest one message from the transport.
    ///
    /// Messages of another kind or author, with malformed chunk tags, or
    /// already seen are dropped silently.
    void OnMessage(const Message& msg);

    ReaderState state() const { return state_; }

    /// Chunks accepted so far (delivered or buffered).
    size_t ChunkCount() const { return chunk_count_; }

    /// Decoded bytes delivered so far.
    size_t TotalSize() const { return total_size_; }

    /// Chunks waiting for their predecessor.
    size_t Buffered() const { return buffer_.size(); }

private:
    void Start();
    void Drain();
    void CheckTtl();
    void Finish();
    void Fail(Error error);
    void Teardown();
    bool IsTerminal() const;

    IEventLoop& loop_;
    IRelayTransport& transport_;
    StreamMetadata metadata_;
    ICompression& compression_;
    IEncryption& encryption_;
    ReaderConfig config_;

    ReaderState state_ = ReaderState::Idle;
    std::unordered_map<std::string, Message> buffer_;  // keyed by prev
    std::unordered_set<std::string> seen_ids_;
    std::string next_ref_;
    size_t chunk_count_ = 0;
    size_t total_size_ = 0;
    bool draining_ = false;
    IEventLoop::Clock::time_point last_message_time_{};

    std::unique_ptr<ISubscription> subscription_;
    Timer watchdog_;
    PullQueue<Payload> queue_;
};

}  // namespace nostr_stream

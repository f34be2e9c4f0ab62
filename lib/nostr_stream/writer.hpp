// SPDX-License-Identifier: MIT

// lib/nostr_stream/writer.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nostr_stream/chunk.hpp"
#include "nostr_stream/compression.hpp"
#include "nostr_stream/config.hpp"
#include "nostr_stream/encryption.hpp"
#include "nostr_stream/error.hpp"
#include "nostr_stream/event_loop.hpp"
#include "nostr_stream/metadata.hpp"
#include "nostr_stream/payload.hpp"
#include "nostr_stream/relay.hpp"
#include "nostr_stream/signer.hpp"
#include "nostr_stream/timer.hpp"

namespace nostr_stream {

/// Producer side of a stream.
///
/// Batches writes into a compressor, turns every flushed batch into one
/// signed chunk that references the previous chunk's id, and publishes it
/// to all relays of the stream. A chunk counts as published once any relay
/// accepts it; a chunk no relay accepts fails the whole stream, which then
/// ends with an error chunk.
///
/// The transport, signer and strategies are borrowed and must outlive the
/// writer. In-flight publishes keep the writer alive until they settle.
///
/// Lifecycle: single-use. Write(..., true) or Error() ends the stream.
///
/// Thread safety: all methods must be called from the event loop thread.
///
/// @code
/// auto writer = StreamWriter::Create(loop, relay, meta, key, signer,
///                                    compression, encryption);
/// writer->Write(std::string("hello"), false, [](auto r) { ... });
/// writer->Write(std::string(" world"), true, [](auto r) { ... });
/// @endcode
class StreamWriter : public std::enable_shared_from_this<StreamWriter> {
    struct PrivateTag {};

public:
    using Callback = std::function<void(std::expected<void, nostr_stream::Error>)>;

    /// Publishes outstanding beyond which new chunks wait in the outbox.
    static constexpr size_t kMaxPendingPublishes = 10;

    /// @throws std::invalid_argument if the metadata is invalid, a method
    ///         is unsupported, or @p sender_key does not own the stream id
    static std::shared_ptr<StreamWriter> Create(IEventLoop& loop, IRelayTransport& transport,
                                                StreamMetadata metadata,
                                                const SecretKey& sender_key, ISigner& signer,
                                                ICompression& compression,
                                                IEncryption& encryption,
                                                WriterConfig config = {});

    /// @internal
    StreamWriter(PrivateTag, IEventLoop& loop, IRelayTransport& transport,
                 StreamMetadata metadata, const SecretKey& sender_key, ISigner& signer,
                 ICompression& compression, IEncryption& encryption, WriterConfig config);

    ~StreamWriter();

    StreamWriter(const StreamWriter&) = delete;
    StreamWriter& operator=(const StreamWriter&) = delete;

    /// Append @p data to the stream; @p done marks the final write.
    ///
    /// @p callback completes once every chunk this write produced has been
    /// handed to the transport. For the final write it completes after
    /// every publish has settled and resources are released, with the
    /// first publish failure seen, if any.
    void Write(Payload data, bool done, Callback callback);

    /// Terminate the stream with an error chunk carrying {code, message}.
    ///
    /// Flushes the pending batch first. @p callback completes after every
    /// publish has settled. Fails if the stream is already done or failed.
    void Error(std::string_view code, std::string_view message, Callback callback);

    /// Release the timer and compressor. Later writes fail.
    void Dispose();

    /// active, done or error.
    ChunkStatus status() const;

    /// Chunks signed so far (the next chunk index).
    uint64_t ChunkCount() const { return next_index_; }

    /// Id of the last chunk signed, empty before the first.
    const std::string& LastChunkId() const { return last_chunk_id_; }

    /// Per-chunk payload ceiling in effect for the current batch.
    size_t MaxChunkSize() const;

    /// Largest part a write is split into.
    size_t MaxPartSize() const;

private:
    struct Outgoing {
        uint64_t index;
        Message message;
    };

    struct IssueWaiter {
        uint64_t target;
        Callback callback;
    };

    std::expected<void, nostr_stream::Error> EnsureCompressor();
    std::expected<void, nostr_stream::Error> Compress(const Payload& part);
    std::expected<void, nostr_stream::Error> Flush(ChunkStatus status);
    std::expected<void, nostr_stream::Error> Emit(std::string content, ChunkStatus status);
    std::expected<void, nostr_stream::Error> SendError(std::string_view code,
                                                       std::string_view message,
                                                       bool best_effort);

    void PumpOutbox();
    void OnPublished(uint64_t index,
                     std::expected<std::vector<std::string>, nostr_stream::Error> result);
    void OnBatchTimer();

    /// Internal failure path: flush, publish an error chunk, settle. Runs once.
    void Abort(nostr_stream::Error cause);

    void ResolveIssueWaiters();
    void CheckSettled();
    void Release();
    void Complete(Callback callback, std::expected<void, nostr_stream::Error> result);

    IEventLoop& loop_;
    IRelayTransport& transport_;
    StreamMetadata metadata_;
    SecretKey sender_key_;
    ISigner& signer_;
    ICompression& compression_;
    IEncryption& encryption_;
    WriterConfig config_;

    std::unique_ptr<ICompressor> compressor_;
    size_t current_size_ = 0;
    std::optional<IEventLoop::Clock::time_point> last_flush_time_;
    Timer batch_timer_;

    uint64_t next_index_ = 0;
    std::string last_chunk_id_;
    bool done_ = false;
    bool failed_ = false;
    bool disposed_ = false;
    bool released_ = false;

    std::deque<Outgoing> outbox_;
    size_t in_flight_ = 0;
    uint64_t issued_count_ = 0;
    std::optional<nostr_stream::Error> abort_cause_;
    std::optional<nostr_stream::Error> publish_failure_;

    std::deque<IssueWaiter> issue_waiters_;
    std::vector<Callback> settle_waiters_;
};

}  // namespace nostr_stream

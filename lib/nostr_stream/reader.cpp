// SPDX-License-Identifier: MIT

#include "nostr_stream/reader.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>

#include <fmt/format.h>

#include "nostr_stream/chunk.hpp"
#include "nostr_stream/log.hpp"

namespace nostr_stream {

std::shared_ptr<StreamReader> StreamReader::Create(IEventLoop& loop, IRelayTransport& transport,
                                                   StreamMetadata metadata,
                                                   ICompression& compression,
                                                   IEncryption& encryption,
                                                   ReaderConfig config) {
    ValidateForReader(metadata);
    if (!compression.Supports(metadata.compression)) {
        throw std::invalid_argument(
            fmt::format("Unsupported compression method '{}'", metadata.compression));
    }
    if (!encryption.Supports(metadata.encryption)) {
        throw std::invalid_argument(
            fmt::format("Unsupported encryption method '{}'", metadata.encryption));
    }

    auto reader = std::make_shared<StreamReader>(PrivateTag{}, loop, transport,
                                                 std::move(metadata), compression, encryption,
                                                 config);
    std::weak_ptr<StreamReader> weak = reader;
    reader->watchdog_.OnTimer([weak]() {
        if (auto self = weak.lock()) self->CheckTtl();
    });
    return reader;
}

StreamReader::StreamReader(PrivateTag, IEventLoop& loop, IRelayTransport& transport,
                           StreamMetadata metadata, ICompression& compression,
                           IEncryption& encryption, ReaderConfig config)
    : loop_(loop),
      transport_(transport),
      metadata_(std::move(metadata)),
      compression_(compression),
      encryption_(encryption),
      config_(config),
      watchdog_(loop) {}

StreamReader::~StreamReader() {
    Teardown();
}

bool StreamReader::IsTerminal() const {
    return state_ == ReaderState::Done || state_ == ReaderState::Errored ||
           state_ == ReaderState::Closed;
}

void StreamReader::Next(NextCallback callback) {
    assert(loop_.IsInEventLoopThread());
    if (state_ == ReaderState::Idle) Start();
    queue_.Pull(std::move(callback));
}

void StreamReader::Close() {
    assert(loop_.IsInEventLoopThread());
    if (!IsTerminal()) state_ = ReaderState::Closed;
    Teardown();
    queue_.Close();
}

void StreamReader::Start() {
    state_ = ReaderState::Active;
    last_message_time_ = loop_.Now();

    Filter filter{.kinds = {kStreamChunkKind}, .authors = {metadata_.stream_id}};
    std::weak_ptr<StreamReader> weak = weak_from_this();
    subscription_ = transport_.Subscribe(filter, metadata_.relays, [weak](const Message& msg) {
        if (auto self = weak.lock()) self->OnMessage(msg);
    });

    if (config_.ttl.count() > 0) {
        auto period = std::max(std::chrono::milliseconds{1},
                               std::min(std::chrono::milliseconds{1000}, config_.ttl / 2));
        watchdog_.Start(period, period);
    }
    Logger()->debug("Subscribed to stream {} on {} relays", metadata_.stream_id,
                    metadata_.relays.size());
}

void StreamReader::OnMessage(const Message& msg) {
    if (IsTerminal()) return;

    if (msg.kind != kStreamChunkKind || msg.pubkey != metadata_.stream_id) {
        Logger()->debug("Dropping foreign message {}", msg.id);
        return;
    }
    if (seen_ids_.contains(msg.id)) {
        Logger()->trace("Dropping duplicate chunk {}", msg.id);
        return;
    }
    auto header = ParseChunkHeader(msg);
    if (!header) {
        Logger()->debug("Dropping chunk {} with malformed tags", msg.id);
        return;
    }
    if (!VerifyMessage(msg)) {
        Logger()->debug("Dropping chunk {} with invalid signature", msg.id);
        return;
    }

    if (header->status == ChunkStatus::Error) {
        auto remote = ParseErrorContent(msg.content);
        Fail(remote ? std::move(*remote) : std::move(remote.error()));
        return;
    }

    if (chunk_count_ >= config_.max_chunks) {
        Fail(Error{ErrorCode::MaxChunksExceeded,
                   fmt::format("Maximum number of chunks exceeded ({})", config_.max_chunks)});
        return;
    }

    std::string prev = header->index > 0 ? header->prev : std::string{};
    if (header->index > 0 && prev.empty()) {
        Logger()->debug("Skipping chunk index {} without prev tag", header->index);
        return;
    }

    seen_ids_.insert(msg.id);
    buffer_.insert_or_assign(prev, msg);
    ++chunk_count_;
    last_message_time_ = loop_.Now();
    Logger()->debug("Received chunk index {} prev='{}' size {}, buffered {} of {}",
                    header->index, prev, msg.content.size(), buffer_.size(), chunk_count_);

    Drain();
}

void StreamReader::Drain() {
    if (draining_) return;
    draining_ = true;
    // Consumer callbacks run inside Push() and may drop the last reference
    auto guard = shared_from_this();

    while (!IsTerminal()) {
        auto it = buffer_.find(next_ref_);
        if (it == buffer_.end()) break;
        Message msg = std::move(it->second);
        buffer_.erase(it);

        auto status = FindTag(msg, "status");
        bool last = status && *status == ToString(ChunkStatus::Done);
        Logger()->debug("Processing chunk {} after '{}'", msg.id, next_ref_);

        size_t budget = config_.max_result_size - std::min(total_size_, config_.max_result_size);
        auto payload =
            DecodeChunkContent(msg.content, metadata_, compression_, encryption_, budget);
        if (!payload && payload.error().code != ErrorCode::MaxSizeExceeded) {
            Fail(std::move(payload.error()));
            break;
        }
        if (payload) total_size_ += PayloadSize(*payload);
        if (!payload || total_size_ > config_.max_result_size) {
            Fail(Error{ErrorCode::MaxSizeExceeded,
                       fmt::format("Maximum result size exceeded ({} bytes)",
                                   config_.max_result_size)});
            break;
        }

        next_ref_ = msg.id;
        queue_.Push(std::move(*payload));
        if (last) {
            Finish();
            break;
        }
    }
    draining_ = false;
}

void StreamReader::CheckTtl() {
    if (IsTerminal()) return;
    auto elapsed = loop_.Now() - last_message_time_;
    if (elapsed > config_.ttl) {
        Fail(Error{ErrorCode::TtlExceeded,
                   fmt::format("TTL exceeded ({}ms) while waiting for next chunk in chain",
                               config_.ttl.count())});
    }
}

void StreamReader::Finish() {
    if (IsTerminal()) return;
    Logger()->debug("Stream {} done after {} chunks", metadata_.stream_id, chunk_count_);
    state_ = ReaderState::Done;
    Teardown();
    queue_.Finish();
}

void StreamReader::Fail(Error error) {
    if (IsTerminal()) return;
    Logger()->warn("Stream {} failed: {} ({})", metadata_.stream_id, error.message,
                   error_code_string(error));
    state_ = ReaderState::Errored;
    Teardown();
    queue_.Fail(std::move(error));
}

void StreamReader::Teardown() {
    watchdog_.Stop();
    if (subscription_) {
        subscription_->Close();
        subscription_.reset();
    }
    buffer_.clear();
    seen_ids_.clear();
}

}  // namespace nostr_stream

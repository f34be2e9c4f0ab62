// SPDX-License-Identifier: MIT

#include "nostr_stream/writer.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "nostr_stream/log.hpp"

namespace nostr_stream {

namespace {

using StreamError = nostr_stream::Error;
using VoidResult = std::expected<void, StreamError>;

}  // namespace

std::shared_ptr<StreamWriter> StreamWriter::Create(IEventLoop& loop, IRelayTransport& transport,
                                                   StreamMetadata metadata,
                                                   const SecretKey& sender_key, ISigner& signer,
                                                   ICompression& compression,
                                                   IEncryption& encryption,
                                                   WriterConfig config) {
    ValidateForWriter(metadata);
    if (!compression.Supports(metadata.compression)) {
        throw std::invalid_argument(
            fmt::format("Unsupported compression method '{}'", metadata.compression));
    }
    if (!encryption.Supports(metadata.encryption)) {
        throw std::invalid_argument(
            fmt::format("Unsupported encryption method '{}'", metadata.encryption));
    }
    auto public_key = DerivePublicKey(sender_key);
    if (!public_key) {
        throw std::invalid_argument("Invalid sender key: " + public_key.error().message);
    }
    if (*public_key != metadata.stream_id) {
        throw std::invalid_argument("Sender key does not match the stream ID");
    }

    auto writer = std::make_shared<StreamWriter>(PrivateTag{}, loop, transport,
                                                 std::move(metadata), sender_key, signer,
                                                 compression, encryption, config);
    std::weak_ptr<StreamWriter> weak = writer;
    writer->batch_timer_.OnTimer([weak]() {
        if (auto self = weak.lock()) self->OnBatchTimer();
    });
    return writer;
}

StreamWriter::StreamWriter(PrivateTag, IEventLoop& loop, IRelayTransport& transport,
                           StreamMetadata metadata, const SecretKey& sender_key,
                           ISigner& signer, ICompression& compression,
                           IEncryption& encryption, WriterConfig config)
    : loop_(loop),
      transport_(transport),
      metadata_(std::move(metadata)),
      sender_key_(sender_key),
      signer_(signer),
      compression_(compression),
      encryption_(encryption),
      config_(config),
      batch_timer_(loop) {}

StreamWriter::~StreamWriter() {
    batch_timer_.Stop();
}

ChunkStatus StreamWriter::status() const {
    if (done_) return ChunkStatus::Done;
    if (failed_) return ChunkStatus::Error;
    return ChunkStatus::Active;
}

size_t StreamWriter::MaxChunkSize() const {
    size_t ceiling = config_.max_chunk_size;
    if (auto limit = encryption_.MaxChunkSize(metadata_.encryption)) {
        ceiling = std::min(ceiling, *limit);
    }
    // Worst-case expansion of text once it is encoded for the wire
    if (!metadata_.binary && metadata_.compression == kCompressionNone) {
        ceiling /= 8;
    }
    if (compressor_) {
        if (auto limit = compressor_->MaxChunkSize()) ceiling = std::min(ceiling, *limit);
    }
    return ceiling;
}

size_t StreamWriter::MaxPartSize() const {
    size_t ceiling = MaxChunkSize();
    return (ceiling + 9) / 10;
}

void StreamWriter::Write(Payload data, bool done, Callback callback) {
    assert(loop_.IsInEventLoopThread());

    if (failed_) {
        Complete(std::move(callback),
                 std::unexpected(StreamError{ErrorCode::InvalidState, "Stream failed"}));
        return;
    }
    if (done_ || disposed_) {
        Complete(std::move(callback), std::unexpected(StreamError{
                                          ErrorCode::InvalidState, "Stream is already closed"}));
        return;
    }

    // Re-armed below; a write never leaves two flush timers behind
    batch_timer_.Stop();
    if (!last_flush_time_) last_flush_time_ = loop_.Now();

    if (auto r = EnsureCompressor(); !r) {
        Abort(r.error());
        Complete(std::move(callback), std::unexpected(r.error()));
        return;
    }

    auto parts = SplitPayload(data, MaxPartSize());
    Logger()->debug("Writing {} {}, split into {} parts", PayloadSize(data),
                    metadata_.binary ? "bytes" : "chars", parts.size());

    for (const auto& part : parts) {
        auto r = Compress(part);
        if (!r && r.error().code == ErrorCode::CompressionSizeLimitExceeded &&
            current_size_ > 0) {
            Logger()->debug("Chunk size exceeded, sending current batch");
            r = Flush(ChunkStatus::Active);
            if (r) r = Compress(part);
        }
        if (!r) {
            Abort(r.error());
            Complete(std::move(callback), std::unexpected(r.error()));
            return;
        }
    }

    const auto interval = config_.min_chunk_interval;
    bool always_flush = interval.count() <= 0 && config_.min_chunk_size == 0;
    bool big_chunk = config_.min_chunk_size > 0 && current_size_ >= config_.min_chunk_size;
    bool big_interval = interval.count() > 0 && loop_.Now() - *last_flush_time_ >= interval;

    if (done || big_chunk || big_interval || always_flush) {
        Logger()->debug("Sending by condition done={} big_chunk={} big_interval={} always={}",
                        done, big_chunk, big_interval, always_flush);
        if (auto r = Flush(done ? ChunkStatus::Done : ChunkStatus::Active); !r) {
            Abort(r.error());
            Complete(std::move(callback), std::unexpected(r.error()));
            return;
        }
    }

    if (done) {
        done_ = true;
        settle_waiters_.push_back(std::move(callback));
        CheckSettled();
        return;
    }

    if (interval.count() > 0) {
        batch_timer_.Start(interval);
    }

    issue_waiters_.push_back(IssueWaiter{next_index_, std::move(callback)});
    ResolveIssueWaiters();
}

void StreamWriter::Error(std::string_view code, std::string_view message, Callback callback) {
    assert(loop_.IsInEventLoopThread());

    if (done_) {
        Complete(std::move(callback), std::unexpected(StreamError{
                                          ErrorCode::InvalidState, "Stream is already done"}));
        return;
    }
    if (failed_) {
        Complete(std::move(callback),
                 std::unexpected(StreamError{ErrorCode::InvalidState, "Stream failed"}));
        return;
    }
    if (disposed_) {
        Complete(std::move(callback), std::unexpected(StreamError{
                                          ErrorCode::InvalidState, "Stream is already closed"}));
        return;
    }

    failed_ = true;
    batch_timer_.Stop();

    if (auto r = SendError(code, message, false); !r) {
        Logger()->error("Failed to send error chunk: {}", r.error().message);
        Release();
        Complete(std::move(callback), std::unexpected(r.error()));
        return;
    }

    settle_waiters_.push_back(std::move(callback));
    CheckSettled();
}

void StreamWriter::Dispose() {
    disposed_ = true;
    Release();
}

VoidResult StreamWriter::EnsureCompressor() {
    if (compressor_) return {};
    auto compressor = compression_.StartCompress(metadata_.compression, metadata_.binary,
                                                 MaxChunkSize());
    if (!compressor) return std::unexpected(compressor.error());
    compressor_ = std::move(*compressor);
    current_size_ = 0;
    return {};
}

VoidResult StreamWriter::Compress(const Payload& part) {
    if (auto r = EnsureCompressor(); !r) return r;
    auto size = compressor_->Add(part);
    if (!size) return std::unexpected(size.error());
    current_size_ = *size;
    Logger()->debug("Added part of {} {}, current batch size {} bytes", PayloadSize(part),
                    metadata_.binary ? "bytes" : "chars", current_size_);
    return {};
}

VoidResult StreamWriter::Flush(ChunkStatus status) {
    batch_timer_.Stop();

    Payload batch = EmptyPayload(metadata_.binary);
    if (compressor_) {
        auto finished = compressor_->Finish();
        compressor_.reset();
        current_size_ = 0;
        if (!finished) return std::unexpected(finished.error());
        batch = std::move(*finished);
    }
    current_size_ = 0;
    last_flush_time_ = loop_.Now();

    Logger()->debug("Sending batch of {} bytes, status {}", PayloadSize(batch), ToString(status));

    auto content = EncodeChunkContent(batch, metadata_, encryption_, sender_key_);
    if (!content) return std::unexpected(content.error());
    return Emit(std::move(*content), status);
}

VoidResult StreamWriter::Emit(std::string content, ChunkStatus status) {
    uint64_t index = next_index_;
    std::string_view prev = index > 0 ? std::string_view(last_chunk_id_) : std::string_view{};

    auto message = signer_.Sign(kStreamChunkKind, std::move(content),
                                MakeChunkTags(index, status, prev), sender_key_);
    if (!message) return std::unexpected(message.error());

    ++next_index_;
    last_chunk_id_ = message->id;
    Logger()->debug("Signed chunk {} id {} size {}", index, message->id,
                    message->content.size());

    if (in_flight_ > kMaxPendingPublishes) {
        Logger()->debug("Too many pending chunks {}, waiting...", in_flight_);
    }
    outbox_.push_back(Outgoing{index, std::move(*message)});
    PumpOutbox();
    return {};
}

VoidResult StreamWriter::SendError(std::string_view code, std::string_view message,
                                   bool best_effort) {
    if (current_size_ > 0) {
        if (auto r = Flush(ChunkStatus::Active); !r) {
            if (!best_effort) return r;
            Logger()->warn("Dropping pending batch before error chunk: {}", r.error().message);
        }
    }
    compressor_.reset();
    return Emit(EncodeErrorContent(code, message), ChunkStatus::Error);
}

void StreamWriter::PumpOutbox() {
    while (!outbox_.empty() && in_flight_ <= kMaxPendingPublishes) {
        Outgoing out = std::move(outbox_.front());
        outbox_.pop_front();
        ++in_flight_;
        ++issued_count_;

        auto self = shared_from_this();
        uint64_t index = out.index;
        transport_.Publish(out.message, metadata_.relays,
                           [self, index](std::expected<std::vector<std::string>, StreamError> r) {
                               self->OnPublished(index, std::move(r));
                           });
    }
    ResolveIssueWaiters();
}

void StreamWriter::OnPublished(uint64_t index,
                               std::expected<std::vector<std::string>, StreamError> result) {
    --in_flight_;

    if (!result) {
        Logger()->error("Failed to publish chunk {}: {}", index, result.error().message);
        Abort(StreamError{ErrorCode::PublishFailed,
                          fmt::format("Failed to publish chunk {}", index)});
    } else if (result->empty()) {
        Logger()->warn("No relay accepted chunk {}", index);
        Abort(StreamError{ErrorCode::RelayFailure,
                          fmt::format("Failed to send to relay chunk {}", index)});
    } else {
        Logger()->debug("Published chunk {} to {} relays", index, result->size());
    }

    PumpOutbox();
    CheckSettled();
}

void StreamWriter::OnBatchTimer() {
    if (done_ || failed_ || current_size_ == 0) return;
    Logger()->debug("Sending by timeout");
    if (auto r = Flush(ChunkStatus::Active); !r) {
        Logger()->error("Error flushing batch: {}", r.error().message);
        Abort(r.error());
    }
}

void StreamWriter::Abort(StreamError cause) {
    if (failed_) {
        Logger()->warn("Ignoring failure after stream error: {}", cause.message);
        if (!publish_failure_) publish_failure_ = std::move(cause);
        return;
    }
    if (done_) {
        // Terminal chunk already signed; nothing may follow it
        Logger()->error("Stream finished with failure: {}", cause.message);
        if (!publish_failure_) publish_failure_ = std::move(cause);
        return;
    }

    Logger()->error("Aborting stream {}: {}", metadata_.stream_id, cause.message);
    failed_ = true;
    abort_cause_ = cause;
    batch_timer_.Stop();

    if (auto r = SendError(error_code_string(cause.code), cause.message, true); !r) {
        Logger()->error("Failed to send error chunk: {}", r.error().message);
    }
    ResolveIssueWaiters();
    CheckSettled();
}

void StreamWriter::ResolveIssueWaiters() {
    while (!issue_waiters_.empty() &&
           (abort_cause_ || issue_waiters_.front().target <= issued_count_)) {
        Callback callback = std::move(issue_waiters_.front().callback);
        issue_waiters_.pop_front();
        if (abort_cause_) {
            Complete(std::move(callback), std::unexpected(*abort_cause_));
        } else {
            Complete(std::move(callback), {});
        }
    }
}

void StreamWriter::CheckSettled() {
    if (!done_ && !failed_) return;
    if (!outbox_.empty() || in_flight_ > 0) return;

    Release();
    auto waiters = std::exchange(settle_waiters_, {});
    for (auto& callback : waiters) {
        if (publish_failure_) {
            Complete(std::move(callback), std::unexpected(*publish_failure_));
        } else {
            Complete(std::move(callback), {});
        }
    }
}

void StreamWriter::Release() {
    if (released_) return;
    released_ = true;
    batch_timer_.Stop();
    compressor_.reset();
    current_size_ = 0;
    Logger()->debug("Released writer of stream {}", metadata_.stream_id);
}

void StreamWriter::Complete(Callback callback, VoidResult result) {
    if (!callback) return;
    loop_.Defer([callback = std::move(callback), result = std::move(result)]() mutable {
        callback(std::move(result));
    });
}

}  // namespace nostr_stream

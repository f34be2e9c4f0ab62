// SPDX-License-Identifier: MIT

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include "nostr_stream/writer.hpp"
#include "fake_relay_transport.hpp"
#include "manual_event_loop.hpp"
#include "mocks.hpp"
#include "stream_test_util.hpp"

using namespace nostr_stream;
using namespace nostr_stream::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

namespace {

using WriteResult = std::expected<void, Error>;

// Records every completion of the callbacks it hands out.
struct Completions {
    std::vector<WriteResult> results;

    StreamWriter::Callback Track() {
        return [this](WriteResult r) { results.push_back(std::move(r)); };
    }

    size_t Ok() const {
        size_t n = 0;
        for (const auto& r : results) n += r.has_value() ? 1 : 0;
        return n;
    }
};

ChunkHeader Header(const Message& msg) {
    auto header = ParseChunkHeader(msg);
    EXPECT_TRUE(header.has_value());
    return header.value_or(ChunkHeader{});
}

}  // namespace

class StreamWriterTest : public ::testing::Test {
protected:
    std::shared_ptr<StreamWriter> MakeWriter(WriterConfig config,
                                             std::optional<StreamMetadata> meta = std::nullopt) {
        return StreamWriter::Create(loop, transport, meta.value_or(MakeMetadata(sender)), sender,
                                    signer, compression, encryption, config);
    }

    static WriterConfig BatchedBySize(size_t min_chunk_size) {
        WriterConfig config;
        config.min_chunk_size = min_chunk_size;
        return config;
    }

    ManualEventLoop loop;
    FakeRelayTransport transport{loop};
    SchnorrSigner signer = FixedClockSigner();
    DefaultCompression compression;
    DefaultEncryption encryption;
    SecretKey sender = KeyFromInt(1);
    Completions done;
};

TEST_F(StreamWriterTest, CreateRejectsForeignSenderKey) {
    auto meta = MakeMetadata(KeyFromInt(2));
    EXPECT_THROW(StreamWriter::Create(loop, transport, meta, sender, signer, compression,
                                      encryption),
                 std::invalid_argument);
}

TEST_F(StreamWriterTest, CreateRejectsUnsupportedMethods) {
    EXPECT_THROW(MakeWriter({}, MakeMetadata(sender, false, "gzip")), std::invalid_argument);
    EXPECT_THROW(MakeWriter({}, MakeMetadata(sender, false, "none", "nip04")),
                 std::invalid_argument);
}

TEST_F(StreamWriterTest, TwoWritesFormChain) {
    auto writer = MakeWriter(BatchedBySize(1));

    writer->Write(std::string("ab"), false, done.Track());
    writer->Write(std::string("cd"), true, done.Track());
    loop.RunPending();

    ASSERT_EQ(done.results.size(), 2u);
    EXPECT_EQ(done.Ok(), 2u);

    ASSERT_EQ(transport.published.size(), 2u);
    const auto& first = transport.published[0];
    const auto& second = transport.published[1];

    EXPECT_EQ(first.kind, kStreamChunkKind);
    EXPECT_EQ(first.pubkey, PublicKeyOf(sender));
    EXPECT_EQ(first.content, "ab");
    EXPECT_EQ(Header(first).index, 0u);
    EXPECT_EQ(Header(first).status, ChunkStatus::Active);
    EXPECT_FALSE(FindTag(first, "prev").has_value());

    EXPECT_EQ(second.content, "cd");
    EXPECT_EQ(Header(second).index, 1u);
    EXPECT_EQ(Header(second).status, ChunkStatus::Done);
    EXPECT_EQ(Header(second).prev, first.id);

    EXPECT_TRUE(VerifyMessage(first));
    EXPECT_TRUE(VerifyMessage(second));
    EXPECT_EQ(transport.published[0].tags.size(), 2u);

    EXPECT_EQ(writer->status(), ChunkStatus::Done);
    EXPECT_EQ(writer->ChunkCount(), 2u);
    EXPECT_EQ(writer->LastChunkId(), second.id);
}

TEST_F(StreamWriterTest, BatchesUntilFinalWrite) {
    auto writer = MakeWriter(WriterConfig::Defaults());

    writer->Write(std::string("a"), false, done.Track());
    writer->Write(std::string("b"), false, done.Track());
    loop.RunPending();
    EXPECT_TRUE(transport.published.empty());
    EXPECT_EQ(done.Ok(), 2u);

    writer->Write(std::string("c"), true, done.Track());
    loop.RunPending();

    ASSERT_EQ(transport.published.size(), 1u);
    EXPECT_EQ(transport.published[0].content, "abc");
    EXPECT_EQ(Header(transport.published[0]).status, ChunkStatus::Done);
    EXPECT_EQ(done.Ok(), 3u);
}

TEST_F(StreamWriterTest, EmptyFinalWriteStillTerminates) {
    auto writer = MakeWriter(WriterConfig::Defaults());
    writer->Write(std::string(), true, done.Track());
    loop.RunPending();

    ASSERT_EQ(transport.published.size(), 1u);
    EXPECT_EQ(transport.published[0].content, "");
    EXPECT_EQ(Header(transport.published[0]).status, ChunkStatus::Done);
    EXPECT_EQ(done.Ok(), 1u);
}

TEST_F(StreamWriterTest, UnbatchedFlushesEveryWrite) {
    auto writer = MakeWriter(WriterConfig::Unbatched());
    writer->Write(std::string("x"), false, done.Track());
    writer->Write(std::string("y"), false, done.Track());
    loop.RunPending();
    EXPECT_EQ(transport.published.size(), 2u);
}

TEST_F(StreamWriterTest, ChunkCeilings) {
    auto text = MakeWriter(WriterConfig::Defaults());
    EXPECT_EQ(text->MaxChunkSize(), 256u * 1024 / 8);
    EXPECT_EQ(text->MaxPartSize(), 3277u);

    auto binary_nip44 = MakeMetadata(sender, true, "none", "nip44");
    binary_nip44.receiver_public_key = PublicKeyOf(KeyFromInt(2));
    auto encrypted = MakeWriter(WriterConfig::Defaults(), binary_nip44);
    EXPECT_EQ(encrypted->MaxChunkSize(), DefaultEncryption::kNip44MaxChunkSize);

    auto compressed = MakeWriter(WriterConfig::Defaults(), MakeMetadata(sender, false, "zstd"));
    EXPECT_EQ(compressed->MaxChunkSize(), 256u * 1024);
}

TEST_F(StreamWriterTest, OversizedWriteSplitsAcrossChunks) {
    WriterConfig config;
    config.min_chunk_size = 1 << 20;
    config.max_chunk_size = 800;
    auto writer = MakeWriter(config);
    EXPECT_EQ(writer->MaxChunkSize(), 100u);
    EXPECT_EQ(writer->MaxPartSize(), 10u);

    writer->Write(std::string(250, 'x'), false, done.Track());
    loop.RunPending();
    ASSERT_EQ(transport.published.size(), 2u);
    EXPECT_EQ(transport.published[0].content.size(), 100u);
    EXPECT_EQ(transport.published[1].content.size(), 100u);

    writer->Write(std::string(), true, done.Track());
    loop.RunPending();
    ASSERT_EQ(transport.published.size(), 3u);
    EXPECT_EQ(transport.published[2].content, std::string(50, 'x'));
    EXPECT_EQ(Header(transport.published[2]).status, ChunkStatus::Done);
    EXPECT_EQ(Header(transport.published[2]).prev, transport.published[1].id);
    EXPECT_EQ(done.Ok(), 2u);
}

TEST_F(StreamWriterTest, SmallZstdCeilingRoundTrips) {
    WriterConfig config;
    config.min_chunk_size = 1 << 20;
    config.max_chunk_size = 1000;
    auto meta = MakeMetadata(sender, false, "zstd");
    auto writer = MakeWriter(config, meta);

    std::string text = "hello";
    for (int i = 0; i < 40; ++i) text += fmt::format(" line {} of the stream", i);

    writer->Write(std::string("hello"), false, done.Track());
    writer->Write(text.substr(5), true, done.Track());
    loop.RunPending();

    ASSERT_EQ(done.results.size(), 2u);
    EXPECT_EQ(done.Ok(), 2u);
    ASSERT_GT(transport.published.size(), 1u);

    std::string restored;
    for (size_t i = 0; i < transport.published.size(); ++i) {
        const auto& msg = transport.published[i];
        EXPECT_EQ(Header(msg).status,
                  i + 1 == transport.published.size() ? ChunkStatus::Done : ChunkStatus::Active);
        auto payload = DecodeChunkContent(msg.content, meta, compression, encryption);
        ASSERT_TRUE(payload.has_value()) << payload.error().message;
        restored += std::get<std::string>(*payload);
    }
    EXPECT_EQ(restored, text);
}

TEST_F(StreamWriterTest, FailedBatchFinishSendsOnlyErrorChunk) {
    MockCompression mock_compression;
    EXPECT_CALL(mock_compression, Supports(_)).WillRepeatedly(Return(true));
    EXPECT_CALL(mock_compression, StartCompress(_, _, _)).WillOnce([](std::string_view, bool, std::optional<size_t>) {
        auto compressor = std::make_unique<MockCompressor>();
        EXPECT_CALL(*compressor, Add(_)).WillOnce(Return(std::expected<size_t, Error>(1)));
        EXPECT_CALL(*compressor, Finish()).WillOnce(Return(std::expected<Payload, Error>(
            std::unexpected(Error{ErrorCode::CompressionFailed, "frame error"}))));
        EXPECT_CALL(*compressor, MaxChunkSize()).WillRepeatedly(Return(std::nullopt));
        return std::expected<std::unique_ptr<ICompressor>, Error>(std::move(compressor));
    });

    auto writer = StreamWriter::Create(loop, transport, MakeMetadata(sender), sender, signer,
                                       mock_compression, encryption, WriterConfig::Unbatched());
    writer->Write(std::string("a"), false, done.Track());
    loop.RunPending();

    ASSERT_EQ(done.results.size(), 1u);
    ASSERT_FALSE(done.results[0].has_value());
    EXPECT_EQ(done.results[0].error().code, ErrorCode::CompressionFailed);

    ASSERT_EQ(transport.published.size(), 1u);
    EXPECT_EQ(Header(transport.published[0]).index, 0u);
    EXPECT_EQ(Header(transport.published[0]).status, ChunkStatus::Error);
    auto remote = ParseErrorContent(transport.published[0].content);
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->remote_code, "compression_failed");
}

TEST_F(StreamWriterTest, IntervalTimerFlushesBatch) {
    WriterConfig config;
    config.min_chunk_size = 1 << 20;
    config.min_chunk_interval = 100ms;
    auto writer = MakeWriter(config);

    writer->Write(std::string("a"), false, done.Track());
    loop.Advance(99ms);
    EXPECT_TRUE(transport.published.empty());

    loop.Advance(1ms);
    ASSERT_EQ(transport.published.size(), 1u);
    EXPECT_EQ(transport.published[0].content, "a");

    // Nothing pending: the next tick does not emit an empty chunk
    loop.Advance(500ms);
    EXPECT_EQ(transport.published.size(), 1u);
}

TEST_F(StreamWriterTest, ElapsedIntervalFlushesOnWrite) {
    WriterConfig config;
    config.min_chunk_size = 1 << 20;
    config.min_chunk_interval = 100ms;
    auto writer = MakeWriter(config);

    writer->Write(std::string("a"), false, done.Track());
    loop.Advance(60ms);
    writer->Write(std::string("b"), false, done.Track());
    EXPECT_TRUE(transport.published.empty());

    // Timer re-armed by the second write; the third write crosses the interval
    loop.Advance(50ms);
    writer->Write(std::string("c"), false, done.Track());
    ASSERT_EQ(transport.published.size(), 1u);
    EXPECT_EQ(transport.published[0].content, "abc");
}

TEST_F(StreamWriterTest, AtMostElevenPublishesInFlight) {
    transport.SetAutoAccept(false);
    auto writer = MakeWriter(WriterConfig::Unbatched());

    for (int i = 0; i < 15; ++i) {
        writer->Write(std::string(1, static_cast<char>('a' + i)), false, done.Track());
    }
    loop.RunPending();

    EXPECT_EQ(transport.published.size(), StreamWriter::kMaxPendingPublishes + 1);
    EXPECT_EQ(transport.PendingCount(), StreamWriter::kMaxPendingPublishes + 1);
    EXPECT_EQ(writer->ChunkCount(), 15u);
    EXPECT_EQ(done.Ok(), 11u);

    transport.SettleNext(std::vector<std::string>{"wss://relay.one"});
    loop.RunPending();
    EXPECT_EQ(transport.published.size(), 12u);
    EXPECT_EQ(done.Ok(), 12u);

    transport.AcceptAll();
    loop.RunPending();
    EXPECT_EQ(transport.published.size(), 15u);
    EXPECT_EQ(done.Ok(), 15u);

    // Published in chain order
    for (size_t i = 1; i < transport.published.size(); ++i) {
        EXPECT_EQ(Header(transport.published[i]).prev, transport.published[i - 1].id);
    }
}

TEST_F(StreamWriterTest, PartialRelayAcceptanceIsSuccess) {
    transport.SetAutoAccept(false);
    auto writer = MakeWriter(WriterConfig::Unbatched());
    writer->Write(std::string("x"), true, done.Track());

    transport.SettleNext(std::vector<std::string>{"wss://relay.two"});
    loop.RunPending();
    ASSERT_EQ(done.results.size(), 1u);
    EXPECT_TRUE(done.results[0].has_value());
}

TEST_F(StreamWriterTest, RejectedChunkEndsStreamWithErrorChunk) {
    transport.SetAutoAccept(false);
    auto writer = MakeWriter(WriterConfig::Unbatched());

    writer->Write(std::string("a"), false, done.Track());
    transport.SettleNext(std::vector<std::string>{});
    loop.RunPending();

    EXPECT_EQ(writer->status(), ChunkStatus::Error);
    ASSERT_EQ(transport.published.size(), 2u);
    const auto& error_chunk = transport.published[1];
    EXPECT_EQ(Header(error_chunk).status, ChunkStatus::Error);
    EXPECT_EQ(Header(error_chunk).index, 1u);
    EXPECT_EQ(Header(error_chunk).prev, transport.published[0].id);

    auto remote = ParseErrorContent(error_chunk.content);
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->remote_code, "RELAY_FAILURE");
    EXPECT_EQ(remote->message, "Failed to send to relay chunk 0");

    writer->Write(std::string("b"), false, done.Track());
    writer->Error("E1", "late", done.Track());
    transport.AcceptAll();
    loop.RunPending();

    ASSERT_EQ(done.results.size(), 3u);
    EXPECT_TRUE(done.results[0].has_value());
    for (size_t i = 1; i < 3; ++i) {
        ASSERT_FALSE(done.results[i].has_value());
        EXPECT_EQ(done.results[i].error().code, ErrorCode::InvalidState);
        EXPECT_EQ(done.results[i].error().message, "Stream failed");
    }
    EXPECT_EQ(transport.published.size(), 2u);
}

TEST_F(StreamWriterTest, TransportFailureUsesPublishCode) {
    transport.SetAutoAccept(false);
    auto writer = MakeWriter(WriterConfig::Unbatched());

    writer->Write(std::string("a"), false, done.Track());
    transport.SettleNext(std::unexpected(Error{ErrorCode::PublishFailed, "socket closed"}));
    loop.RunPending();

    ASSERT_EQ(transport.published.size(), 2u);
    auto remote = ParseErrorContent(transport.published[1].content);
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->remote_code, "FAILED_TO_PUBLISH");
    EXPECT_EQ(remote->message, "Failed to publish chunk 0");
}

TEST_F(StreamWriterTest, SecondFailureDoesNotEmitSecondErrorChunk) {
    transport.SetAutoAccept(false);
    auto writer = MakeWriter(WriterConfig::Unbatched());

    writer->Write(std::string("a"), false, done.Track());
    writer->Write(std::string("b"), false, done.Track());
    ASSERT_EQ(transport.PendingCount(), 2u);

    transport.SettleNext(std::vector<std::string>{});
    transport.SettleNext(std::vector<std::string>{});
    transport.AcceptAll();
    loop.RunPending();

    ASSERT_EQ(transport.published.size(), 3u);
    size_t error_chunks = 0;
    for (const auto& msg : transport.published) {
        if (Header(msg).status == ChunkStatus::Error) ++error_chunks;
    }
    EXPECT_EQ(error_chunks, 1u);
}

TEST_F(StreamWriterTest, FailedFinalChunkReportsToDoneCallback) {
    transport.SetAutoAccept(false);
    auto writer = MakeWriter(WriterConfig::Unbatched());

    writer->Write(std::string("a"), true, done.Track());
    loop.RunPending();
    EXPECT_TRUE(done.results.empty());

    transport.SettleNext(std::vector<std::string>{});
    loop.RunPending();

    ASSERT_EQ(done.results.size(), 1u);
    ASSERT_FALSE(done.results[0].has_value());
    EXPECT_EQ(done.results[0].error().code, ErrorCode::RelayFailure);
    // Nothing may follow the terminal chunk
    EXPECT_EQ(transport.published.size(), 1u);
}

TEST_F(StreamWriterTest, ErrorFlushesPendingBatchThenTerminates) {
    auto writer = MakeWriter(WriterConfig::Defaults());

    writer->Write(std::string("partial"), false, done.Track());
    writer->Error("E1", "boom", done.Track());
    loop.RunPending();

    ASSERT_EQ(transport.published.size(), 2u);
    EXPECT_EQ(transport.published[0].content, "partial");
    EXPECT_EQ(Header(transport.published[0]).status, ChunkStatus::Active);

    const auto& error_chunk = transport.published[1];
    EXPECT_EQ(Header(error_chunk).status, ChunkStatus::Error);
    EXPECT_EQ(Header(error_chunk).prev, transport.published[0].id);
    EXPECT_EQ(error_chunk.content, EncodeErrorContent("E1", "boom"));

    EXPECT_EQ(done.Ok(), 2u);
    EXPECT_EQ(writer->status(), ChunkStatus::Error);

    writer->Write(std::string("more"), false, done.Track());
    loop.RunPending();
    ASSERT_EQ(done.results.size(), 3u);
    EXPECT_EQ(done.results[2].error().message, "Stream failed");
}

TEST_F(StreamWriterTest, ErrorAfterDoneFails) {
    auto writer = MakeWriter(WriterConfig::Unbatched());
    writer->Write(std::string("a"), true, done.Track());
    writer->Error("E1", "too late", done.Track());
    writer->Write(std::string("b"), false, done.Track());
    loop.RunPending();

    // Rejections complete first; the final write completes once its publish settles
    ASSERT_EQ(done.results.size(), 3u);
    EXPECT_EQ(done.results[0].error().code, ErrorCode::InvalidState);
    EXPECT_EQ(done.results[0].error().message, "Stream is already done");
    EXPECT_EQ(done.results[1].error().message, "Stream is already closed");
    EXPECT_TRUE(done.results[2].has_value());
    EXPECT_EQ(transport.published.size(), 1u);
}

TEST_F(StreamWriterTest, SigningFailureFailsWrite) {
    MockSigner mock_signer;
    std::expected<Message, Error> failure =
        std::unexpected(Error{ErrorCode::SigningFailed, "signer offline"});
    EXPECT_CALL(mock_signer, Sign(kStreamChunkKind, _, _, _)).WillRepeatedly(Return(failure));

    auto writer = StreamWriter::Create(loop, transport, MakeMetadata(sender), sender, mock_signer,
                                       compression, encryption, WriterConfig::Unbatched());
    writer->Write(std::string("a"), false, done.Track());
    loop.RunPending();

    ASSERT_EQ(done.results.size(), 1u);
    ASSERT_FALSE(done.results[0].has_value());
    EXPECT_EQ(done.results[0].error().code, ErrorCode::SigningFailed);
    EXPECT_EQ(writer->status(), ChunkStatus::Error);
    EXPECT_TRUE(transport.published.empty());
}

TEST_F(StreamWriterTest, CompressorFailureFailsWrite) {
    MockCompression mock_compression;
    EXPECT_CALL(mock_compression, Supports(_)).WillRepeatedly(Return(true));
    EXPECT_CALL(mock_compression, StartCompress(_, _, _)).WillOnce([](std::string_view, bool, std::optional<size_t>) {
        auto compressor = std::make_unique<MockCompressor>();
        EXPECT_CALL(*compressor, Add(_)).WillOnce(Return(std::expected<size_t, Error>(
            std::unexpected(Error{ErrorCode::CompressionFailed, "bad input"}))));
        EXPECT_CALL(*compressor, MaxChunkSize()).WillRepeatedly(Return(std::nullopt));
        return std::expected<std::unique_ptr<ICompressor>, Error>(std::move(compressor));
    });

    auto writer = StreamWriter::Create(loop, transport, MakeMetadata(sender), sender, signer,
                                       mock_compression, encryption, WriterConfig::Unbatched());
    writer->Write(std::string("a"), false, done.Track());
    loop.RunPending();

    ASSERT_EQ(done.results.size(), 1u);
    EXPECT_EQ(done.results[0].error().code, ErrorCode::CompressionFailed);

    // The stream still terminates with an error chunk
    ASSERT_EQ(transport.published.size(), 1u);
    auto remote = ParseErrorContent(transport.published[0].content);
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->remote_code, "compression_failed");
}

TEST_F(StreamWriterTest, DisposeRejectsLaterWrites) {
    auto writer = MakeWriter(WriterConfig::Defaults());
    writer->Write(std::string("a"), false, done.Track());
    writer->Dispose();
    writer->Write(std::string("b"), false, done.Track());
    loop.RunPending();

    ASSERT_EQ(done.results.size(), 2u);
    EXPECT_TRUE(done.results[0].has_value());
    EXPECT_EQ(done.results[1].error().message, "Stream is already closed");
    EXPECT_TRUE(transport.published.empty());
}

TEST_F(StreamWriterTest, InFlightPublishKeepsWriterAlive) {
    transport.SetAutoAccept(false);
    auto writer = MakeWriter(WriterConfig::Unbatched());
    std::weak_ptr<StreamWriter> weak = writer;

    writer->Write(std::string("a"), true, done.Track());
    writer.reset();
    EXPECT_FALSE(weak.expired());

    transport.AcceptAll();
    loop.RunPending();
    EXPECT_TRUE(weak.expired());
    ASSERT_EQ(done.results.size(), 1u);
    EXPECT_TRUE(done.results[0].has_value());
}

TEST_F(StreamWriterTest, CompletionsNeverRunInline) {
    auto writer = MakeWriter(WriterConfig::Unbatched());
    writer->Write(std::string("a"), false, done.Track());
    EXPECT_TRUE(done.results.empty());
    loop.RunPending();
    EXPECT_EQ(done.results.size(), 1u);
}

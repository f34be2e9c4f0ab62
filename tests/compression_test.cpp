// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>

#include "nostr_stream/compression.hpp"

using namespace nostr_stream;

TEST(CompressionTest, SupportedMethods) {
    DefaultCompression compression;
    EXPECT_TRUE(compression.Supports("none"));
    EXPECT_TRUE(compression.Supports("zstd"));
    EXPECT_FALSE(compression.Supports("gzip"));
}

TEST(CompressionTest, UnsupportedMethodRejected) {
    DefaultCompression compression;
    auto r = compression.StartCompress("gzip", false, std::nullopt);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::UnsupportedMethod);

    auto d = compression.Decompress(std::string("x"), "gzip", false, std::nullopt);
    ASSERT_FALSE(d.has_value());
    EXPECT_EQ(d.error().code, ErrorCode::UnsupportedMethod);
}

TEST(NoneCompressorTest, ConcatenatesText) {
    DefaultCompression compression;
    auto c = compression.StartCompress("none", false, std::nullopt).value();

    EXPECT_EQ(c->Add(std::string("ab")).value(), 2u);
    EXPECT_EQ(c->Add(std::string("cde")).value(), 5u);
    EXPECT_FALSE(c->MaxChunkSize().has_value());

    auto out = c->Finish();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(std::get<std::string>(*out), "abcde");
}

TEST(NoneCompressorTest, BinaryBatchIsBytes) {
    DefaultCompression compression;
    auto c = compression.StartCompress("none", true, std::nullopt).value();
    ASSERT_TRUE(c->Add(ToBytes("xy")).has_value());

    auto out = c->Finish();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(std::get<Bytes>(*out), ToBytes("xy"));
}

TEST(NoneCompressorTest, CeilingRejectsPartButKeepsBatch) {
    DefaultCompression compression;
    auto c = compression.StartCompress("none", false, 10).value();
    EXPECT_EQ(*c->MaxChunkSize(), 10u);

    ASSERT_TRUE(c->Add(std::string(8, 'a')).has_value());
    auto r = c->Add(std::string(3, 'b'));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::CompressionSizeLimitExceeded);

    // Exactly at the ceiling is accepted
    EXPECT_EQ(c->Add(std::string(2, 'c')).value(), 10u);
    EXPECT_EQ(std::get<std::string>(c->Finish().value()), "aaaaaaaacc");
}

TEST(NoneCompressorTest, KindMismatchFails) {
    DefaultCompression compression;
    auto c = compression.StartCompress("none", false, std::nullopt).value();
    auto r = c->Add(ToBytes("x"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::CompressionFailed);
}

TEST(ZstdCompressorTest, TextRoundTrip) {
    DefaultCompression compression;
    auto c = compression.StartCompress("zstd", false, std::nullopt).value();

    std::string expected;
    for (int i = 0; i < 50; ++i) {
        std::string part = "line " + std::to_string(i) + " of repetitive text\n";
        expected += part;
        ASSERT_TRUE(c->Add(part).has_value());
    }
    auto batch = c->Finish();
    ASSERT_TRUE(batch.has_value());
    ASSERT_TRUE(IsBinary(*batch));
    EXPECT_LT(PayloadSize(*batch), expected.size());

    auto restored = compression.Decompress(*batch, "zstd", false, std::nullopt);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(std::get<std::string>(*restored), expected);
}

TEST(ZstdCompressorTest, BinaryRoundTrip) {
    DefaultCompression compression(19);
    auto c = compression.StartCompress("zstd", true, std::nullopt).value();

    Bytes data;
    for (int i = 0; i < 4096; ++i) data.push_back(static_cast<std::byte>(i % 7));
    ASSERT_TRUE(c->Add(data).has_value());

    auto restored = compression.Decompress(c->Finish().value(), "zstd", true, std::nullopt);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(std::get<Bytes>(*restored), data);
}

TEST(ZstdCompressorTest, CeilingReservesTrailerMargin) {
    DefaultCompression compression;
    auto c = compression.StartCompress("zstd", false, 4096).value();
    ASSERT_TRUE(c->MaxChunkSize().has_value());
    EXPECT_EQ(*c->MaxChunkSize(), 4096u - DefaultCompression::kTrailerMargin);

    auto tiny = compression.StartCompress("zstd", false, 100).value();
    EXPECT_EQ(*tiny->MaxChunkSize(), DefaultCompression::kMinCeiling);
}

TEST(ZstdCompressorTest, CeilingRejectsOversizedPart) {
    DefaultCompression compression;
    auto c = compression.StartCompress("zstd", false, 4096).value();

    auto r = c->Add(std::string(5000, 'x'));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::CompressionSizeLimitExceeded);

    // Batch stays usable after a rejected part
    ASSERT_TRUE(c->Add(std::string(100, 'y')).has_value());
    auto restored = compression.Decompress(c->Finish().value(), "zstd", false, std::nullopt);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(std::get<std::string>(*restored), std::string(100, 'y'));
}

TEST(ZstdCompressorTest, EmptyBatchDecompressesToEmpty) {
    DefaultCompression compression;
    auto c = compression.StartCompress("zstd", true, std::nullopt).value();
    auto batch = c->Finish();
    ASSERT_TRUE(batch.has_value());

    auto restored = compression.Decompress(*batch, "zstd", true, std::nullopt);
    ASSERT_TRUE(restored.has_value());
    EXPECT_TRUE(std::get<Bytes>(*restored).empty());
}

TEST(ZstdCompressorTest, GarbageFailsDecompression) {
    DefaultCompression compression;
    auto r = compression.Decompress(ToBytes("definitely not zstd"), "zstd", true, std::nullopt);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::DecompressionFailed);
}

TEST(ZstdCompressorTest, SmallCeilingAcceptsShortParts) {
    DefaultCompression compression;
    auto c = compression.StartCompress("zstd", false, 1000).value();
    ASSERT_EQ(*c->MaxChunkSize(), DefaultCompression::kMinCeiling);

    ASSERT_TRUE(c->Add(std::string("hello")).has_value());
    ASSERT_TRUE(c->Add(std::string(" world")).has_value());
    auto restored = compression.Decompress(c->Finish().value(), "zstd", false, std::nullopt);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(std::get<std::string>(*restored), "hello world");
}

TEST(ZstdCompressorTest, OutputBudgetStopsDecompression) {
    DefaultCompression compression;
    auto c = compression.StartCompress("zstd", true, std::nullopt).value();
    ASSERT_TRUE(c->Add(Bytes(1 << 20, std::byte{0})).has_value());
    auto batch = c->Finish().value();
    EXPECT_LT(PayloadSize(batch), 1024u);

    auto limited = compression.Decompress(batch, "zstd", true, 64 * 1024);
    ASSERT_FALSE(limited.has_value());
    EXPECT_EQ(limited.error().code, ErrorCode::MaxSizeExceeded);

    auto exact = compression.Decompress(batch, "zstd", true, 1 << 20);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(PayloadSize(*exact), 1u << 20);
}

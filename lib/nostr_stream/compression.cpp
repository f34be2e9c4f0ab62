// SPDX-License-Identifier: MIT

#include "nostr_stream/compression.hpp"

#include <zstd.h>

#include <algorithm>
#include <string>

#include <fmt/format.h>

namespace nostr_stream {

namespace {

struct CCtxDeleter {
    void operator()(ZSTD_CCtx* c) const { ZSTD_freeCCtx(c); }
};
struct DCtxDeleter {
    void operator()(ZSTD_DCtx* d) const { ZSTD_freeDCtx(d); }
};

Error SizeLimit(size_t projected, size_t limit) {
    return Error{ErrorCode::CompressionSizeLimitExceeded,
                 fmt::format("Compression result size ({} bytes) exceeds the maximum "
                             "allowed size ({} bytes)", projected, limit)};
}

Error KindMismatch(bool binary) {
    return Error{ErrorCode::CompressionFailed,
                 binary ? "Text input in binary mode" : "Binary input in text mode"};
}

Error UnsupportedMethod(std::string_view method) {
    return Error{ErrorCode::UnsupportedMethod,
                 fmt::format("Unsupported compression method '{}'", method)};
}

// "none": concatenates parts, enforcing the ceiling on the raw size.
class NoneCompressor : public ICompressor {
public:
    NoneCompressor(bool binary, std::optional<size_t> max_result_size)
        : binary_(binary), max_result_size_(max_result_size) {}

    std::expected<size_t, Error> Add(const Payload& part) override {
        if (IsBinary(part) != binary_) return std::unexpected(KindMismatch(binary_));
        size_t size = PayloadSize(part);
        if (max_result_size_ && buffer_.size() + size > *max_result_size_) {
            return std::unexpected(SizeLimit(buffer_.size() + size, *max_result_size_));
        }
        std::visit([this](const auto& v) {
            buffer_.append(reinterpret_cast<const char*>(v.data()), v.size());
        }, part);
        return buffer_.size();
    }

    std::expected<Payload, Error> Finish() override {
        if (binary_) return ToBytes(buffer_);
        return std::move(buffer_);
    }

    std::optional<size_t> MaxChunkSize() const override { return max_result_size_; }

private:
    bool binary_;
    std::optional<size_t> max_result_size_;
    std::string buffer_;
};

// "zstd": one frame per batch, flushed after every part so the batch size
// is exact between parts.
class ZstdCompressor : public ICompressor {
public:
    ZstdCompressor(std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx, bool binary,
                   std::optional<size_t> ceiling)
        : cctx_(std::move(cctx)), binary_(binary), ceiling_(ceiling) {}

    std::expected<size_t, Error> Add(const Payload& part) override {
        if (IsBinary(part) != binary_) return std::unexpected(KindMismatch(binary_));
        size_t size = PayloadSize(part);
        if (ceiling_) {
            // Raw input length; the frame epilogue fits in the trailer margin
            size_t projected = output_.size() + size;
            if (projected > *ceiling_) {
                return std::unexpected(SizeLimit(projected, *ceiling_));
            }
        }
        const void* data = std::visit([](const auto& v) -> const void* { return v.data(); }, part);
        ZSTD_inBuffer in{data, size, 0};
        auto r = Drive(in, ZSTD_e_flush);
        if (!r) return std::unexpected(r.error());
        return output_.size();
    }

    std::expected<Payload, Error> Finish() override {
        ZSTD_inBuffer in{nullptr, 0, 0};
        auto r = Drive(in, ZSTD_e_end);
        if (!r) return std::unexpected(r.error());
        return std::move(output_);
    }

    std::optional<size_t> MaxChunkSize() const override { return ceiling_; }

private:
    std::expected<void, Error> Drive(ZSTD_inBuffer& in, ZSTD_EndDirective mode) {
        Bytes chunk(ZSTD_CStreamOutSize());
        size_t remaining = 0;
        do {
            ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
            remaining = ZSTD_compressStream2(cctx_.get(), &out, &in, mode);
            if (ZSTD_isError(remaining)) {
                return std::unexpected(Error{
                    ErrorCode::CompressionFailed,
                    std::string("ZSTD compression failed: ") + ZSTD_getErrorName(remaining)});
            }
            output_.insert(output_.end(), chunk.begin(), chunk.begin() + out.pos);
        } while (remaining != 0 || in.pos < in.size);
        return {};
    }

    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx_;
    bool binary_;
    std::optional<size_t> ceiling_;
    Bytes output_;
};

// Output past @p max_output fails with MaxSizeExceeded; past the built-in
// bound with DecompressionFailed.
std::expected<Bytes, Error> ZstdDecompress(const Bytes& input, std::optional<size_t> max_output) {
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
    if (!dctx) {
        return std::unexpected(Error{ErrorCode::DecompressionFailed,
                                     "Failed to create ZSTD_DCtx"});
    }

    size_t limit = DefaultCompression::kMaxDecompressedSize;
    if (max_output) limit = std::min(limit, *max_output);

    Bytes output;
    Bytes chunk(ZSTD_DStreamOutSize());
    auto append = [&](size_t n) -> std::expected<void, Error> {
        if (n > limit - output.size()) {
            if (max_output && limit == *max_output) {
                return std::unexpected(Error{
                    ErrorCode::MaxSizeExceeded,
                    fmt::format("Decompressed output exceeds {} bytes", limit)});
            }
            return std::unexpected(Error{ErrorCode::DecompressionFailed,
                                         "Decompressed output buffer overflow"});
        }
        output.insert(output.end(), chunk.begin(), chunk.begin() + n);
        return {};
    };

    ZSTD_inBuffer in{input.data(), input.size(), 0};
    size_t last_result = 1;
    while (in.pos < in.size) {
        ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
        last_result = ZSTD_decompressStream(dctx.get(), &out, &in);
        if (ZSTD_isError(last_result)) {
            return std::unexpected(Error{
                ErrorCode::DecompressionFailed,
                std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(last_result)});
        }
        if (auto r = append(out.pos); !r) return std::unexpected(r.error());
    }
    // Drain output still buffered inside the context
    while (last_result != 0) {
        ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
        last_result = ZSTD_decompressStream(dctx.get(), &out, &in);
        if (ZSTD_isError(last_result)) {
            return std::unexpected(Error{
                ErrorCode::DecompressionFailed,
                std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(last_result)});
        }
        if (out.pos == 0) break;
        if (auto r = append(out.pos); !r) return std::unexpected(r.error());
    }
    if (last_result != 0) {
        return std::unexpected(Error{ErrorCode::DecompressionFailed, "Incomplete zstd frame"});
    }
    return output;
}

}  // namespace

bool DefaultCompression::Supports(std::string_view method) const {
    return method == kCompressionNone || method == kCompressionZstd;
}

std::expected<std::unique_ptr<ICompressor>, Error> DefaultCompression::StartCompress(
    std::string_view method, bool binary, std::optional<size_t> max_result_size) {
    if (method == kCompressionNone) {
        return std::make_unique<NoneCompressor>(binary, max_result_size);
    }
    if (method != kCompressionZstd) {
        return std::unexpected(UnsupportedMethod(method));
    }

    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
    if (!cctx) {
        return std::unexpected(Error{ErrorCode::CompressionFailed, "Failed to create ZSTD_CCtx"});
    }
    size_t rc = ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, zstd_level_);
    if (ZSTD_isError(rc)) {
        return std::unexpected(Error{
            ErrorCode::CompressionFailed,
            std::string("Failed to set zstd level: ") + ZSTD_getErrorName(rc)});
    }

    std::optional<size_t> ceiling;
    if (max_result_size) {
        size_t reduced = *max_result_size > kTrailerMargin ? *max_result_size - kTrailerMargin : 0;
        ceiling = std::max(kMinCeiling, reduced);
    }
    return std::make_unique<ZstdCompressor>(std::move(cctx), binary, ceiling);
}

std::expected<Payload, Error> DefaultCompression::Decompress(
    const Payload& data, std::string_view method, bool binary,
    std::optional<size_t> max_output_size) {
    Bytes output;
    if (method == kCompressionNone) {
        output = PayloadBytes(data);
        if (max_output_size && output.size() > *max_output_size) {
            return std::unexpected(Error{
                ErrorCode::MaxSizeExceeded,
                fmt::format("Decompressed output exceeds {} bytes", *max_output_size)});
        }
    } else if (method == kCompressionZstd) {
        auto r = ZstdDecompress(PayloadBytes(data), max_output_size);
        if (!r) return std::unexpected(r.error());
        output = std::move(*r);
    } else {
        return std::unexpected(UnsupportedMethod(method));
    }
    if (binary) return output;
    return ToString(output);
}

}  // namespace nostr_stream

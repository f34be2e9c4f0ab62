// SPDX-License-Identifier: MIT

// lib/nostr_stream/compression.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string_view>

#include "nostr_stream/error.hpp"
#include "nostr_stream/payload.hpp"

namespace nostr_stream {

inline constexpr std::string_view kCompressionNone = "none";
inline constexpr std::string_view kCompressionZstd = "zstd";

/// One compressed batch in the making. Released by destruction.
class ICompressor {
public:
    virtual ~ICompressor() = default;

    /// Feed one part of input.
    ///
    /// @return Current size of the compressed batch, or
    ///         CompressionSizeLimitExceeded if the part would push the
    ///         batch past the size ceiling. In that case the part was not
    ///         consumed and Finish() still yields the batch so far.
    virtual std::expected<size_t, Error> Add(const Payload& part) = 0;

    /// Close the batch and return it: Bytes for real compression, the
    /// input's own kind for "none".
    virtual std::expected<Payload, Error> Finish() = 0;

    /// Largest batch this instance will produce, if it imposes one.
    virtual std::optional<size_t> MaxChunkSize() const = 0;
};

/// Compression strategy. Callers always pass one explicitly.
class ICompression {
public:
    virtual ~ICompression() = default;

    virtual bool Supports(std::string_view method) const = 0;

    /// @param binary           Input parts are Bytes (true) or text (false)
    /// @param max_result_size  Ceiling for the finished batch; nullopt = none
    virtual std::expected<std::unique_ptr<ICompressor>, Error> StartCompress(
        std::string_view method, bool binary, std::optional<size_t> max_result_size) = 0;

    /// Inverse of a finished batch. Returns Bytes when @p binary, text otherwise.
    /// Output larger than @p max_output_size fails with MaxSizeExceeded
    /// before it is fully produced.
    virtual std::expected<Payload, Error> Decompress(const Payload& data,
                                                     std::string_view method, bool binary,
                                                     std::optional<size_t> max_output_size) = 0;
};

/// Built-in strategy supporting "none" and "zstd".
class DefaultCompression : public ICompression {
public:
    /// Room left for the zstd frame epilogue below the requested ceiling.
    static constexpr size_t kTrailerMargin = 1024;
    /// Smallest ceiling a zstd batch is ever given.
    static constexpr size_t kMinCeiling = 64;
    /// Upper bound on a single decompressed chunk.
    static constexpr size_t kMaxDecompressedSize = 64 * 1024 * 1024;

    explicit DefaultCompression(int zstd_level = 3) : zstd_level_(zstd_level) {}

    bool Supports(std::string_view method) const override;

    std::expected<std::unique_ptr<ICompressor>, Error> StartCompress(
        std::string_view method, bool binary, std::optional<size_t> max_result_size) override;

    std::expected<Payload, Error> Decompress(const Payload& data, std::string_view method,
                                             bool binary,
                                             std::optional<size_t> max_output_size) override;

private:
    int zstd_level_;
};

}  // namespace nostr_stream

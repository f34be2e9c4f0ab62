// SPDX-License-Identifier: MIT

// lib/nostr_stream/config.hpp
#pragma once

#include <chrono>
#include <cstddef>

namespace nostr_stream {

/// Batching and sizing for StreamWriter.
///
/// A batch is flushed as one chunk when it reaches min_chunk_size, when
/// min_chunk_interval has passed since the last flush, or on the final
/// write. With both thresholds zero every write is flushed.
struct WriterConfig {
    std::chrono::milliseconds min_chunk_interval{0};  ///< 0 = no time-based flush
    size_t min_chunk_size = 64 * 1024;                ///< 0 = no size-based flush
    size_t max_chunk_size = 256 * 1024;               ///< Hard ceiling per chunk payload

    static WriterConfig Defaults() { return WriterConfig{}; }

    /// Preset for interactive streams: one chunk per write.
    static WriterConfig Unbatched() {
        return WriterConfig{
            .min_chunk_interval = std::chrono::milliseconds{0},
            .min_chunk_size = 0,
            .max_chunk_size = 256 * 1024,
        };
    }
};

/// Limits enforced by StreamReader.
struct ReaderConfig {
    size_t max_chunks = 1000;                   ///< Chunks accepted per stream
    size_t max_result_size = 10 * 1024 * 1024;  ///< Decoded bytes (or text bytes) per stream
    std::chrono::milliseconds ttl{60000};       ///< Stall timeout; <= 0 disables the watchdog

    static ReaderConfig Defaults() { return ReaderConfig{}; }
};

}  // namespace nostr_stream

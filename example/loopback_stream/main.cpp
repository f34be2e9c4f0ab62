// SPDX-License-Identifier: MIT

// Pipes stdin through a StreamWriter and a StreamReader connected by an
// in-memory relay set, writing the reassembled stream to stdout.
//
// Usage: loopback_stream [--binary] [--zstd] [--nip44] [--chunk-size N]
// Log level: SPDLOG_LEVEL=debug loopback_stream < input

#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "nostr_stream/compression.hpp"
#include "nostr_stream/encryption.hpp"
#include "nostr_stream/event_loop.hpp"
#include "nostr_stream/keys.hpp"
#include "nostr_stream/log.hpp"
#include "nostr_stream/loopback_relay.hpp"
#include "nostr_stream/metadata.hpp"
#include "nostr_stream/payload.hpp"
#include "nostr_stream/reader.hpp"
#include "nostr_stream/signer.hpp"
#include "nostr_stream/writer.hpp"

using namespace nostr_stream;

namespace {

struct Options {
    bool binary = false;
    bool zstd = false;
    bool nip44 = false;
    size_t chunk_size = 64 * 1024;
};

void PrintUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--binary] [--zstd] [--nip44] [--chunk-size N]\n";
}

bool ParseArgs(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--binary") {
            opts.binary = true;
        } else if (arg == "--zstd") {
            opts.zstd = true;
        } else if (arg == "--nip44") {
            opts.nip44 = true;
        } else if (arg == "--chunk-size" && i + 1 < argc) {
            opts.chunk_size = std::strtoul(argv[++i], nullptr, 10);
        } else {
            return false;
        }
    }
    return true;
}

constexpr size_t kReadBlock = 16 * 1024;

}  // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    Options opts;
    if (!ParseArgs(argc, argv, opts)) {
        PrintUsage(argv[0]);
        return 2;
    }

    SecretKey sender = GenerateSecretKey();
    SecretKey receiver = GenerateSecretKey();

    StreamMetadata meta;
    meta.stream_id = DerivePublicKey(sender).value();
    meta.relays = {"loopback://a", "loopback://b"};
    meta.binary = opts.binary;
    meta.compression = opts.zstd ? "zstd" : "none";
    meta.encryption = opts.nip44 ? "nip44" : "none";
    if (opts.nip44) meta.receiver_public_key = DerivePublicKey(receiver).value();

    StreamMetadata reader_meta = meta;
    if (opts.nip44) reader_meta.receiver_private_key = receiver;

    EventLoop loop;
    IEventLoop& iface = loop;
    LoopbackRelay relay(iface);
    SchnorrSigner signer;
    DefaultCompression compression;
    DefaultEncryption encryption;

    WriterConfig writer_config;
    writer_config.min_chunk_size = opts.chunk_size;

    std::shared_ptr<StreamWriter> writer;
    std::shared_ptr<StreamReader> reader;
    int exit_code = 0;
    bool writer_settled = false;
    bool reader_ended = false;

    auto maybe_stop = [&]() {
        if (writer_settled && reader_ended) loop.Stop();
    };

    std::function<void()> pull = [&]() {
        reader->Next([&](StreamReader::NextResult r) {
            if (!r) {
                Logger()->error("Reader failed: {} ({})", r.error().message,
                                error_code_string(r.error()));
                exit_code = 1;
                reader_ended = true;
                maybe_stop();
                return;
            }
            if (!r->has_value()) {
                Logger()->info("Stream complete: {} chunks, {} bytes", reader->ChunkCount(),
                               reader->TotalSize());
                reader_ended = true;
                maybe_stop();
                return;
            }
            auto bytes = PayloadBytes(**r);
            std::fwrite(bytes.data(), 1, bytes.size(), stdout);
            pull();
        });
    };

    // Text blocks end on a code point boundary; the cut-off tail leads the next block
    std::string carry;
    std::function<void()> feed = [&]() {
        std::string block = std::move(carry);
        carry.clear();
        size_t offset = block.size();
        block.resize(offset + kReadBlock);
        std::cin.read(block.data() + offset, static_cast<std::streamsize>(kReadBlock));
        block.resize(offset + static_cast<size_t>(std::cin.gcount()));
        bool done = !std::cin;

        if (!opts.binary && !done) {
            size_t complete = CompleteUtf8Prefix(block);
            carry.assign(block, complete, std::string::npos);
            block.resize(complete);
        }

        Payload data = opts.binary ? Payload{ToBytes(block)} : Payload{std::move(block)};
        writer->Write(std::move(data), done, [&, done](std::expected<void, Error> r) {
            if (!r) {
                Logger()->error("Writer failed: {} ({})", r.error().message,
                                error_code_string(r.error()));
                exit_code = 1;
                // The reader ends on the error chunk the writer sends
                writer_settled = true;
                maybe_stop();
                return;
            }
            if (done) {
                Logger()->info("Writer published {} chunks", writer->ChunkCount());
                writer_settled = true;
                maybe_stop();
                return;
            }
            feed();
        });
    };

    iface.Defer([&]() {
        try {
            reader = StreamReader::Create(iface, relay, reader_meta, compression, encryption);
            writer = StreamWriter::Create(iface, relay, meta, sender, signer, compression,
                                          encryption, writer_config);
        } catch (const std::invalid_argument& e) {
            Logger()->error("Invalid stream setup: {}", e.what());
            exit_code = 2;
            loop.Stop();
            return;
        }
        Logger()->info("Streaming stdin as {} (compression={}, encryption={})", meta.stream_id,
                       meta.compression, meta.encryption);
        pull();
        feed();
    });

    loop.Run();
    std::fflush(stdout);
    return exit_code;
}

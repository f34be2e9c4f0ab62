// SPDX-License-Identifier: MIT

#include "nostr_stream/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace nostr_stream {

std::shared_ptr<spdlog::logger> Logger() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    return spdlog::stderr_color_mt(kLoggerName);
}

}  // namespace nostr_stream

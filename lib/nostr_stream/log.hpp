// SPDX-License-Identifier: MIT

// lib/nostr_stream/log.hpp
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace nostr_stream {

/// Name of the library logger in the spdlog registry.
inline constexpr const char* kLoggerName = "nostr_stream";

/// Library-wide logger.
///
/// Returns the logger registered under kLoggerName, creating a stderr
/// colour logger on first use. Applications may register their own logger
/// under that name before the first call to redirect library output; the
/// level follows spdlog's registry (e.g. SPDLOG_LEVEL via
/// spdlog::cfg::load_env_levels()).
std::shared_ptr<spdlog::logger> Logger();

}  // namespace nostr_stream

#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

/**
 * \file diagnostics.h
 * \brief Caller-provided log sink for non-fatal findings.
 *
 * Library code never prints. Components that skip bad input instead of
 * failing report it through a \ref LogSink held in their options.
 */

namespace bpkit {

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warning,
    Error,
};

/// Receives one message per call. An empty sink discards messages.
using LogSink = std::function<void(LogLevel level, std::string_view message)>;

const char*
log_level_name(LogLevel level) noexcept;

/// Forwards to \p sink if it is set.
void
log_message(const LogSink& sink, LogLevel level, std::string_view message);

/**
 * \brief Sink that prints `<prefix>: <level>: <message>` to stderr.
 *
 * Messages are escaped for the terminal. Levels below \p min_level are
 * dropped.
 */
LogSink
stderr_log_sink(std::string_view prefix, LogLevel min_level = LogLevel::Info);

}  // namespace bpkit

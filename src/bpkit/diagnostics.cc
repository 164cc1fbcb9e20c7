#include "bpkit/diagnostics.h"

#include "bpkit/console_format.h"

#include <cstdio>
#include <string>

namespace bpkit {

const char*
log_level_name(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error: return "error";
    }
    return "unknown";
}


void
log_message(const LogSink& sink, LogLevel level, std::string_view message)
{
    if (sink) {
        sink(level, message);
    }
}


LogSink
stderr_log_sink(std::string_view prefix, LogLevel min_level)
{
    return [name = std::string(prefix), min_level](LogLevel level,
                                                   std::string_view message) {
        if (static_cast<uint8_t>(level) < static_cast<uint8_t>(min_level)) {
            return;
        }
        std::string line;
        (void)append_console_escaped_ascii(message, 512U, &line);
        std::fprintf(stderr, "%s: %s: %s\n", name.c_str(),
                     log_level_name(level), line.c_str());
    };
}

}  // namespace bpkit

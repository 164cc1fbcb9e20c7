#include "bpkit/build_info.h"
#include "bpkit/byte_source.h"
#include "bpkit/console_format.h"
#include "bpkit/diagnostics.h"
#include "bpkit/resource_policy.h"
#include "bpkit/save_stream.h"

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>

#include <unistd.h>

namespace bpkit {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] [file|-]\n"
            "\n"
            "Reads a save parser event stream (a capture file, or stdin), prints\n"
            "progress to stderr and the expanded save data as JSON to stdout.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print bpkit build info\n"
            "  --quiet                Do not print progress\n"
            "  --verbose              Also print debug messages\n"
            "  --indent N             JSON indent (default: 2, -1=compact)\n"
            "  --timeout-ms N         Cancel the read after N milliseconds (0=never)\n"
            "  --max-line-bytes N     Max buffered line bytes (default: 67108864)\n"
            "  --max-records N        Max decoded records (default: 4194304)\n"
            "  --max-depth N          Max row nesting depth (default: 64)\n"
            "  --max-doc-depth N      Max save-data nesting depth (default: 128)\n",
            argv0 ? argv0 : "bpstream");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_int_arg(const char* s, int* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end = nullptr;
        long v    = std::strtol(s, &end, 10);
        if (!end || *end != '\0' || v < -1 || v > 16) {
            return false;
        }
        *out = static_cast<int>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static const char* save_stream_status_name(SaveStreamStatus status) noexcept
    {
        switch (status) {
        case SaveStreamStatus::Ok: return "ok";
        case SaveStreamStatus::DecodeError: return "decode_error";
        case SaveStreamStatus::RemoteError: return "remote_error";
        case SaveStreamStatus::NoSaveData: return "no_save_data";
        case SaveStreamStatus::Cancelled: return "cancelled";
        case SaveStreamStatus::ReadError: return "read_error";
        case SaveStreamStatus::LimitExceeded: return "limit_exceeded";
        }
        return "unknown";
    }


    static const char* save_data_status_name(SaveDataStatus status) noexcept
    {
        switch (status) {
        case SaveDataStatus::Ok: return "ok";
        case SaveDataStatus::ParseError: return "parse_error";
        case SaveDataStatus::Malformed: return "malformed";
        case SaveDataStatus::SchemaMismatch: return "schema_mismatch";
        case SaveDataStatus::LimitExceeded: return "limit_exceeded";
        }
        return "unknown";
    }


    /// Cancels a reader once a deadline passes unless disarmed first.
    class Watchdog final {
    public:
        Watchdog(EventStreamReader* reader, uint64_t timeout_ms)
        {
            if (timeout_ms == 0U) {
                return;
            }
            thread_ = std::thread([this, reader, timeout_ms]() {
                std::unique_lock<std::mutex> lock(mutex_);
                const bool disarmed
                    = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                   [this]() { return disarmed_; });
                if (!disarmed) {
                    reader->cancel();
                }
            });
        }

        ~Watchdog()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                disarmed_ = true;
            }
            cv_.notify_all();
            if (thread_.joinable()) {
                thread_.join();
            }
        }

        Watchdog(const Watchdog&)            = delete;
        Watchdog& operator=(const Watchdog&) = delete;

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        bool disarmed_ = false;
        std::thread thread_;
    };

}  // namespace
}  // namespace bpkit


int
main(int argc, char** argv)
{
    using namespace bpkit;

    bool quiet          = false;
    bool verbose        = false;
    int indent          = 2;
    uint64_t timeout_ms = 0;
    BpkitResourcePolicy policy;
    uint64_t max_depth     = policy.compact_limits.max_depth;
    uint64_t max_doc_depth = policy.max_document_depth;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--quiet") == 0) {
            quiet = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--verbose") == 0) {
            verbose = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--indent") == 0 && i + 1 < argc) {
            if (!parse_int_arg(argv[i + 1], &indent)) {
                std::fprintf(stderr, "invalid --indent value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--timeout-ms") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &timeout_ms)) {
                std::fprintf(stderr, "invalid --timeout-ms value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-line-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &policy.stream_limits.max_line_bytes)) {
                std::fprintf(stderr, "invalid --max-line-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-records") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &policy.compact_limits.max_records)) {
                std::fprintf(stderr, "invalid --max-records value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-depth") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &max_depth) || max_depth == 0U
                || max_depth > 0xFFFFFFFFULL) {
                std::fprintf(stderr, "invalid --max-depth value\n");
                return 2;
            }
            policy.compact_limits.max_depth = static_cast<uint32_t>(max_depth);
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-doc-depth") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &max_doc_depth)
                || max_doc_depth == 0U || max_doc_depth > 0xFFFFFFFFULL) {
                std::fprintf(stderr, "invalid --max-doc-depth value\n");
                return 2;
            }
            policy.max_document_depth = static_cast<uint32_t>(max_doc_depth);
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (argc - first_path > 1) {
        usage(argv[0]);
        return 2;
    }
    const char* path = (first_path < argc) ? argv[first_path] : "-";

    FdByteSource source;
    if (std::strcmp(path, "-") == 0) {
        source = FdByteSource(STDIN_FILENO, /*owns_fd=*/false);
    } else if (!source.open(path)) {
        std::fprintf(stderr, "bpstream: %s: open_failed\n", path);
        return 1;
    }

    SaveStreamOptions options;
    apply_resource_policy(policy, &options);
    options.log = stderr_log_sink("bpstream", verbose ? LogLevel::Debug
                                                      : LogLevel::Info);

    const ProgressFn progress = [quiet](int percent) {
        if (!quiet) {
            std::fprintf(stderr, "progress: %d%%\n", percent);
        }
    };

    EventStreamReader reader(options.stream);
    Json document;
    SaveStreamResult res;
    {
        Watchdog watchdog(&reader, timeout_ms);
        res = read_save_stream(&reader, source, options, progress, &document);
    }

    if (res.status != SaveStreamStatus::Ok) {
        std::fprintf(stderr, "bpstream: %s: %s", path,
                     save_stream_status_name(res.status));
        if (res.status == SaveStreamStatus::DecodeError) {
            std::fprintf(stderr, " (%s%s%s)",
                         save_data_status_name(res.decode_status),
                         res.error_field.empty() ? "" : " field=",
                         res.error_field.c_str());
        } else if (res.status == SaveStreamStatus::RemoteError) {
            std::string message;
            (void)append_console_escaped_ascii(res.message, 256U, &message);
            std::fprintf(stderr, " (%s)", message.c_str());
        }
        std::fprintf(stderr, "\n");
        return 1;
    }

    if (!quiet && res.skipped_frames != 0U) {
        std::fprintf(stderr, "bpstream: skipped %u malformed frames\n",
                     res.skipped_frames);
    }
    const std::string text
        = document.dump(indent, ' ', false, Json::error_handler_t::replace);
    std::printf("%s\n", text.c_str());
    return 0;
}

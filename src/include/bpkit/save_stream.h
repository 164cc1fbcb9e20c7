#pragma once

#include "bpkit/diagnostics.h"
#include "bpkit/event_stream.h"
#include "bpkit/save_data.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

/**
 * \file save_stream.h
 * \brief Reads a save parser event stream: progress updates, then the
 * save-data document.
 */

namespace bpkit {

inline constexpr std::string_view kEventProgress = "progress";
inline constexpr std::string_view kEventParser   = "parser";
inline constexpr std::string_view kEventSaveData = "save-data";

/// Data sent on the default event when the producer has nothing more.
inline constexpr std::string_view kStreamDoneMarker = "[DONE]";

enum class SaveStreamStatus : uint8_t {
    Ok,
    /// The save-data payload could not be parsed or expanded.
    DecodeError,
    /// The producer reported an error (`{"error": "..."}`).
    RemoteError,
    /// The stream ended without a save-data frame.
    NoSaveData,
    Cancelled,
    ReadError,
    LimitExceeded,
};

/// Result of parsing one progress payload.
enum class ProgressParse : uint8_t {
    Ok,
    /// Valid JSON object without a `progress` member.
    NoProgress,
    Malformed,
};

struct SaveStreamOptions final {
    EventStreamOptions stream;
    SaveDataOptions save_data;
    /// Receives skipped-frame warnings and decode errors.
    LogSink log;
};

/// Called with a percentage in [0, 100].
using ProgressFn = std::function<void(int percent)>;

struct SaveStreamResult final {
    SaveStreamStatus status = SaveStreamStatus::Ok;
    /// Detail for DecodeError.
    SaveDataStatus decode_status = SaveDataStatus::Ok;
    std::string error_field;
    /// Remote error text for RemoteError.
    std::string message;

    uint32_t progress_updates = 0;
    int last_progress         = -1;
    /// Progress frames that were malformed and ignored.
    uint32_t skipped_frames = 0;

    StreamResult stream;
};

/**
 * \brief Parses `{"progress": <number>}` into a rounded percentage.
 *
 * The value is clamped to [0, 100].
 */
ProgressParse
parse_progress_payload(std::string_view data, int* percent);

/**
 * \brief Reads \p source until the save-data frame arrives and decodes it.
 *
 * Progress frames are forwarded to \p progress (which may be empty). The
 * save-data frame stops the stream: no further bytes are read and the
 * source is closed. A bad save-data payload fails the whole read. On
 * success \p out holds the expanded document, otherwise null.
 */
SaveStreamResult
read_save_stream(ByteSource& source, const SaveStreamOptions& options,
                 const ProgressFn& progress, Json* out);

/**
 * \brief Same as above with a caller-owned \p reader, so another thread can
 * call \ref EventStreamReader::cancel.
 *
 * The reader's handlers are replaced for the duration of the call.
 */
SaveStreamResult
read_save_stream(EventStreamReader* reader, ByteSource& source,
                 const SaveStreamOptions& options, const ProgressFn& progress,
                 Json* out);

}  // namespace bpkit

#pragma once

#include "bpkit/byte_source.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

/**
 * \file event_stream.h
 * \brief Incremental reader for `event:` / `data:` line-framed streams.
 */

namespace bpkit {

/// Event name used for data lines that follow no `event:` line.
inline constexpr std::string_view kDefaultEventName = "message";

/// One decoded frame. Views are valid only during the handler call.
struct EventFrame final {
    std::string_view event;
    std::string_view data;
};

/// What the reader does after a handler returns.
enum class FrameAction : uint8_t {
    Continue,
    /// Terminal frame handled: stop reading and release the source.
    Stop,
    /// Abort the stream with an error.
    Fail,
};

using FrameHandler = std::function<FrameAction(const EventFrame& frame)>;

enum class ReaderState : uint8_t {
    AwaitingEvent,
    AwaitingData,
    Dispatched,
};

enum class StreamStatus : uint8_t {
    /// More input is accepted (only returned by `feed`).
    Ok,
    /// A handler returned \ref FrameAction::Stop.
    Stopped,
    /// A handler returned \ref FrameAction::Fail.
    Failed,
    Cancelled,
    /// The source reached its end.
    Ended,
    /// A partial line exceeded \ref EventStreamLimits::max_line_bytes.
    LimitExceeded,
    ReadError,
};

struct EventStreamLimits final {
    uint64_t max_line_bytes = 64ULL * 1024ULL * 1024ULL;
};

struct EventStreamOptions final {
    EventStreamLimits limits;
    /// Size of each `ByteSource::read` request in \ref EventStreamReader::run.
    size_t read_chunk_bytes = 16384U;
};

struct StreamResult final {
    StreamStatus status     = StreamStatus::Ok;
    uint64_t bytes_consumed = 0;
    uint64_t frames         = 0;
    uint32_t reads          = 0;
};

/**
 * \brief Line-framed stream parser with named handlers.
 *
 * Input may arrive in pieces of any size; only complete `\n`-terminated
 * lines are acted on (a trailing `\r` is dropped). `event:` sets the
 * current event name, which persists until the next `event:` line. Each
 * `data:` line is one frame and is dispatched right away. Other lines are
 * ignored.
 *
 * Not thread-safe, except \ref cancel which may be called from any thread.
 */
class EventStreamReader final {
public:
    explicit EventStreamReader(EventStreamOptions options
                               = EventStreamOptions {});

    EventStreamReader(const EventStreamReader&)            = delete;
    EventStreamReader& operator=(const EventStreamReader&) = delete;

    /// Registers \p handler for \p event, replacing any previous one.
    void on(std::string event, FrameHandler handler);
    void clear_handlers() noexcept { handlers_.clear(); }

    /**
     * \brief Consumes \p bytes.
     *
     * Returns \ref StreamStatus::Ok while more input is accepted. Once a
     * terminal status is reached, later calls return it unchanged and the
     * rest of the buffer is discarded.
     */
    StreamStatus feed(std::span<const std::byte> bytes);
    StreamStatus feed(std::string_view text);

    /**
     * \brief Pulls from \p source until a terminal status.
     *
     * No read is issued after a handler stops or fails the stream. The
     * source is closed before returning.
     */
    StreamResult run(ByteSource& source);

    /// Requests cancellation. Safe to call from another thread.
    void cancel() noexcept;
    bool cancelled() const noexcept;

    ReaderState state() const noexcept { return state_; }
    std::string_view current_event() const noexcept { return event_; }
    uint64_t frames_dispatched() const noexcept { return frames_; }
    size_t buffered_bytes() const noexcept { return partial_.size(); }

private:
    StreamStatus handle_line(std::string_view line);
    StreamStatus dispatch(std::string_view data);

    EventStreamOptions options_;
    std::map<std::string, FrameHandler, std::less<>> handlers_;
    std::string partial_;
    size_t scanned_ = 0;
    std::string event_;
    ReaderState state_   = ReaderState::AwaitingEvent;
    StreamStatus result_ = StreamStatus::Ok;
    uint64_t frames_     = 0;
    std::atomic<bool> cancelled_ { false };
};

}  // namespace bpkit

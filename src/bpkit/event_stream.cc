#include "bpkit/event_stream.h"

#include <utility>
#include <vector>

namespace bpkit {
namespace {

    static constexpr std::string_view kEventPrefix = "event:";
    static constexpr std::string_view kDataPrefix  = "data:";

    static bool is_space(char c) noexcept
    {
        return c == ' ' || c == '\t';
    }


    static std::string_view trim(std::string_view s) noexcept
    {
        while (!s.empty() && is_space(s.front())) {
            s.remove_prefix(1);
        }
        while (!s.empty() && is_space(s.back())) {
            s.remove_suffix(1);
        }
        return s;
    }


    static bool starts_with(std::string_view s, std::string_view prefix) noexcept
    {
        return s.size() >= prefix.size()
               && s.compare(0, prefix.size(), prefix) == 0;
    }

}  // namespace

EventStreamReader::EventStreamReader(EventStreamOptions options)
    : options_(options)
    , event_(kDefaultEventName)
{
}


void
EventStreamReader::on(std::string event, FrameHandler handler)
{
    handlers_[std::move(event)] = std::move(handler);
}


StreamStatus
EventStreamReader::feed(std::span<const std::byte> bytes)
{
    return feed(std::string_view(reinterpret_cast<const char*>(bytes.data()),
                                 bytes.size()));
}


StreamStatus
EventStreamReader::feed(std::string_view text)
{
    if (result_ != StreamStatus::Ok) {
        return result_;
    }

    partial_.append(text.data(), text.size());

    // Bytes before scanned_ are known to hold no newline.
    size_t start = 0;
    size_t from  = scanned_;
    for (;;) {
        if (cancelled()) {
            result_ = StreamStatus::Cancelled;
            break;
        }
        const size_t nl = partial_.find('\n', from);
        if (nl == std::string::npos) {
            break;
        }
        std::string_view line(partial_.data() + start, nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        start = nl + 1;
        from  = start;

        const StreamStatus st = handle_line(line);
        if (st != StreamStatus::Ok) {
            result_ = st;
            break;
        }
    }

    if (result_ != StreamStatus::Ok) {
        partial_.clear();
        scanned_ = 0;
        return result_;
    }

    partial_.erase(0, start);
    scanned_ = partial_.size();
    if (options_.limits.max_line_bytes != 0U
        && partial_.size() > options_.limits.max_line_bytes) {
        partial_.clear();
        scanned_ = 0;
        result_  = StreamStatus::LimitExceeded;
    }
    return result_;
}


StreamStatus
EventStreamReader::handle_line(std::string_view line)
{
    if (starts_with(line, kEventPrefix)) {
        const std::string_view name = trim(line.substr(kEventPrefix.size()));
        event_.assign(name.empty() ? kDefaultEventName : name);
        state_ = ReaderState::AwaitingData;
        return StreamStatus::Ok;
    }
    if (starts_with(line, kDataPrefix)) {
        std::string_view data = line.substr(kDataPrefix.size());
        if (!data.empty() && data.front() == ' ') {
            data.remove_prefix(1);
        }
        return dispatch(data);
    }
    return StreamStatus::Ok;
}


StreamStatus
EventStreamReader::dispatch(std::string_view data)
{
    frames_ += 1;
    state_ = ReaderState::Dispatched;

    FrameAction action = FrameAction::Continue;
    const auto it      = handlers_.find(std::string_view(event_));
    if (it != handlers_.end() && it->second) {
        EventFrame frame;
        frame.event = event_;
        frame.data  = data;
        action      = it->second(frame);
    }

    state_ = ReaderState::AwaitingEvent;
    switch (action) {
    case FrameAction::Continue: return StreamStatus::Ok;
    case FrameAction::Stop: return StreamStatus::Stopped;
    case FrameAction::Fail: return StreamStatus::Failed;
    }
    return StreamStatus::Failed;
}


StreamResult
EventStreamReader::run(ByteSource& source)
{
    StreamResult res;
    const size_t chunk = (options_.read_chunk_bytes == 0U)
                             ? 4096U
                             : options_.read_chunk_bytes;
    std::vector<std::byte> buf(chunk);

    StreamStatus st = result_;
    while (st == StreamStatus::Ok) {
        if (cancelled()) {
            st = StreamStatus::Cancelled;
            break;
        }
        const ReadResult r = source.read(
            std::span<std::byte>(buf.data(), buf.size()), &cancelled_);
        res.reads += 1;
        switch (r.status) {
        case ReadStatus::Ok:
            res.bytes_consumed += r.size;
            st = feed(std::span<const std::byte>(buf.data(), r.size));
            break;
        case ReadStatus::End: st = StreamStatus::Ended; break;
        case ReadStatus::Cancelled: st = StreamStatus::Cancelled; break;
        case ReadStatus::Error: st = StreamStatus::ReadError; break;
        }
    }

    if (result_ == StreamStatus::Ok) {
        result_ = st;
    }
    source.close();
    res.status = st;
    res.frames = frames_;
    return res;
}


void
EventStreamReader::cancel() noexcept
{
    cancelled_.store(true, std::memory_order_release);
}


bool
EventStreamReader::cancelled() const noexcept
{
    return cancelled_.load(std::memory_order_acquire);
}

}  // namespace bpkit

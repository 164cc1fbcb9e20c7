#include "bpkit/save_stream.h"

#include <cmath>
#include <string>

namespace bpkit {
namespace {

    struct StreamState final {
        const SaveStreamOptions* options = nullptr;
        const ProgressFn* progress       = nullptr;
        SaveStreamResult* result         = nullptr;
        Json* document                   = nullptr;
        bool have_document               = false;
    };


    static void report_progress(StreamState* s, int percent)
    {
        s->result->progress_updates += 1;
        s->result->last_progress = percent;
        if (*s->progress) {
            (*s->progress)(percent);
        }
    }


    static void skip_frame(StreamState* s, std::string_view event,
                           std::string_view data)
    {
        s->result->skipped_frames += 1;
        std::string msg = "ignoring malformed ";
        msg.append(event);
        msg.append(" frame: ");
        msg.append(data.substr(0, 120));
        log_message(s->options->log, LogLevel::Warning, msg);
    }


    static FrameAction on_progress(StreamState* s, const EventFrame& frame)
    {
        int percent            = 0;
        const ProgressParse st = parse_progress_payload(frame.data, &percent);
        if (st == ProgressParse::Ok) {
            report_progress(s, percent);
        } else {
            skip_frame(s, frame.event, frame.data);
        }
        return FrameAction::Continue;
    }


    static FrameAction on_parser(StreamState* s, const EventFrame& frame)
    {
        int percent = 0;
        switch (parse_progress_payload(frame.data, &percent)) {
        case ProgressParse::Ok: report_progress(s, percent); break;
        case ProgressParse::NoProgress: break;
        case ProgressParse::Malformed:
            log_message(s->options->log, LogLevel::Debug,
                        "parser frame is not JSON");
            break;
        }
        return FrameAction::Continue;
    }


    static FrameAction on_save_data(StreamState* s, const EventFrame& frame)
    {
        const SaveDataResult decoded
            = decode_save_data(frame.data, s->document,
                               s->options->save_data);
        if (decoded.status != SaveDataStatus::Ok) {
            s->result->status        = SaveStreamStatus::DecodeError;
            s->result->decode_status = decoded.status;
            s->result->error_field   = decoded.error_field;
            std::string msg          = "save-data payload rejected";
            if (!decoded.error_field.empty()) {
                msg.append(" (field ");
                msg.append(decoded.error_field);
                msg.append(")");
            }
            log_message(s->options->log, LogLevel::Error, msg);
            return FrameAction::Fail;
        }
        s->have_document = true;
        return FrameAction::Stop;
    }


    static FrameAction on_message(StreamState* s, const EventFrame& frame)
    {
        if (frame.data == kStreamDoneMarker) {
            return FrameAction::Stop;
        }
        const Json value = Json::parse(frame.data.begin(), frame.data.end(),
                                       nullptr, /*allow_exceptions=*/false);
        if (value.is_object()) {
            const auto it = value.find("error");
            if (it != value.end()) {
                s->result->status = SaveStreamStatus::RemoteError;
                if (it->is_string()) {
                    s->result->message = it->get<std::string>();
                } else if (json_depth_within(
                               *it, s->options->save_data.max_document_depth)) {
                    s->result->message = it->dump();
                } else {
                    s->result->message = "error value nested too deeply";
                }
                return FrameAction::Fail;
            }
        }
        return FrameAction::Continue;
    }

}  // namespace

ProgressParse
parse_progress_payload(std::string_view data, int* percent)
{
    *percent         = 0;
    const Json value = Json::parse(data.begin(), data.end(), nullptr,
                                   /*allow_exceptions=*/false);
    if (value.is_discarded() || !value.is_object()) {
        return ProgressParse::Malformed;
    }
    const auto it = value.find("progress");
    if (it == value.end()) {
        return ProgressParse::NoProgress;
    }
    if (!it->is_number()) {
        return ProgressParse::Malformed;
    }

    double v = it->get<double>();
    if (!std::isfinite(v)) {
        return ProgressParse::Malformed;
    }
    if (v < 0.0) {
        v = 0.0;
    } else if (v > 100.0) {
        v = 100.0;
    }
    *percent = static_cast<int>(std::lround(v));
    return ProgressParse::Ok;
}


SaveStreamResult
read_save_stream(ByteSource& source, const SaveStreamOptions& options,
                 const ProgressFn& progress, Json* out)
{
    EventStreamReader reader(options.stream);
    return read_save_stream(&reader, source, options, progress, out);
}


SaveStreamResult
read_save_stream(EventStreamReader* reader, ByteSource& source,
                 const SaveStreamOptions& options, const ProgressFn& progress,
                 Json* out)
{
    SaveStreamResult res;
    *out = nullptr;

    StreamState state;
    state.options  = &options;
    state.progress = &progress;
    state.result   = &res;
    state.document = out;

    reader->on(std::string(kEventProgress), [&state](const EventFrame& f) {
        return on_progress(&state, f);
    });
    reader->on(std::string(kEventParser), [&state](const EventFrame& f) {
        return on_parser(&state, f);
    });
    reader->on(std::string(kEventSaveData), [&state](const EventFrame& f) {
        return on_save_data(&state, f);
    });
    reader->on(std::string(kDefaultEventName), [&state](const EventFrame& f) {
        return on_message(&state, f);
    });

    res.stream = reader->run(source);
    reader->clear_handlers();
    switch (res.stream.status) {
    case StreamStatus::Stopped:
        res.status = state.have_document ? SaveStreamStatus::Ok
                                         : SaveStreamStatus::NoSaveData;
        break;
    case StreamStatus::Failed:
        // The failing handler already recorded DecodeError or RemoteError.
        break;
    case StreamStatus::Ok:
    case StreamStatus::Ended: res.status = SaveStreamStatus::NoSaveData; break;
    case StreamStatus::Cancelled:
        res.status = SaveStreamStatus::Cancelled;
        break;
    case StreamStatus::LimitExceeded:
        res.status = SaveStreamStatus::LimitExceeded;
        break;
    case StreamStatus::ReadError:
        res.status = SaveStreamStatus::ReadError;
        break;
    }

    if (res.status != SaveStreamStatus::Ok) {
        *out = nullptr;
    }
    return res;
}

}  // namespace bpkit

#include "bpkit/event_stream.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace bpkit {
namespace {

    struct Recorded final {
        std::string event;
        std::string data;
    };


    static FrameHandler record_into(std::vector<Recorded>* out,
                                    FrameAction action = FrameAction::Continue)
    {
        return [out, action](const EventFrame& frame) {
            Recorded r;
            r.event.assign(frame.event);
            r.data.assign(frame.data);
            out->push_back(std::move(r));
            return action;
        };
    }


    static std::vector<std::byte> bytes_of(std::string_view s)
    {
        std::vector<std::byte> out;
        out.reserve(s.size());
        for (char c : s) {
            out.push_back(std::byte { static_cast<uint8_t>(c) });
        }
        return out;
    }


    TEST(EventStream, DispatchesDataLinesByEventName)
    {
        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("progress", record_into(&got));
        reader.on("message", record_into(&got));

        const StreamStatus st = reader.feed(
            "data: first\n"
            "event: progress\n"
            "data: {\"progress\":10}\n"
            "\n"
            "data: {\"progress\":20}\n"
            ": comment line\n"
            "event:\n"
            "data:bare\n");
        EXPECT_EQ(st, StreamStatus::Ok);
        ASSERT_EQ(got.size(), 4U);
        EXPECT_EQ(got[0].event, "message");
        EXPECT_EQ(got[0].data, "first");
        EXPECT_EQ(got[1].event, "progress");
        EXPECT_EQ(got[1].data, "{\"progress\":10}");
        // The event name persists across frames.
        EXPECT_EQ(got[2].event, "progress");
        EXPECT_EQ(got[2].data, "{\"progress\":20}");
        EXPECT_EQ(got[3].event, "message");
        EXPECT_EQ(got[3].data, "bare");
        EXPECT_EQ(reader.frames_dispatched(), 4U);
    }


    TEST(EventStream, HandlesArbitrarySplitsAndCrLf)
    {
        const std::string text = "event: save-data\r\n"
                                 "data:  two spaces\r\n"
                                 "\r\n";
        for (size_t piece = 1; piece <= text.size(); ++piece) {
            std::vector<Recorded> got;
            EventStreamReader reader;
            reader.on("save-data", record_into(&got));

            for (size_t off = 0; off < text.size(); off += piece) {
                const std::string_view part
                    = std::string_view(text).substr(off, piece);
                ASSERT_EQ(reader.feed(part), StreamStatus::Ok);
            }
            ASSERT_EQ(got.size(), 1U) << "piece " << piece;
            EXPECT_EQ(got[0].event, "save-data");
            EXPECT_EQ(got[0].data, " two spaces");
            EXPECT_EQ(reader.buffered_bytes(), 0U);
        }
    }


    TEST(EventStream, PartialLineWaitsForNewline)
    {
        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("message", record_into(&got));

        EXPECT_EQ(reader.feed("data: par"), StreamStatus::Ok);
        EXPECT_TRUE(got.empty());
        EXPECT_EQ(reader.buffered_bytes(), 9U);
        EXPECT_EQ(reader.feed("tial\n"), StreamStatus::Ok);
        ASSERT_EQ(got.size(), 1U);
        EXPECT_EQ(got[0].data, "partial");
    }


    TEST(EventStream, LongLineArrivesInManyPieces)
    {
        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("message", record_into(&got));

        // 8 MiB in 16 KiB pieces; each feed scans only the new bytes.
        const std::string piece(16U * 1024U, 'x');
        EXPECT_EQ(reader.feed("data: "), StreamStatus::Ok);
        for (int i = 0; i < 512; ++i) {
            ASSERT_EQ(reader.feed(piece), StreamStatus::Ok);
        }
        EXPECT_TRUE(got.empty());
        EXPECT_EQ(reader.buffered_bytes(), 6U + 512U * piece.size());

        // The newline lands mid-piece, followed by the start of a new line.
        EXPECT_EQ(reader.feed("xx\ndata: ne"), StreamStatus::Ok);
        ASSERT_EQ(got.size(), 1U);
        EXPECT_EQ(got[0].data.size(), 512U * piece.size() + 2U);
        EXPECT_EQ(got[0].data.find_first_not_of('x'), std::string::npos);
        EXPECT_EQ(reader.buffered_bytes(), 8U);

        EXPECT_EQ(reader.feed("xt\n"), StreamStatus::Ok);
        ASSERT_EQ(got.size(), 2U);
        EXPECT_EQ(got[1].data, "next");
        EXPECT_EQ(reader.buffered_bytes(), 0U);
    }


    TEST(EventStream, TracksReaderState)
    {
        EventStreamReader reader;
        EXPECT_EQ(reader.state(), ReaderState::AwaitingEvent);
        EXPECT_EQ(reader.current_event(), kDefaultEventName);

        ReaderState seen = ReaderState::AwaitingEvent;
        reader.on("parser", [&reader, &seen](const EventFrame&) {
            seen = reader.state();
            return FrameAction::Continue;
        });

        EXPECT_EQ(reader.feed("event: parser\n"), StreamStatus::Ok);
        EXPECT_EQ(reader.state(), ReaderState::AwaitingData);
        EXPECT_EQ(reader.current_event(), "parser");

        EXPECT_EQ(reader.feed("data: {}\n"), StreamStatus::Ok);
        EXPECT_EQ(seen, ReaderState::Dispatched);
        EXPECT_EQ(reader.state(), ReaderState::AwaitingEvent);
        EXPECT_EQ(reader.current_event(), "parser");
    }


    TEST(EventStream, UnregisteredEventsAreIgnored)
    {
        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("save-data", record_into(&got));

        EXPECT_EQ(reader.feed("event: heartbeat\ndata: ping\n"),
                  StreamStatus::Ok);
        EXPECT_TRUE(got.empty());
        EXPECT_EQ(reader.frames_dispatched(), 1U);

        reader.clear_handlers();
        EXPECT_EQ(reader.feed("event: save-data\ndata: x\n"),
                  StreamStatus::Ok);
        EXPECT_TRUE(got.empty());
    }


    TEST(EventStream, StopIsSticky)
    {
        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("save-data", record_into(&got, FrameAction::Stop));
        reader.on("message", record_into(&got));

        EXPECT_EQ(reader.feed("event: save-data\ndata: a\ndata: b\n"),
                  StreamStatus::Stopped);
        ASSERT_EQ(got.size(), 1U);
        EXPECT_EQ(got[0].data, "a");
        EXPECT_EQ(reader.buffered_bytes(), 0U);

        EXPECT_EQ(reader.feed("event: message\ndata: c\n"),
                  StreamStatus::Stopped);
        EXPECT_EQ(got.size(), 1U);
    }


    TEST(EventStream, FailFromHandler)
    {
        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("message", record_into(&got, FrameAction::Fail));
        EXPECT_EQ(reader.feed("data: boom\ndata: again\n"),
                  StreamStatus::Failed);
        EXPECT_EQ(got.size(), 1U);
    }


    TEST(EventStream, EnforcesLineLimit)
    {
        EventStreamOptions options;
        options.limits.max_line_bytes = 16;
        EventStreamReader reader(options);

        EXPECT_EQ(reader.feed("data: short\n"), StreamStatus::Ok);
        EXPECT_EQ(reader.feed("data: 0123456789"), StreamStatus::Ok);
        EXPECT_EQ(reader.feed("abcdef"), StreamStatus::LimitExceeded);
        EXPECT_EQ(reader.buffered_bytes(), 0U);
        EXPECT_EQ(reader.feed("\n"), StreamStatus::LimitExceeded);
    }


    TEST(EventStream, RunStopsReadingAfterTerminalFrame)
    {
        const std::string text = "event: save-data\n"
                                 "data: done\n"
                                 "event: message\n"
                                 "data: never read\n";
        const std::vector<std::byte> bytes = bytes_of(text);
        MemoryByteSource source(bytes, 4U);

        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("save-data", record_into(&got, FrameAction::Stop));
        reader.on("message", record_into(&got));

        const StreamResult res = reader.run(source);
        EXPECT_EQ(res.status, StreamStatus::Stopped);
        ASSERT_EQ(got.size(), 1U);
        EXPECT_EQ(got[0].data, "done");

        const size_t nl        = text.find('\n', text.find("data: done"));
        const uint32_t expected = static_cast<uint32_t>(nl / 4U + 1U);
        EXPECT_EQ(res.reads, expected);
        EXPECT_EQ(source.read_calls(), expected);
        EXPECT_EQ(res.bytes_consumed, source.consumed());
        EXPECT_LT(source.consumed(), bytes.size());
        EXPECT_TRUE(source.closed());
    }


    TEST(EventStream, RunReportsEndOfSource)
    {
        const std::vector<std::byte> bytes = bytes_of("data: a\ndata: b");
        MemoryByteSource source(bytes);

        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("message", record_into(&got));

        const StreamResult res = reader.run(source);
        EXPECT_EQ(res.status, StreamStatus::Ended);
        EXPECT_EQ(res.frames, 1U);
        EXPECT_EQ(res.bytes_consumed, bytes.size());
        EXPECT_EQ(got.size(), 1U);
        EXPECT_TRUE(source.closed());
    }


    TEST(EventStream, CancelBeforeRunIssuesNoRead)
    {
        const std::vector<std::byte> bytes = bytes_of("data: a\n");
        MemoryByteSource source(bytes);

        EventStreamReader reader;
        reader.cancel();
        EXPECT_TRUE(reader.cancelled());

        const StreamResult res = reader.run(source);
        EXPECT_EQ(res.status, StreamStatus::Cancelled);
        EXPECT_EQ(source.read_calls(), 0U);
        EXPECT_TRUE(source.closed());
    }


    TEST(EventStream, CancelFromHandlerEndsRun)
    {
        const std::vector<std::byte> bytes = bytes_of(
            "data: one\ndata: two\ndata: three\n");
        MemoryByteSource source(bytes, 1U);

        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("message", [&reader, &got](const EventFrame& frame) {
            got.push_back(Recorded { std::string(frame.event),
                                     std::string(frame.data) });
            reader.cancel();
            return FrameAction::Continue;
        });

        const StreamResult res = reader.run(source);
        EXPECT_EQ(res.status, StreamStatus::Cancelled);
        EXPECT_EQ(got.size(), 1U);
        EXPECT_LT(source.consumed(), bytes.size());
    }


    TEST(EventStream, CancelUnblocksPendingPipeRead)
    {
        int fds[2] = { -1, -1 };
        ASSERT_EQ(::pipe(fds), 0);

        FdByteSource source(fds[0], /*owns_fd=*/true);
        source.set_poll_interval_ms(10);

        EventStreamReader reader;
        std::thread canceller([&reader]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            reader.cancel();
        });

        const StreamResult res = reader.run(source);
        canceller.join();
        EXPECT_EQ(res.status, StreamStatus::Cancelled);
        EXPECT_FALSE(source.is_open());
        ::close(fds[1]);
    }


    TEST(EventStream, ReadsFramesFromPipe)
    {
        int fds[2] = { -1, -1 };
        ASSERT_EQ(::pipe(fds), 0);

        const std::string text = "event: save-data\ndata: piped\n";
        ASSERT_EQ(::write(fds[1], text.data(), text.size()),
                  static_cast<ssize_t>(text.size()));
        ::close(fds[1]);

        FdByteSource source(fds[0], /*owns_fd=*/true);
        std::vector<Recorded> got;
        EventStreamReader reader;
        reader.on("save-data", record_into(&got, FrameAction::Stop));

        const StreamResult res = reader.run(source);
        EXPECT_EQ(res.status, StreamStatus::Stopped);
        ASSERT_EQ(got.size(), 1U);
        EXPECT_EQ(got[0].data, "piped");
    }

}  // namespace
}  // namespace bpkit

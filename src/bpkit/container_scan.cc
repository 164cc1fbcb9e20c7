#include "bpkit/container_scan.h"

#include <cstring>

namespace bpkit {
namespace {

    struct ChunkSink final {
        PngChunkRef* out = nullptr;
        uint32_t cap     = 0;
        ScanResult result;
    };

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        const uint32_t v
            = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
              | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
              | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
              | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
        *out = v;
        return true;
    }


    static void sink_emit(ChunkSink* sink, const PngChunkRef& chunk) noexcept
    {
        sink->result.needed += 1;
        if (sink->result.written < sink->cap) {
            sink->out[sink->result.written] = chunk;
            sink->result.written += 1;
        } else if (sink->result.status == ScanStatus::Ok) {
            sink->result.status = ScanStatus::OutputTruncated;
        }
    }


    static ScanResult fail(ChunkSink* sink, ScanStatus status,
                           uint64_t offset) noexcept
    {
        sink->result.status       = status;
        sink->result.error_offset = offset;
        return sink->result;
    }

}  // namespace

ScanResult
scan_png_chunks(std::span<const std::byte> bytes, std::span<PngChunkRef> out,
                const ScanOptions& options) noexcept
{
    ChunkSink sink;
    sink.out = out.data();
    sink.cap = static_cast<uint32_t>(out.size());

    if (bytes.size() < kPngSignatureSize
        || std::memcmp(bytes.data(), kPngSignature.data(), kPngSignatureSize)
               != 0) {
        return fail(&sink, ScanStatus::Malformed, 0);
    }

    uint64_t offset   = kPngSignatureSize;
    const uint64_t sz = static_cast<uint64_t>(bytes.size());
    for (;;) {
        if (offset == sz) {
            // Clean chunk boundary, but the stream never ended.
            return fail(&sink, ScanStatus::Truncated, offset);
        }

        const uint64_t chunk_off = offset;
        uint32_t len             = 0;
        uint32_t type            = 0;
        if (!read_u32be(bytes, offset, &len)
            || !read_u32be(bytes, offset + 4, &type)) {
            return fail(&sink, ScanStatus::Truncated, chunk_off);
        }
        if (!chunk_type_is_valid(type)) {
            return fail(&sink, ScanStatus::Malformed, chunk_off);
        }
        if (sink.result.needed == 0 && type != kChunkIhdr) {
            return fail(&sink, ScanStatus::Malformed, chunk_off);
        }
        if (len > kMaxPngChunkLength) {
            return fail(&sink, ScanStatus::Malformed, chunk_off);
        }

        const uint64_t data_off = offset + 8;
        const uint64_t avail    = sz - data_off;
        if (static_cast<uint64_t>(len) > avail || avail - len < 4) {
            return fail(&sink, ScanStatus::Truncated, chunk_off);
        }

        const uint64_t crc_off = data_off + len;
        uint32_t stored_crc    = 0;
        (void)read_u32be(bytes, crc_off, &stored_crc);
        if (options.verify_crc) {
            const std::span<const std::byte> data
                = bytes.subspan(static_cast<size_t>(data_off),
                                static_cast<size_t>(len));
            if (png_chunk_crc(type, data) != stored_crc) {
                return fail(&sink, ScanStatus::CorruptChunk, chunk_off);
            }
        }

        if (options.limits.max_chunks != 0U
            && sink.result.needed >= options.limits.max_chunks) {
            return fail(&sink, ScanStatus::LimitExceeded, chunk_off);
        }

        PngChunkRef chunk;
        chunk.type        = type;
        chunk.offset      = chunk_off;
        chunk.data_offset = data_off;
        chunk.data_size   = len;
        chunk.crc         = stored_crc;
        sink_emit(&sink, chunk);

        offset = crc_off + 4;
        if (type == kChunkIend) {
            sink.result.end_offset = offset;
            break;
        }
    }

    return sink.result;
}


ScanResult
scan_png_container(std::span<const std::byte> bytes, PngContainer* out,
                   const ScanOptions& options)
{
    out->bytes = bytes;
    out->chunks.clear();
    out->end_offset     = 0;
    out->trailer_offset = 0;
    out->trailer_size   = 0;

    // Typical files have a handful of chunks; one retry covers the rest.
    out->chunks.resize(64U);
    ScanResult res = scan_png_chunks(
        bytes, std::span<PngChunkRef>(out->chunks.data(), out->chunks.size()),
        options);
    if (res.status == ScanStatus::OutputTruncated) {
        out->chunks.resize(res.needed);
        res = scan_png_chunks(bytes,
                              std::span<PngChunkRef>(out->chunks.data(),
                                                     out->chunks.size()),
                              options);
    }
    if (res.status != ScanStatus::Ok) {
        out->chunks.clear();
        return res;
    }

    out->chunks.resize(res.written);
    out->end_offset     = res.end_offset;
    out->trailer_offset = res.end_offset;
    out->trailer_size   = static_cast<uint64_t>(bytes.size()) - res.end_offset;
    return res;
}

}  // namespace bpkit

#include "bpkit/png_inspect.h"

#include "bpkit/payload_locate.h"

#include <array>
#include <limits>

#include <zlib.h>

namespace bpkit {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static uint32_t read_u32be(std::span<const std::byte> bytes,
                               size_t offset) noexcept
    {
        return (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
    }


    static bool is_known_critical(uint32_t type) noexcept
    {
        switch (type) {
        case kChunkIhdr:
        case kChunkPlte:
        case kChunkIdat:
        case kChunkIend: return true;
        default: return false;
        }
    }


    struct Adam7Pass final {
        uint32_t x0;
        uint32_t y0;
        uint32_t dx;
        uint32_t dy;
    };

    static constexpr std::array<Adam7Pass, 7> kAdam7 = { {
        { 0, 0, 8, 8 },
        { 4, 0, 8, 8 },
        { 0, 4, 4, 8 },
        { 2, 0, 4, 4 },
        { 0, 2, 2, 4 },
        { 1, 0, 2, 2 },
        { 0, 1, 1, 2 },
    } };


    static uint32_t pass_extent(uint32_t size, uint32_t start,
                                uint32_t step) noexcept
    {
        if (size <= start) {
            return 0;
        }
        return static_cast<uint32_t>(
            (static_cast<uint64_t>(size) - start + step - 1U) / step);
    }


    static bool image_stream_size(uint64_t width, uint64_t height,
                                  uint64_t bits_per_pixel,
                                  uint64_t* out) noexcept
    {
        if (width == 0U || height == 0U) {
            *out = 0;
            return true;
        }
        const uint64_t row_bytes = (width * bits_per_pixel + 7U) / 8U + 1U;
        if (row_bytes > std::numeric_limits<uint64_t>::max() / height) {
            return false;
        }
        *out = row_bytes * height;
        return true;
    }


    static InspectStatus inflate_idat(const PngContainer& container,
                                      uint64_t expected,
                                      uint64_t* produced_out) noexcept
    {
        z_stream strm {};
        strm.zalloc = Z_NULL;
        strm.zfree  = Z_NULL;
        strm.opaque = Z_NULL;
        if (inflateInit(&strm) != Z_OK) {
            return InspectStatus::PixelDataInvalid;
        }

        std::array<std::byte, 32768> discard {};
        uint64_t produced = 0;
        bool finished     = false;

        for (const PngChunkRef& chunk : container.chunks) {
            if (finished) {
                break;
            }
            if (chunk.type != kChunkIdat) {
                continue;
            }
            const std::span<const std::byte> data = container.data(chunk);
            size_t in_off = 0;
            while (in_off < data.size() && !finished) {
                const size_t remaining = data.size() - in_off;
                const size_t slice = (remaining < 0x40000000U) ? remaining
                                                               : 0x40000000U;
                strm.next_in = reinterpret_cast<Bytef*>(
                    const_cast<std::byte*>(data.data() + in_off));
                strm.avail_in = static_cast<uInt>(slice);
                in_off += slice;

                do {
                    strm.next_out = reinterpret_cast<Bytef*>(
                        reinterpret_cast<void*>(discard.data()));
                    strm.avail_out = static_cast<uInt>(discard.size());

                    const int ret = inflate(&strm, Z_NO_FLUSH);
                    produced += discard.size() - strm.avail_out;
                    if (produced > expected) {
                        (void)inflateEnd(&strm);
                        *produced_out = produced;
                        return InspectStatus::PixelDataInvalid;
                    }
                    if (ret == Z_STREAM_END) {
                        finished = true;
                        break;
                    }
                    if (ret != Z_OK && ret != Z_BUF_ERROR) {
                        (void)inflateEnd(&strm);
                        *produced_out = produced;
                        return InspectStatus::PixelDataInvalid;
                    }
                } while (strm.avail_in > 0U || strm.avail_out == 0U);
            }
        }

        (void)inflateEnd(&strm);
        *produced_out = produced;
        if (!finished || produced != expected) {
            return InspectStatus::PixelDataInvalid;
        }
        return InspectStatus::Ok;
    }

}  // namespace

uint32_t
png_channels(uint8_t color_type) noexcept
{
    switch (color_type) {
    case 0: return 1;
    case 2: return 3;
    case 3: return 1;
    case 4: return 2;
    case 6: return 4;
    default: return 0;
    }
}


bool
png_bit_depth_valid(uint8_t color_type, uint8_t bit_depth) noexcept
{
    switch (color_type) {
    case 0:
        return bit_depth == 1 || bit_depth == 2 || bit_depth == 4
               || bit_depth == 8 || bit_depth == 16;
    case 3:
        return bit_depth == 1 || bit_depth == 2 || bit_depth == 4
               || bit_depth == 8;
    case 2:
    case 4:
    case 6: return bit_depth == 8 || bit_depth == 16;
    default: return false;
    }
}


bool
png_raw_stream_size(uint32_t width, uint32_t height, uint8_t color_type,
                    uint8_t bit_depth, bool interlaced, uint64_t* out) noexcept
{
    *out                    = 0;
    const uint64_t bpp_bits = static_cast<uint64_t>(png_channels(color_type))
                              * bit_depth;
    if (!interlaced) {
        return image_stream_size(width, height, bpp_bits, out);
    }

    uint64_t total = 0;
    for (const Adam7Pass& pass : kAdam7) {
        uint64_t size = 0;
        if (!image_stream_size(pass_extent(width, pass.x0, pass.dx),
                               pass_extent(height, pass.y0, pass.dy),
                               bpp_bits, &size)) {
            return false;
        }
        if (size > std::numeric_limits<uint64_t>::max() - total) {
            return false;
        }
        total += size;
    }
    *out = total;
    return true;
}


InspectStatus
inspect_png(const PngContainer& container, PngInspection* out,
            const InspectOptions& options) noexcept
{
    *out = PngInspection {};
    if (container.chunks.empty()) {
        return InspectStatus::Malformed;
    }

    const PngChunkRef& ihdr = container.chunks.front();
    const std::span<const std::byte> hdr = container.data(ihdr);
    if (ihdr.type != kChunkIhdr || hdr.size() != 13U) {
        return InspectStatus::Malformed;
    }
    out->width       = read_u32be(hdr, 0);
    out->height      = read_u32be(hdr, 4);
    out->bit_depth   = u8(hdr[8]);
    out->color_type  = u8(hdr[9]);
    out->compression = u8(hdr[10]);
    out->filter      = u8(hdr[11]);
    out->interlace   = u8(hdr[12]);

    if (png_channels(out->color_type) == 0U
        || !png_bit_depth_valid(out->color_type, out->bit_depth)
        || out->compression != 0U || out->filter != 0U
        || out->interlace > 1U) {
        return InspectStatus::Malformed;
    }

    if (out->width == 0U || out->height == 0U
        || out->width > kUnusualDimension || out->height > kUnusualDimension) {
        out->warnings |= InspectWarnings::UnusualDimensions;
    }

    bool has_palette = false;
    for (const PngChunkRef& chunk : container.chunks) {
        out->chunk_count += 1;
        if (chunk.type == kChunkIdat) {
            out->idat_chunks += 1;
            out->idat_bytes += chunk.data_size;
        } else if (chunk.type == kChunkPlte) {
            has_palette = true;
        } else if (chunk.type == kChunkBlueprint) {
            out->payload_chunks += 1;
        } else if (chunk.type == kChunkBranding) {
            out->warnings |= InspectWarnings::BrandingPresent;
        }
        if (chunk_is_critical(chunk.type) && !is_known_critical(chunk.type)) {
            out->warnings |= InspectWarnings::UnknownCriticalChunk;
        }
    }
    if (out->idat_chunks == 0U) {
        out->warnings |= InspectWarnings::MissingPixelData;
    }
    if (out->color_type == 3U && !has_palette) {
        out->warnings |= InspectWarnings::MissingPalette;
    }
    if (out->payload_chunks != 0U
        && has_blueprint_trailer_signature(container.trailer())) {
        out->warnings |= InspectWarnings::MultiplePayloadLayouts;
    }

    if (!png_raw_stream_size(out->width, out->height, out->color_type,
                             out->bit_depth, out->interlace == 1U,
                             &out->expected_raw_bytes)) {
        return InspectStatus::LimitExceeded;
    }

    if (!options.verify_pixels || out->idat_chunks == 0U) {
        return InspectStatus::Ok;
    }
    if (options.max_inflate_bytes != 0U
        && out->expected_raw_bytes > options.max_inflate_bytes) {
        return InspectStatus::LimitExceeded;
    }

    const InspectStatus st = inflate_idat(container, out->expected_raw_bytes,
                                          &out->inflated_bytes);
    out->pixels_verified = (st == InspectStatus::Ok);
    return st;
}

}  // namespace bpkit

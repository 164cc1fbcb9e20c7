#include "bpkit/png_chunk.h"

#include <zlib.h>

namespace bpkit {
namespace {

    static void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }


    static std::array<Bytef, 4> type_bytes(uint32_t type) noexcept
    {
        return {
            static_cast<Bytef>((type >> 24) & 0xFF),
            static_cast<Bytef>((type >> 16) & 0xFF),
            static_cast<Bytef>((type >> 8) & 0xFF),
            static_cast<Bytef>((type >> 0) & 0xFF),
        };
    }

}  // namespace

bool
chunk_type_is_valid(uint32_t type) noexcept
{
    for (uint32_t i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>((type >> (24 - i * 8)) & 0xFF);
        const bool upper = c >= 'A' && c <= 'Z';
        const bool lower = c >= 'a' && c <= 'z';
        if (!upper && !lower) {
            return false;
        }
    }
    return true;
}


uint32_t
png_chunk_crc(uint32_t type, std::span<const std::byte> data) noexcept
{
    const std::array<Bytef, 4> tag = type_bytes(type);
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc       = ::crc32(crc, tag.data(), static_cast<uInt>(tag.size()));

    // crc32() takes uInt lengths; feed large chunks in slices.
    const Bytef* p   = reinterpret_cast<const Bytef*>(data.data());
    size_t remaining = data.size();
    while (remaining > 0) {
        const size_t n = (remaining < 0x40000000U) ? remaining : 0x40000000U;
        crc            = ::crc32(crc, p, static_cast<uInt>(n));
        p += n;
        remaining -= n;
    }
    return static_cast<uint32_t>(crc & 0xFFFFFFFFUL);
}


std::span<const std::byte>
chunk_data(std::span<const std::byte> file_bytes,
           const PngChunkRef& chunk) noexcept
{
    const uint64_t size = static_cast<uint64_t>(file_bytes.size());
    if (chunk.data_offset > size || chunk.data_size > size - chunk.data_offset) {
        return {};
    }
    return file_bytes.subspan(static_cast<size_t>(chunk.data_offset),
                              static_cast<size_t>(chunk.data_size));
}


void
append_png_signature(std::vector<std::byte>* out)
{
    out->insert(out->end(), kPngSignature.begin(), kPngSignature.end());
}


void
append_png_chunk(std::vector<std::byte>* out, uint32_t type,
                 std::span<const std::byte> data)
{
    out->reserve(out->size() + data.size() + kPngChunkOverhead);
    append_u32be(out, static_cast<uint32_t>(data.size()));
    append_u32be(out, type);
    out->insert(out->end(), data.begin(), data.end());
    append_u32be(out, png_chunk_crc(type, data));
}


void
append_payload_chunks(std::vector<std::byte>* out,
                      std::span<const std::byte> payload,
                      uint32_t max_chunk_bytes)
{
    if (max_chunk_bytes == 0U || max_chunk_bytes > kMaxPngChunkLength) {
        max_chunk_bytes = kMaxPngChunkLength;
    }
    if (payload.empty()) {
        append_png_chunk(out, kChunkBlueprint, payload);
        return;
    }

    size_t offset = 0;
    while (offset < payload.size()) {
        const size_t remaining = payload.size() - offset;
        const size_t n         = (remaining < max_chunk_bytes)
                                     ? remaining
                                     : static_cast<size_t>(max_chunk_bytes);
        append_png_chunk(out, kChunkBlueprint, payload.subspan(offset, n));
        offset += n;
    }
}

}  // namespace bpkit

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file png_chunk.h
 * \brief PNG chunk primitives: FourCC tags, CRC and chunk serialization.
 */

namespace bpkit {

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

inline constexpr uint32_t kPngSignatureSize = 8;
inline constexpr std::array<std::byte, kPngSignatureSize> kPngSignature = {
    std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
    std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
    std::byte { 0x1A }, std::byte { 0x0A },
};

/// Length + type + CRC bytes surrounding every chunk's data.
inline constexpr uint32_t kPngChunkOverhead = 12;

inline constexpr uint32_t kChunkIhdr = fourcc('I', 'H', 'D', 'R');
inline constexpr uint32_t kChunkPlte = fourcc('P', 'L', 'T', 'E');
inline constexpr uint32_t kChunkIdat = fourcc('I', 'D', 'A', 'T');
inline constexpr uint32_t kChunkIend = fourcc('I', 'E', 'N', 'D');
inline constexpr uint32_t kChunkTrns = fourcc('t', 'R', 'N', 'S');

/**
 * Blueprint payload chunk. Ancillary, private, unsafe-to-copy: image editors
 * that do not know the tag drop it instead of carrying stale data forward.
 *
 * \note Part of the file format contract. Never change.
 */
inline constexpr uint32_t kChunkBlueprint = fourcc('a', 'f', 'B', 'P');

/// Branding badge chunk (a small PNG stored as chunk data).
inline constexpr uint32_t kChunkBranding = fourcc('a', 'f', 'B', 'R');

/// Largest payload chunk emitted by writers; larger payloads are split.
inline constexpr uint32_t kMaxPayloadChunkBytes = 1U << 20;

/// PNG caps chunk lengths at 2^31-1.
inline constexpr uint32_t kMaxPngChunkLength = 0x7FFFFFFFU;

/**
 * \brief Reference to one chunk inside a PNG byte buffer.
 *
 * Offsets are relative to the start of the full file buffer.
 */
struct PngChunkRef final {
    uint32_t type        = 0;
    uint64_t offset      = 0;  // start of the length field
    uint64_t data_offset = 0;
    uint32_t data_size   = 0;
    uint32_t crc         = 0;
};

/// Total on-disk size of \p chunk (data plus \ref kPngChunkOverhead).
constexpr uint64_t
chunk_total_size(const PngChunkRef& chunk) noexcept
{
    return static_cast<uint64_t>(chunk.data_size) + kPngChunkOverhead;
}

/// True when bit 5 of the first type byte is clear (critical chunk).
constexpr bool
chunk_is_critical(uint32_t type) noexcept
{
    return ((type >> 24) & 0x20U) == 0U;
}

/// True when every type byte is an ASCII letter.
bool
chunk_type_is_valid(uint32_t type) noexcept;

/// CRC-32 over `type ++ data`, as stored after each chunk.
uint32_t
png_chunk_crc(uint32_t type, std::span<const std::byte> data) noexcept;

/// Returns the data bytes of \p chunk, or an empty span if out of range.
std::span<const std::byte>
chunk_data(std::span<const std::byte> file_bytes,
           const PngChunkRef& chunk) noexcept;

/// Appends the 8-byte PNG signature.
void
append_png_signature(std::vector<std::byte>* out);

/// Appends one chunk (length, type, data, recomputed CRC).
void
append_png_chunk(std::vector<std::byte>* out, uint32_t type,
                 std::span<const std::byte> data);

/**
 * \brief Appends \p payload as consecutive \ref kChunkBlueprint chunks of at
 * most \p max_chunk_bytes each.
 *
 * An empty payload still emits one zero-length chunk so the file stays
 * recognizable as a blueprint.
 */
void
append_payload_chunks(std::vector<std::byte>* out,
                      std::span<const std::byte> payload,
                      uint32_t max_chunk_bytes = kMaxPayloadChunkBytes);

}  // namespace bpkit

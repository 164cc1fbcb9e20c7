#pragma once

#include "bpkit/png_chunk.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file container_scan.h
 * \brief Validating PNG chunk scanner.
 */

namespace bpkit {

/// Scanner result status.
enum class ScanStatus : uint8_t {
    Ok,
    /// Output buffer was too small; \ref ScanResult::needed reports required size.
    OutputTruncated,
    /// Bad signature, invalid chunk type, or a first chunk other than `IHDR`.
    Malformed,
    /// A chunk CRC does not match; \ref ScanResult::error_offset is the chunk start.
    CorruptChunk,
    /// A length field runs past the buffer, or the buffer ends before `IEND`.
    Truncated,
    /// Resource limits were exceeded (e.g. too many chunks).
    LimitExceeded,
};

/// Resource limits applied while scanning to bound hostile inputs.
struct ScanLimits final {
    uint32_t max_chunks = 1U << 16;
};

/// Options for \ref scan_png_chunks.
struct ScanOptions final {
    /// If false, CRC fields are recorded but not checked (diagnostics only).
    bool verify_crc = true;
    ScanLimits limits;
};

struct ScanResult final {
    ScanStatus status = ScanStatus::Ok;
    uint32_t written  = 0;
    uint32_t needed   = 0;
    /// File offset of the offending chunk for CorruptChunk/Truncated/Malformed.
    uint64_t error_offset = 0;
    /// File offset one past the `IEND` chunk (0 if not reached).
    uint64_t end_offset = 0;
};

/**
 * \brief A scanned PNG container.
 *
 * Owns its chunk records; the file bytes themselves are borrowed and must
 * outlive the container.
 */
struct PngContainer final {
    std::span<const std::byte> bytes;
    std::vector<PngChunkRef> chunks;
    uint64_t end_offset     = 0;
    uint64_t trailer_offset = 0;
    uint64_t trailer_size   = 0;

    std::span<const std::byte> data(const PngChunkRef& chunk) const noexcept
    {
        return chunk_data(bytes, chunk);
    }

    std::span<const std::byte> trailer() const noexcept
    {
        return bytes.subspan(static_cast<size_t>(trailer_offset),
                             static_cast<size_t>(trailer_size));
    }
};

/**
 * \brief Scans a PNG byte stream and records every chunk up to `IEND`.
 *
 * Each length field is checked against the remaining buffer before the chunk
 * is touched, so no allocation or read depends on an unchecked length.
 * Records are written into \p out; when \p out is too small the scan still
 * validates the whole stream and reports \ref ScanStatus::OutputTruncated
 * with \ref ScanResult::needed set.
 */
ScanResult
scan_png_chunks(std::span<const std::byte> bytes, std::span<PngChunkRef> out,
                const ScanOptions& options = ScanOptions {}) noexcept;

/**
 * \brief Convenience wrapper around \ref scan_png_chunks that sizes the chunk
 * list itself.
 *
 * On success \p out references \p bytes and holds all chunk records. On
 * failure \p out is left with no chunks.
 */
ScanResult
scan_png_container(std::span<const std::byte> bytes, PngContainer* out,
                   const ScanOptions& options = ScanOptions {});

}  // namespace bpkit

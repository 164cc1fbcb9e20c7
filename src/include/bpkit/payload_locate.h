#pragma once

#include "bpkit/container_scan.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file payload_locate.h
 * \brief Classifies PNG chunks and locates the embedded blueprint payload.
 */

namespace bpkit {

/// Role of a chunk when a blueprint container is split in two.
enum class ChunkRole : uint8_t {
    /// Kept in both derived containers (`IHDR`, `IEND`, text, branding...).
    Structural,
    /// Carries blueprint payload bytes (\ref kChunkBlueprint).
    Payload,
    /// Carries pixel data or palette/transparency for it.
    Image,
};

/// Where the payload bytes live.
enum class PayloadLayout : uint8_t {
    None,
    /// One or more \ref kChunkBlueprint chunks, concatenated in file order.
    Chunks,
    /// Raw bytes after `IEND`, starting with \ref kBlueprintTrailerSignature.
    Trailer,
};

/// Locator status.
enum class LocateStatus : uint8_t {
    Ok,
    /// Valid PNG without a payload. Expected for plain images; not an error.
    NotBlueprint,
    /// The container record is inconsistent with its bytes.
    Malformed,
    /// The payload exceeds \ref LocateOptions::max_payload_bytes.
    LimitExceeded,
};

/// Header the game writes in front of blueprint data appended after `IEND`.
inline constexpr std::array<std::byte, 17> kBlueprintTrailerSignature = {
    std::byte { 0x0E }, std::byte { 0x00 }, std::byte { 0x00 },
    std::byte { 0x00 }, std::byte { 'U' },  std::byte { 'p' },
    std::byte { 'l' },  std::byte { 'o' },  std::byte { 'a' },
    std::byte { 'd' },  std::byte { 'e' },  std::byte { 'd' },
    std::byte { 'I' },  std::byte { 'm' },  std::byte { 'a' },
    std::byte { 'g' },  std::byte { 'e' },
};

struct LocateOptions final {
    /// Accept the trailer layout when no payload chunk exists.
    bool accept_trailer = true;
    /// Caps the aggregate payload size (0 = unlimited).
    uint64_t max_payload_bytes = 64ULL * 1024ULL * 1024ULL;
};

/**
 * \brief Chunk indices (into \ref PngContainer::chunks) grouped by role,
 * each list in file order.
 */
struct PayloadLocation final {
    PayloadLayout layout = PayloadLayout::None;
    std::vector<uint32_t> payload;
    std::vector<uint32_t> image;
    std::vector<uint32_t> structural;
    uint64_t payload_size = 0;
    /// Largest single payload chunk (chunk layout only).
    uint32_t largest_payload_chunk = 0;
    bool has_pixel_data            = false;
};

/// Maps a chunk type to its role. Unknown types are structural.
ChunkRole
classify_chunk(uint32_t type) noexcept;

/// True when \p bytes starts with \ref kBlueprintTrailerSignature.
bool
has_blueprint_trailer_signature(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Groups the chunks of \p container by role and finds the payload.
 *
 * \p out is always filled with the role lists, even when the result is
 * \ref LocateStatus::NotBlueprint, so callers can still build an image-only
 * view of a plain PNG.
 */
LocateStatus
locate_payload(const PngContainer& container, PayloadLocation* out,
               const LocateOptions& options = LocateOptions {});

/**
 * \brief Concatenates the payload described by \p location into \p out.
 *
 * Returns false if a referenced chunk is out of range.
 */
bool
gather_payload(const PngContainer& container,
               const PayloadLocation& location, std::vector<std::byte>* out);

}  // namespace bpkit

#pragma once

#include "bpkit/container_scan.h"

#include <cstdint>

/**
 * \file png_inspect.h
 * \brief Header validation and pixel stream verification for scanned PNGs.
 */

namespace bpkit {

/// Non-fatal findings reported by \ref inspect_png.
enum class InspectWarnings : uint32_t {
    None = 0,
    /// Width or height is 0 or above \ref kUnusualDimension.
    UnusualDimensions = 1U << 0U,
    /// A critical chunk type this library does not know.
    UnknownCriticalChunk = 1U << 1U,
    /// No `IDAT` chunk (expected for data-only containers).
    MissingPixelData = 1U << 2U,
    /// Both payload chunks and a blueprint trailer are present.
    MultiplePayloadLayouts = 1U << 3U,
    /// A branding chunk is present.
    BrandingPresent = 1U << 4U,
    /// Palette color type without a `PLTE` chunk.
    MissingPalette = 1U << 5U,
};

constexpr InspectWarnings
operator|(InspectWarnings a, InspectWarnings b) noexcept
{
    return static_cast<InspectWarnings>(static_cast<uint32_t>(a)
                                        | static_cast<uint32_t>(b));
}

constexpr InspectWarnings
operator&(InspectWarnings a, InspectWarnings b) noexcept
{
    return static_cast<InspectWarnings>(static_cast<uint32_t>(a)
                                        & static_cast<uint32_t>(b));
}

constexpr InspectWarnings&
operator|=(InspectWarnings& a, InspectWarnings b) noexcept
{
    a = a | b;
    return a;
}

/// Returns true if any bits in \p test are present in \p flags.
constexpr bool
any(InspectWarnings flags, InspectWarnings test) noexcept
{
    return static_cast<uint32_t>(flags & test) != 0;
}

/// Dimensions above this are flagged as unusual.
inline constexpr uint32_t kUnusualDimension = 1000000U;

enum class InspectStatus : uint8_t {
    Ok,
    /// Bad `IHDR` (size, color type, bit depth or method fields).
    Malformed,
    /// The `IDAT` stream fails to inflate or has the wrong size.
    PixelDataInvalid,
    /// The decompressed image would exceed \ref InspectOptions::max_inflate_bytes.
    LimitExceeded,
};

struct InspectOptions final {
    /// Inflate the `IDAT` stream and check its size against `IHDR`.
    bool verify_pixels = false;
    /// Caps the decompressed pixel stream (0 = unlimited).
    uint64_t max_inflate_bytes = 512ULL * 1024ULL * 1024ULL;
};

/// Decoded `IHDR` fields plus structure statistics.
struct PngInspection final {
    uint32_t width      = 0;
    uint32_t height     = 0;
    uint8_t bit_depth   = 0;
    uint8_t color_type  = 0;
    uint8_t compression = 0;
    uint8_t filter      = 0;
    uint8_t interlace   = 0;

    InspectWarnings warnings = InspectWarnings::None;

    uint32_t chunk_count    = 0;
    uint32_t idat_chunks    = 0;
    uint64_t idat_bytes     = 0;
    uint32_t payload_chunks = 0;

    /// Filtered scanline bytes implied by `IHDR` (Adam7 aware).
    uint64_t expected_raw_bytes = 0;
    /// Bytes produced by inflating `IDAT` (only with verify_pixels).
    uint64_t inflated_bytes = 0;
    bool pixels_verified    = false;
};

/// True when \p bit_depth is allowed for \p color_type.
bool
png_bit_depth_valid(uint8_t color_type, uint8_t bit_depth) noexcept;

/// Samples per pixel for \p color_type (0 for invalid types).
uint32_t
png_channels(uint8_t color_type) noexcept;

/**
 * \brief Size of the filtered (pre-compression) image stream.
 *
 * Each scanline carries a filter byte. For Adam7 the seven reduced images
 * are summed. Returns false on arithmetic overflow.
 */
bool
png_raw_stream_size(uint32_t width, uint32_t height, uint8_t color_type,
                    uint8_t bit_depth, bool interlaced,
                    uint64_t* out) noexcept;

/**
 * \brief Validates `IHDR` and collects warnings for \p container.
 *
 * With \ref InspectOptions::verify_pixels the concatenated `IDAT` data is
 * inflated with zlib and must produce exactly the size implied by `IHDR`.
 */
InspectStatus
inspect_png(const PngContainer& container, PngInspection* out,
            const InspectOptions& options = InspectOptions {}) noexcept;

}  // namespace bpkit

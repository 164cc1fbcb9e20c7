#pragma once

#include "bpkit/container_scan.h"
#include "bpkit/payload_locate.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file blueprint_extract.h
 * \brief Splits a blueprint PNG into a data-only file and a preview image,
 * and recombines the two.
 */

namespace bpkit {

/// Extraction result status.
enum class ExtractStatus : uint8_t {
    Ok,
    /// The input is a valid PNG that carries no blueprint payload.
    NotBlueprint,
    /// Bad signature or chunk structure.
    Malformed,
    /// A chunk CRC does not match (see \ref ExtractionResult::error_offset).
    CorruptChunk,
    /// A chunk runs past the end of the input or `IEND` is missing.
    Truncated,
    /// Resource limits were exceeded.
    LimitExceeded,
};

/// Options for \ref extract_blueprint and \ref combine_blueprint.
struct ExtractOptions final {
    ScanOptions scan;
    LocateOptions locate;
    /// If false, the image-only container is not built.
    bool build_image = true;
};

/**
 * \brief The two artifacts of one extraction plus size statistics.
 *
 * `stripped` is the data-only container: signature, structural chunks and
 * the payload. It is intentionally not renderable. `image` is the
 * image-only container (structural + pixel chunks); it is empty and
 * `has_image` is false when the source has no `IDAT`.
 */
struct ExtractionResult final {
    ExtractStatus status = ExtractStatus::Ok;
    PayloadLayout layout = PayloadLayout::None;

    std::vector<std::byte> stripped;
    std::vector<std::byte> image;
    bool has_image = false;

    uint64_t original_size = 0;
    uint64_t stripped_size = 0;
    uint64_t payload_size  = 0;
    /// `(1 - stripped_size / original_size) * 100`, clamped to [0, 100].
    double compression_ratio = 0.0;

    uint64_t error_offset = 0;
};

/// Maps a scanner status to the extraction taxonomy.
ExtractStatus
extract_status_from_scan(ScanStatus status) noexcept;

/// Computes the clamped size-savings percentage.
double
compression_ratio_percent(uint64_t original_size,
                          uint64_t stripped_size) noexcept;

/**
 * \brief Scans \p file_bytes and builds both derived containers.
 *
 * Output is a pure function of the input bytes, so results can be hashed
 * for duplicate detection.
 */
ExtractionResult
extract_blueprint(std::span<const std::byte> file_bytes,
                  const ExtractOptions& options = ExtractOptions {});

/// Same as above for an already scanned container.
ExtractionResult
extract_blueprint(const PngContainer& container,
                  const ExtractOptions& options = ExtractOptions {});

/// Status for \ref combine_blueprint.
enum class CombineStatus : uint8_t {
    Ok,
    /// The image file is not a valid PNG.
    ImageMalformed,
    /// The data file is not a valid PNG.
    DataMalformed,
    /// The data file carries no payload.
    NotBlueprint,
    /// The image file already carries a payload.
    ImageHasPayload,
    LimitExceeded,
};

/**
 * \brief Recombines an image-only PNG and a data-only PNG into one
 * blueprint file.
 *
 * Chunk-layout payloads are inserted as \ref kChunkBlueprint chunks right
 * before `IEND` of the image; trailer-layout payloads are appended after
 * `IEND`. Extracting the result yields the same payload bytes.
 */
CombineStatus
combine_blueprint(std::span<const std::byte> image_png,
                  std::span<const std::byte> data_png,
                  std::vector<std::byte>* out,
                  const ExtractOptions& options = ExtractOptions {});

/// Status for the branding helpers.
enum class BrandingStatus : uint8_t {
    Ok,
    /// The target file is not a valid PNG.
    Malformed,
    /// The badge is not a valid PNG.
    BadgeMalformed,
    /// No branding chunk was found.
    NotFound,
};

/**
 * \brief Inserts \p badge_png as a \ref kChunkBranding chunk before `IEND`.
 *
 * An existing branding chunk is replaced. All other chunks and any trailer
 * are carried over unchanged.
 */
BrandingStatus
embed_branding(std::span<const std::byte> png,
               std::span<const std::byte> badge_png,
               std::vector<std::byte>* out,
               const ScanOptions& options = ScanOptions {});

/// Returns the first branding chunk's data via \p out.
BrandingStatus
find_branding(const PngContainer& container,
              std::span<const std::byte>* out) noexcept;

}  // namespace bpkit

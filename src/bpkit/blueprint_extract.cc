#include "bpkit/blueprint_extract.h"

namespace bpkit {
namespace {

    static void append_chunk_copy(std::vector<std::byte>* out,
                                  const PngContainer& container,
                                  const PngChunkRef& chunk)
    {
        append_png_chunk(out, chunk.type, container.data(chunk));
    }


    static void append_raw_chunk(std::vector<std::byte>* out,
                                 const PngContainer& container,
                                 const PngChunkRef& chunk)
    {
        const std::span<const std::byte> raw = container.bytes.subspan(
            static_cast<size_t>(chunk.offset),
            static_cast<size_t>(chunk_total_size(chunk)));
        out->insert(out->end(), raw.begin(), raw.end());
    }


    static ExtractStatus extract_status_from_locate(LocateStatus status) noexcept
    {
        switch (status) {
        case LocateStatus::Ok: return ExtractStatus::Ok;
        case LocateStatus::NotBlueprint: return ExtractStatus::NotBlueprint;
        case LocateStatus::Malformed: return ExtractStatus::Malformed;
        case LocateStatus::LimitExceeded: return ExtractStatus::LimitExceeded;
        }
        return ExtractStatus::Malformed;
    }


    static void build_stripped(const PngContainer& container,
                               const PayloadLocation& location,
                               std::span<const std::byte> payload,
                               std::vector<std::byte>* out)
    {
        // Never split finer than the source did; the data-only file must not
        // grow past the original.
        const uint32_t split = (location.largest_payload_chunk
                                > kMaxPayloadChunkBytes)
                                   ? location.largest_payload_chunk
                                   : kMaxPayloadChunkBytes;

        out->clear();
        out->reserve(static_cast<size_t>(location.payload_size) + 1024U);
        append_png_signature(out);

        bool payload_written = false;
        for (const PngChunkRef& chunk : container.chunks) {
            switch (classify_chunk(chunk.type)) {
            case ChunkRole::Structural:
                append_chunk_copy(out, container, chunk);
                break;
            case ChunkRole::Payload:
                if (!payload_written) {
                    append_payload_chunks(out, payload, split);
                    payload_written = true;
                }
                break;
            case ChunkRole::Image: break;
            }
        }

        if (location.layout == PayloadLayout::Trailer) {
            out->insert(out->end(), payload.begin(), payload.end());
        }
    }


    static void build_image(const PngContainer& container,
                            std::vector<std::byte>* out)
    {
        out->clear();
        append_png_signature(out);
        for (const PngChunkRef& chunk : container.chunks) {
            if (classify_chunk(chunk.type) != ChunkRole::Payload) {
                append_chunk_copy(out, container, chunk);
            }
        }
    }

}  // namespace

ExtractStatus
extract_status_from_scan(ScanStatus status) noexcept
{
    switch (status) {
    case ScanStatus::Ok: return ExtractStatus::Ok;
    case ScanStatus::OutputTruncated: return ExtractStatus::LimitExceeded;
    case ScanStatus::Malformed: return ExtractStatus::Malformed;
    case ScanStatus::CorruptChunk: return ExtractStatus::CorruptChunk;
    case ScanStatus::Truncated: return ExtractStatus::Truncated;
    case ScanStatus::LimitExceeded: return ExtractStatus::LimitExceeded;
    }
    return ExtractStatus::Malformed;
}


double
compression_ratio_percent(uint64_t original_size,
                          uint64_t stripped_size) noexcept
{
    if (original_size == 0U || stripped_size >= original_size) {
        return 0.0;
    }
    const double ratio = (1.0
                          - static_cast<double>(stripped_size)
                                / static_cast<double>(original_size))
                         * 100.0;
    if (ratio < 0.0) {
        return 0.0;
    }
    return (ratio > 100.0) ? 100.0 : ratio;
}


ExtractionResult
extract_blueprint(std::span<const std::byte> file_bytes,
                  const ExtractOptions& options)
{
    PngContainer container;
    const ScanResult scan = scan_png_container(file_bytes, &container,
                                               options.scan);
    if (scan.status != ScanStatus::Ok) {
        ExtractionResult res;
        res.status        = extract_status_from_scan(scan.status);
        res.error_offset  = scan.error_offset;
        res.original_size = static_cast<uint64_t>(file_bytes.size());
        return res;
    }
    return extract_blueprint(container, options);
}


ExtractionResult
extract_blueprint(const PngContainer& container, const ExtractOptions& options)
{
    ExtractionResult res;
    res.original_size = static_cast<uint64_t>(container.bytes.size());

    PayloadLocation location;
    const LocateStatus located = locate_payload(container, &location,
                                                options.locate);
    if (located != LocateStatus::Ok) {
        res.status = extract_status_from_locate(located);
        return res;
    }

    std::vector<std::byte> payload;
    if (!gather_payload(container, location, &payload)) {
        res.status = ExtractStatus::Malformed;
        return res;
    }

    res.layout       = location.layout;
    res.payload_size = static_cast<uint64_t>(payload.size());

    build_stripped(container, location, payload, &res.stripped);
    res.stripped_size     = static_cast<uint64_t>(res.stripped.size());
    res.compression_ratio = compression_ratio_percent(res.original_size,
                                                      res.stripped_size);

    if (options.build_image && location.has_pixel_data) {
        build_image(container, &res.image);
        res.has_image = true;
    }
    return res;
}


CombineStatus
combine_blueprint(std::span<const std::byte> image_png,
                  std::span<const std::byte> data_png,
                  std::vector<std::byte>* out, const ExtractOptions& options)
{
    out->clear();

    PngContainer image;
    if (scan_png_container(image_png, &image, options.scan).status
        != ScanStatus::Ok) {
        return CombineStatus::ImageMalformed;
    }
    PngContainer data;
    if (scan_png_container(data_png, &data, options.scan).status
        != ScanStatus::Ok) {
        return CombineStatus::DataMalformed;
    }

    PayloadLocation data_location;
    switch (locate_payload(data, &data_location, options.locate)) {
    case LocateStatus::Ok: break;
    case LocateStatus::NotBlueprint: return CombineStatus::NotBlueprint;
    case LocateStatus::Malformed: return CombineStatus::DataMalformed;
    case LocateStatus::LimitExceeded: return CombineStatus::LimitExceeded;
    }

    PayloadLocation image_location;
    switch (locate_payload(image, &image_location, options.locate)) {
    case LocateStatus::NotBlueprint: break;
    case LocateStatus::Ok: return CombineStatus::ImageHasPayload;
    case LocateStatus::Malformed: return CombineStatus::ImageMalformed;
    case LocateStatus::LimitExceeded: return CombineStatus::ImageHasPayload;
    }

    std::vector<std::byte> payload;
    if (!gather_payload(data, data_location, &payload)) {
        return CombineStatus::DataMalformed;
    }

    out->reserve(image_png.size() + payload.size() + 64U);
    append_png_signature(out);
    for (const PngChunkRef& chunk : image.chunks) {
        if (chunk.type == kChunkIend) {
            if (data_location.layout == PayloadLayout::Chunks) {
                append_payload_chunks(out, payload);
            }
        }
        append_chunk_copy(out, image, chunk);
    }
    if (data_location.layout == PayloadLayout::Trailer) {
        out->insert(out->end(), payload.begin(), payload.end());
    }
    return CombineStatus::Ok;
}


BrandingStatus
embed_branding(std::span<const std::byte> png,
               std::span<const std::byte> badge_png,
               std::vector<std::byte>* out, const ScanOptions& options)
{
    out->clear();

    PngContainer badge;
    if (scan_png_container(badge_png, &badge, options).status
        != ScanStatus::Ok) {
        return BrandingStatus::BadgeMalformed;
    }
    PngContainer container;
    if (scan_png_container(png, &container, options).status != ScanStatus::Ok) {
        return BrandingStatus::Malformed;
    }

    out->reserve(png.size() + badge_png.size() + kPngChunkOverhead);
    append_png_signature(out);
    for (const PngChunkRef& chunk : container.chunks) {
        if (chunk.type == kChunkBranding) {
            continue;
        }
        if (chunk.type == kChunkIend) {
            append_png_chunk(out, kChunkBranding, badge_png);
        }
        append_raw_chunk(out, container, chunk);
    }
    const std::span<const std::byte> trailer = container.trailer();
    out->insert(out->end(), trailer.begin(), trailer.end());
    return BrandingStatus::Ok;
}


BrandingStatus
find_branding(const PngContainer& container,
              std::span<const std::byte>* out) noexcept
{
    *out = {};
    for (const PngChunkRef& chunk : container.chunks) {
        if (chunk.type == kChunkBranding) {
            *out = container.data(chunk);
            return BrandingStatus::Ok;
        }
    }
    return BrandingStatus::NotFound;
}

}  // namespace bpkit

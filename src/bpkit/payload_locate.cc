#include "bpkit/payload_locate.h"

#include <cstring>

namespace bpkit {
namespace {

    static bool validate_range(std::span<const std::byte> bytes,
                               uint64_t offset, uint64_t size) noexcept
    {
        const uint64_t bytes_size = static_cast<uint64_t>(bytes.size());
        if (offset > bytes_size) {
            return false;
        }
        const uint64_t cap = bytes_size - offset;
        return size <= cap;
    }

}  // namespace

ChunkRole
classify_chunk(uint32_t type) noexcept
{
    switch (type) {
    case kChunkBlueprint: return ChunkRole::Payload;
    case kChunkIdat:
    case kChunkPlte:
    case kChunkTrns: return ChunkRole::Image;
    default: return ChunkRole::Structural;
    }
}


bool
has_blueprint_trailer_signature(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() < kBlueprintTrailerSignature.size()) {
        return false;
    }
    return std::memcmp(bytes.data(), kBlueprintTrailerSignature.data(),
                       kBlueprintTrailerSignature.size())
           == 0;
}


LocateStatus
locate_payload(const PngContainer& container, PayloadLocation* out,
               const LocateOptions& options)
{
    *out = PayloadLocation {};

    uint64_t payload_size = 0;
    for (size_t i = 0; i < container.chunks.size(); ++i) {
        const PngChunkRef& chunk = container.chunks[i];
        if (!validate_range(container.bytes, chunk.data_offset,
                            chunk.data_size)) {
            return LocateStatus::Malformed;
        }
        const uint32_t index = static_cast<uint32_t>(i);
        switch (classify_chunk(chunk.type)) {
        case ChunkRole::Payload:
            out->payload.push_back(index);
            payload_size += chunk.data_size;
            if (chunk.data_size > out->largest_payload_chunk) {
                out->largest_payload_chunk = chunk.data_size;
            }
            break;
        case ChunkRole::Image:
            out->image.push_back(index);
            if (chunk.type == kChunkIdat) {
                out->has_pixel_data = true;
            }
            break;
        case ChunkRole::Structural: out->structural.push_back(index); break;
        }
    }

    if (!out->payload.empty()) {
        out->layout = PayloadLayout::Chunks;
    } else if (options.accept_trailer
               && has_blueprint_trailer_signature(container.trailer())) {
        out->layout  = PayloadLayout::Trailer;
        payload_size = container.trailer_size;
    } else {
        return LocateStatus::NotBlueprint;
    }

    out->payload_size = payload_size;
    if (options.max_payload_bytes != 0U
        && payload_size > options.max_payload_bytes) {
        return LocateStatus::LimitExceeded;
    }
    return LocateStatus::Ok;
}


bool
gather_payload(const PngContainer& container,
               const PayloadLocation& location, std::vector<std::byte>* out)
{
    out->clear();
    switch (location.layout) {
    case PayloadLayout::None: return true;
    case PayloadLayout::Trailer: {
        const std::span<const std::byte> trailer = container.trailer();
        out->assign(trailer.begin(), trailer.end());
        return true;
    }
    case PayloadLayout::Chunks: break;
    }

    out->reserve(static_cast<size_t>(location.payload_size));
    for (uint32_t index : location.payload) {
        if (index >= container.chunks.size()) {
            return false;
        }
        const PngChunkRef& chunk = container.chunks[index];
        if (!validate_range(container.bytes, chunk.data_offset,
                            chunk.data_size)) {
            return false;
        }
        const std::span<const std::byte> data = container.data(chunk);
        out->insert(out->end(), data.begin(), data.end());
    }
    return true;
}

}  // namespace bpkit

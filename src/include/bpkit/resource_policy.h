#pragma once

#include "bpkit/blueprint_extract.h"
#include "bpkit/png_inspect.h"
#include "bpkit/save_stream.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for untrusted blueprint files and save streams.
 */

namespace bpkit {

/**
 * \brief Storage-agnostic resource limits for untrusted input.
 *
 * One value of this type configures every codec; callers copy the parts
 * they need into per-operation options with \ref apply_resource_policy.
 */
struct BpkitResourcePolicy final {
    /// Upload cap applied before scanning (0 = unlimited).
    uint64_t max_file_bytes = 20ULL * 1024ULL * 1024ULL;

    /// Chunk scanner budgets.
    ScanLimits scan_limits;

    /// Aggregate payload cap (0 = unlimited).
    uint64_t max_payload_bytes = 64ULL * 1024ULL * 1024ULL;

    /// Pixel stream inflate cap for inspection.
    uint64_t max_inflate_bytes = 512ULL * 1024ULL * 1024ULL;

    /// Compact table budgets.
    CompactLimits compact_limits;

    /// Nesting cap for the whole save-data document.
    uint32_t max_document_depth = 128;

    /// Event stream line budget.
    EventStreamLimits stream_limits;
};

inline void
apply_resource_policy(const BpkitResourcePolicy& policy,
                      ExtractOptions* extract) noexcept
{
    if (extract) {
        extract->scan.limits              = policy.scan_limits;
        extract->locate.max_payload_bytes = policy.max_payload_bytes;
    }
}

inline void
apply_resource_policy(const BpkitResourcePolicy& policy, ScanOptions* scan,
                      InspectOptions* inspect) noexcept
{
    if (scan) {
        scan->limits = policy.scan_limits;
    }
    if (inspect) {
        inspect->max_inflate_bytes = policy.max_inflate_bytes;
    }
}

inline void
apply_resource_policy(const BpkitResourcePolicy& policy,
                      SaveStreamOptions* stream) noexcept
{
    if (stream) {
        stream->stream.limits                = policy.stream_limits;
        stream->save_data.compact.limits     = policy.compact_limits;
        stream->save_data.max_document_depth = policy.max_document_depth;
    }
}

}  // namespace bpkit

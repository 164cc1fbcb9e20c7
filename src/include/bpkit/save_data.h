#pragma once

#include "bpkit/compact_table.h"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file save_data.h
 * \brief Expands the compact-encoded fields of a save-data document.
 */

namespace bpkit {

enum class SaveDataStatus : uint8_t {
    Ok,
    /// The text is not valid JSON.
    ParseError,
    /// The document is not an object, or a compact field has a bad shape.
    Malformed,
    /// A field's rows do not match its dictionary.
    SchemaMismatch,
    LimitExceeded,
};

struct SaveDataOptions final {
    CompactOptions compact;
    /// Deepest array/object nesting accepted anywhere in the document.
    uint32_t max_document_depth = 128;
};

struct SaveDataResult final {
    SaveDataStatus status = SaveDataStatus::Ok;
    /// Name of the field that failed to expand.
    std::string error_field;
    uint64_t error_row = 0;
    /// Number of fields that were compact-encoded and expanded.
    uint32_t fields_expanded = 0;
};

/// Maps a compact decode status to the save-data taxonomy.
SaveDataStatus
save_data_status_from_compact(CompactStatus status) noexcept;

/**
 * \brief Expands every compact-encoded member of \p document in place.
 *
 * Members that do not have the compact shape are left untouched. Fields are
 * independent; the first failing field fails the whole document. A
 * document nested deeper than `max_document_depth` is rejected before any
 * field is touched.
 */
SaveDataResult
expand_save_data(Json* document,
                 const SaveDataOptions& options = SaveDataOptions {});

/**
 * \brief Parses \p text as a JSON object and expands it.
 *
 * On failure \p out is set to null.
 */
SaveDataResult
decode_save_data(std::string_view text, Json* out,
                 const SaveDataOptions& options = SaveDataOptions {});

}  // namespace bpkit

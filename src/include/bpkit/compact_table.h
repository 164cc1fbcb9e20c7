#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

/**
 * \file compact_table.h
 * \brief Decoder for dictionary-compressed tables (`{"_": names, "v": rows}`).
 */

namespace bpkit {

/// Order-preserving JSON document type used for decoded records.
using Json = nlohmann::ordered_json;

/// Compact decode status.
enum class CompactStatus : uint8_t {
    Ok,
    /// The table or a row has the wrong JSON shape.
    Malformed,
    /// A flat row's value count differs from the dictionary size.
    SchemaMismatch,
    /// Nesting depth or record count limits were exceeded.
    LimitExceeded,
};

/// Shape of one row, decided by its first element.
enum class RowShape : uint8_t {
    /// Positional values zipped against the dictionary.
    Flat,
    /// A sequence of rows, decoded recursively.
    Nested,
    /// Not a JSON array.
    Invalid,
};

struct CompactLimits final {
    uint32_t max_depth   = 64;
    uint64_t max_records = 4ULL * 1024ULL * 1024ULL;
};

struct CompactOptions final {
    CompactLimits limits;
};

/**
 * \brief Dictionary plus positional rows.
 *
 * `rows` is a JSON array; each element is a flat row (array of values
 * aligned to `dictionary`) or a nested row (array of rows).
 */
struct CompactTable final {
    std::vector<std::string> dictionary;
    Json rows = Json::array();
};

struct CompactResult final {
    CompactStatus status = CompactStatus::Ok;
    /// Index of the top-level row that failed.
    uint64_t error_row = 0;
    /// Records produced (flat rows decoded, at any depth).
    uint64_t records = 0;
};

/**
 * \brief True when no array or object in \p value nests deeper than
 * \p max_depth levels (\p value itself is level 1).
 *
 * Walks with an explicit stack, so it is safe on hostile documents that
 * would overflow the recursive copy and dump routines of \ref Json.
 */
bool
json_depth_within(const Json& value, uint64_t max_depth);

/// Classifies \p row; an empty array is flat.
RowShape
classify_row(const Json& row) noexcept;

/// True for an object whose `_` and `v` members are both arrays.
bool
is_compact_table(const Json& value) noexcept;

/**
 * \brief Reads the wire form into \p out.
 *
 * Dictionary entries must be unique strings. Rows nested deeper than
 * \p limits allow are rejected before they are copied.
 */
CompactStatus
parse_compact_table(const Json& value, CompactTable* out,
                    const CompactLimits& limits = CompactLimits {});

/**
 * \brief Expands every row of \p table into keyed records.
 *
 * \p out becomes an array with one element per top-level row: an object for
 * a flat row, an array (recursively) for a nested row. \p table is not
 * modified, so decoding twice yields equal documents. On failure \p out is
 * left as an empty array.
 */
CompactResult
decode_compact_table(const CompactTable& table, Json* out,
                     const CompactOptions& options = CompactOptions {});

}  // namespace bpkit

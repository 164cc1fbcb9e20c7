#include "bpkit/compact_table.h"

#include <unordered_set>
#include <utility>
#include <vector>

namespace bpkit {
namespace {

    struct DecodeContext final {
        const std::vector<std::string>* dictionary = nullptr;
        const CompactLimits* limits                = nullptr;
        uint64_t records                           = 0;
    };


    static CompactStatus decode_row(DecodeContext* ctx, const Json& row,
                                    uint32_t depth, Json* out)
    {
        if (depth > ctx->limits->max_depth) {
            return CompactStatus::LimitExceeded;
        }

        switch (classify_row(row)) {
        case RowShape::Invalid: return CompactStatus::Malformed;
        case RowShape::Nested: {
            *out = Json::array();
            for (const Json& inner : row) {
                if (!inner.is_array()) {
                    return CompactStatus::Malformed;
                }
                Json decoded;
                const CompactStatus st = decode_row(ctx, inner, depth + 1U,
                                                    &decoded);
                if (st != CompactStatus::Ok) {
                    return st;
                }
                out->push_back(std::move(decoded));
            }
            return CompactStatus::Ok;
        }
        case RowShape::Flat: break;
        }

        const std::vector<std::string>& dict = *ctx->dictionary;
        if (row.size() != dict.size()) {
            return CompactStatus::SchemaMismatch;
        }
        if (ctx->limits->max_records != 0U
            && ctx->records >= ctx->limits->max_records) {
            return CompactStatus::LimitExceeded;
        }
        ctx->records += 1;

        *out = Json::object();
        for (size_t i = 0; i < dict.size(); ++i) {
            (*out)[dict[i]] = row[i];
        }
        return CompactStatus::Ok;
    }

}  // namespace

bool
json_depth_within(const Json& value, uint64_t max_depth)
{
    std::vector<std::pair<const Json*, uint64_t>> stack;
    stack.emplace_back(&value, 1U);
    while (!stack.empty()) {
        const std::pair<const Json*, uint64_t> top = stack.back();
        stack.pop_back();
        if (!top.first->is_structured()) {
            continue;
        }
        if (top.second > max_depth) {
            return false;
        }
        for (const Json& child : *top.first) {
            if (child.is_structured()) {
                stack.emplace_back(&child, top.second + 1U);
            }
        }
    }
    return true;
}


RowShape
classify_row(const Json& row) noexcept
{
    if (!row.is_array()) {
        return RowShape::Invalid;
    }
    if (!row.empty() && row.front().is_array()) {
        return RowShape::Nested;
    }
    return RowShape::Flat;
}


bool
is_compact_table(const Json& value) noexcept
{
    if (!value.is_object()) {
        return false;
    }
    const auto dict = value.find("_");
    const auto rows = value.find("v");
    return dict != value.end() && rows != value.end() && dict->is_array()
           && rows->is_array();
}


CompactStatus
parse_compact_table(const Json& value, CompactTable* out,
                    const CompactLimits& limits)
{
    out->dictionary.clear();
    out->rows = Json::array();
    if (!is_compact_table(value)) {
        return CompactStatus::Malformed;
    }
    // `v` is level 1, its rows start at level 2.
    const Json& rows         = value.at("v");
    const uint64_t max_depth = static_cast<uint64_t>(limits.max_depth) + 1U;
    if (!json_depth_within(rows, max_depth)) {
        return CompactStatus::LimitExceeded;
    }

    const Json& dict = value.at("_");
    std::unordered_set<std::string> seen;
    out->dictionary.reserve(dict.size());
    for (const Json& name : dict) {
        if (!name.is_string()) {
            out->dictionary.clear();
            return CompactStatus::Malformed;
        }
        std::string key = name.get<std::string>();
        if (!seen.insert(key).second) {
            out->dictionary.clear();
            return CompactStatus::Malformed;
        }
        out->dictionary.push_back(std::move(key));
    }
    out->rows = rows;
    return CompactStatus::Ok;
}


CompactResult
decode_compact_table(const CompactTable& table, Json* out,
                     const CompactOptions& options)
{
    CompactResult res;
    *out = Json::array();
    if (!table.rows.is_array()) {
        res.status = CompactStatus::Malformed;
        return res;
    }

    DecodeContext ctx;
    ctx.dictionary = &table.dictionary;
    ctx.limits     = &options.limits;

    Json decoded   = Json::array();
    uint64_t index = 0;
    for (const Json& row : table.rows) {
        Json record;
        CompactStatus st = CompactStatus::LimitExceeded;
        if (json_depth_within(row, options.limits.max_depth)) {
            st = decode_row(&ctx, row, 1U, &record);
        }
        if (st != CompactStatus::Ok) {
            res.status    = st;
            res.error_row = index;
            res.records   = ctx.records;
            return res;
        }
        decoded.push_back(std::move(record));
        index += 1;
    }

    *out        = std::move(decoded);
    res.records = ctx.records;
    return res;
}

}  // namespace bpkit

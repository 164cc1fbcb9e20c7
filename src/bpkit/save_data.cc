#include "bpkit/save_data.h"

namespace bpkit {

SaveDataStatus
save_data_status_from_compact(CompactStatus status) noexcept
{
    switch (status) {
    case CompactStatus::Ok: return SaveDataStatus::Ok;
    case CompactStatus::Malformed: return SaveDataStatus::Malformed;
    case CompactStatus::SchemaMismatch: return SaveDataStatus::SchemaMismatch;
    case CompactStatus::LimitExceeded: return SaveDataStatus::LimitExceeded;
    }
    return SaveDataStatus::Malformed;
}


SaveDataResult
expand_save_data(Json* document, const SaveDataOptions& options)
{
    SaveDataResult res;
    if (!document->is_object()) {
        res.status = SaveDataStatus::Malformed;
        return res;
    }
    if (!json_depth_within(*document, options.max_document_depth)) {
        res.status = SaveDataStatus::LimitExceeded;
        return res;
    }

    for (auto it = document->begin(); it != document->end(); ++it) {
        if (!is_compact_table(it.value())) {
            continue;
        }
        CompactTable table;
        CompactStatus st = parse_compact_table(it.value(), &table,
                                               options.compact.limits);
        if (st == CompactStatus::Ok) {
            Json expanded;
            const CompactResult decoded
                = decode_compact_table(table, &expanded, options.compact);
            st            = decoded.status;
            res.error_row = decoded.error_row;
            if (st == CompactStatus::Ok) {
                it.value() = std::move(expanded);
                res.fields_expanded += 1;
                continue;
            }
        }
        res.status      = save_data_status_from_compact(st);
        res.error_field = it.key();
        return res;
    }
    return res;
}


SaveDataResult
decode_save_data(std::string_view text, Json* out,
                 const SaveDataOptions& options)
{
    *out = Json::parse(text.begin(), text.end(), nullptr,
                       /*allow_exceptions=*/false);
    if (out->is_discarded()) {
        *out = nullptr;
        SaveDataResult res;
        res.status = SaveDataStatus::ParseError;
        return res;
    }

    SaveDataResult res = expand_save_data(out, options);
    if (res.status != SaveDataStatus::Ok) {
        *out = nullptr;
    }
    return res;
}

}  // namespace bpkit

#include "bpkit/build_info.h"

#include "bpkit/build_info_generated.h"

#include <zlib.h>
// zlib.h defines zlib_version as a macro; it clashes with BuildInfo::zlib_version.
#undef zlib_version

#include <initializer_list>

namespace bpkit {
namespace {

    constexpr BuildInfo kBuildInfo = {
        BPKIT_BUILDINFO_VERSION,
        BPKIT_BUILDINFO_BUILD_TIMESTAMP_UTC,
        BPKIT_BUILDINFO_BUILD_TYPE,
        BPKIT_BUILDINFO_LINKAGE,
        BPKIT_BUILDINFO_CMAKE_GENERATOR,
        BPKIT_BUILDINFO_SYSTEM_NAME,
        BPKIT_BUILDINFO_SYSTEM_PROCESSOR,
        BPKIT_BUILDINFO_CXX_COMPILER_ID,
        BPKIT_BUILDINFO_CXX_COMPILER_VERSION,
        ZLIB_VERSION,
        BPKIT_BUILDINFO_JSON_VERSION,
    };


    static void assign_joined(std::string* out,
                              std::initializer_list<std::string_view> parts)
    {
        size_t total = 0;
        for (std::string_view p : parts) {
            total += p.size();
        }
        out->clear();
        out->reserve(total);
        for (std::string_view p : parts) {
            out->append(p);
        }
    }


    static std::string_view or_unknown(std::string_view s) noexcept
    {
        return s.empty() ? std::string_view("unknown") : s;
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        assign_joined(line1, { "bpkit v", info.version, " ", info.build_type,
                               " [zlib ", or_unknown(info.zlib_version),
                               ", json ", or_unknown(info.json_version), "] ",
                               or_unknown(info.linkage) });
    }
    if (line2) {
        const std::string_view stamp_open
            = info.build_timestamp_utc.empty() ? "" : " (";
        const std::string_view stamp_close
            = info.build_timestamp_utc.empty() ? "" : ")";
        assign_joined(line2, { "built with ", info.cxx_compiler_id, "-",
                               info.cxx_compiler_version, " for ",
                               info.system_name, "/", info.system_processor,
                               stamp_open, info.build_timestamp_utc,
                               stamp_close });
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(kBuildInfo, line1, line2);
}

}  // namespace bpkit

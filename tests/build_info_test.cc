#include "bpkit/build_info.h"

#include <gtest/gtest.h>

#include <string>

namespace bpkit {
namespace {

    TEST(BuildInfo, RecordsVersionsFromConfigure)
    {
        const BuildInfo& bi = build_info();
        EXPECT_FALSE(bi.version.empty());
        EXPECT_FALSE(bi.zlib_version.empty());
        EXPECT_FALSE(bi.json_version.empty());
        EXPECT_EQ(bi.json_version.substr(0, 2), "3.");
        EXPECT_EQ(bi.linkage, "static");
    }


    TEST(BuildInfo, FormatsBannerLines)
    {
        BuildInfo bi;
        bi.version              = "1.2.3";
        bi.build_type           = "Release";
        bi.linkage              = "shared";
        bi.zlib_version         = "1.3";
        bi.json_version         = "3.11.2";
        bi.cxx_compiler_id      = "GNU";
        bi.cxx_compiler_version = "13.2.0";
        bi.system_name          = "Linux";
        bi.system_processor     = "x86_64";
        bi.build_timestamp_utc  = "2026-01-02T03:04:05Z";

        std::string line1 = "stale";
        std::string line2;
        format_build_info_lines(bi, &line1, &line2);
        EXPECT_EQ(line1, "bpkit v1.2.3 Release [zlib 1.3, json 3.11.2] shared");
        EXPECT_EQ(line2, "built with GNU-13.2.0 for Linux/x86_64 "
                         "(2026-01-02T03:04:05Z)");

        bi.build_timestamp_utc = {};
        bi.json_version        = {};
        bi.linkage             = {};
        format_build_info_lines(bi, &line1, nullptr);
        format_build_info_lines(bi, nullptr, &line2);
        EXPECT_EQ(line1, "bpkit v1.2.3 Release [zlib 1.3, json unknown] unknown");
        EXPECT_EQ(line2, "built with GNU-13.2.0 for Linux/x86_64");

        std::string own;
        format_build_info_lines(&own, nullptr);
        EXPECT_EQ(own.rfind("bpkit v", 0), 0U);
    }

}  // namespace
}  // namespace bpkit

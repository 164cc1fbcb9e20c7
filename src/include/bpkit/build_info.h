#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version and toolchain details recorded when bpkit was configured.
 */

namespace bpkit {

/**
 * \brief Build metadata baked into the library.
 *
 * Every field points at static storage. Fields CMake could not determine
 * are empty.
 */
struct BuildInfo final {
    std::string_view version;
    /// ISO-8601 UTC time of the CMake configure step.
    std::string_view build_timestamp_utc;
    /// `CMAKE_BUILD_TYPE`, or "multi-config" / "unspecified".
    std::string_view build_type;
    /// "static" or "shared".
    std::string_view linkage;

    std::string_view cmake_generator;
    std::string_view system_name;
    std::string_view system_processor;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    /// Dependency versions the library was compiled against.
    std::string_view zlib_version;
    std::string_view json_version;
};

/// Build metadata of the linked library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Renders \p info as the two-line banner printed by `--version`.
 *
 * `bpkit v<version> <build_type> [zlib <v>, json <v>] <linkage>` and
 * `built with <compiler>-<version> for <system>/<arch> (<timestamp>)`.
 * Either output may be null.
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Banner for \ref build_info().
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace bpkit

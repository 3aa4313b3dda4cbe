#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief How this copy of exifnote was built.
 */

namespace exifnote {

/// Values are compiled in at build time.
struct BuildInfo final {
    /// e.g. "0.1.0".
    std::string_view version;
    /// UTC ISO-8601 configure time, or empty.
    std::string_view build_timestamp_utc;
    /// e.g. "Release", "Debug", "multi-config".
    std::string_view build_type;
    std::string_view cmake_generator;
    std::string_view system_name;
    std::string_view system_processor;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;
    /// Whether the Python module was part of the build.
    bool with_python = false;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats two human-readable lines:
 * - `exifnote vX.Y.Z <build_type>`
 * - `built with <compiler>-<version> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

}  // namespace exifnote

#include "exifnote/build_info.h"

#include "exifnote/build_info_generated.h"

namespace exifnote {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/EXIFNOTE_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/EXIFNOTE_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/EXIFNOTE_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/EXIFNOTE_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/EXIFNOTE_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/EXIFNOTE_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/EXIFNOTE_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/EXIFNOTE_BUILDINFO_CXX_COMPILER_VERSION,
        /*with_python=*/static_cast<bool>(EXIFNOTE_BUILDINFO_HAS_PYTHON),
    };

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        line1->assign("exifnote v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type.empty() ? std::string_view("unknown")
                                            : bi.build_type);
        if (bi.with_python) {
            line1->append(" [python]");
        }
    }
    if (line2) {
        line2->assign("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->append("-");
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->append("/");
        line2->append(bi.system_processor);
        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}

}  // namespace exifnote

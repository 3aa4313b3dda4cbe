#include "exifnote/diagnostics.h"

#include <gtest/gtest.h>

#include <string>

namespace exifnote {

TEST(Diagnostics, StderrSinkWritesEscapedLine)
{
    StderrDiagnosticSink sink;
    Diagnostic diag;
    diag.level   = DiagnosticLevel::Warning;
    diag.subject = "dir/a\nb.jpg";
    diag.message = "cannot read EXIF metadata (malformed)";

    ::testing::internal::CaptureStderr();
    sink.on_diagnostic(diag);
    const std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(err, "exifnote: warning: dir/a\\nb.jpg: cannot read EXIF "
                   "metadata (malformed)\n");
}


TEST(Diagnostics, StderrSinkFiltersByLevel)
{
    StderrDiagnosticSink sink("tool", DiagnosticLevel::Error);
    Diagnostic diag;
    diag.level   = DiagnosticLevel::Warning;
    diag.message = "ignored";

    ::testing::internal::CaptureStderr();
    sink.on_diagnostic(diag);
    diag.level = DiagnosticLevel::Error;
    sink.on_diagnostic(diag);
    const std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(err, "tool: error: ignored\n");
}


TEST(Diagnostics, StderrSinkOwnsItsPrefix)
{
    std::string prefix = "batch-tool";
    StderrDiagnosticSink sink(prefix);
    prefix.assign(prefix.size(), 'x');
    prefix.clear();
    prefix.shrink_to_fit();

    Diagnostic diag;
    diag.level   = DiagnosticLevel::Warning;
    diag.message = "m";

    ::testing::internal::CaptureStderr();
    sink.on_diagnostic(diag);
    EXPECT_EQ(::testing::internal::GetCapturedStderr(),
              "batch-tool: warning: m\n");
}


TEST(Diagnostics, NullSinkIsSilent)
{
    NullDiagnosticSink sink;
    ::testing::internal::CaptureStderr();
    sink.on_diagnostic(Diagnostic {});
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");
}

}  // namespace exifnote

#include "exifnote/diagnostics.h"

#include "exifnote/console_format.h"

#include <cstdio>
#include <string>

namespace exifnote {
namespace {

    static constexpr uint32_t kMaxSubjectBytes = 512U;
    static constexpr uint32_t kMaxMessageBytes = 1024U;

}  // namespace

StderrDiagnosticSink::StderrDiagnosticSink(std::string_view prefix,
                                           DiagnosticLevel min_level)
    : prefix_(prefix)
    , min_level_(min_level)
{
}


void
StderrDiagnosticSink::on_diagnostic(const Diagnostic& diag) noexcept
{
    if (static_cast<uint8_t>(diag.level) < static_cast<uint8_t>(min_level_)) {
        return;
    }

    std::string line;
    line.append(prefix_);
    line.append(": ");
    line.append(diagnostic_level_name(diag.level));
    line.append(": ");
    if (!diag.subject.empty()) {
        (void)append_console_escaped_ascii(diag.subject, kMaxSubjectBytes,
                                           &line);
        line.append(": ");
    }
    (void)append_console_escaped_ascii(diag.message, kMaxMessageBytes, &line);
    std::fprintf(stderr, "%s\n", line.c_str());
}


const char*
diagnostic_level_name(DiagnosticLevel level) noexcept
{
    switch (level) {
    case DiagnosticLevel::Info: return "info";
    case DiagnosticLevel::Warning: return "warning";
    case DiagnosticLevel::Error: return "error";
    }
    return "unknown";
}

}  // namespace exifnote

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file diagnostics.h
 * \brief Reporting channel for non-fatal problems found while reading files.
 */

namespace exifnote {

enum class DiagnosticLevel : uint8_t {
    Info,
    Warning,
    Error,
};

/// One message. Views are valid only for the duration of the callback.
struct Diagnostic final {
    DiagnosticLevel level = DiagnosticLevel::Warning;
    /// What the message is about (usually a file path; may be empty).
    std::string_view subject;
    std::string_view message;
};

class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;
    virtual void on_diagnostic(const Diagnostic& diag) noexcept = 0;
};

/**
 * \brief Writes one line per diagnostic to stderr.
 *
 * Format: `<prefix>: <level>: <subject>: <message>`; subject and message are
 * escaped with \ref append_console_escaped_ascii.
 */
class StderrDiagnosticSink final : public DiagnosticSink {
public:
    /// \p prefix is copied.
    explicit StderrDiagnosticSink(std::string_view prefix = "exifnote",
                                  DiagnosticLevel min_level
                                  = DiagnosticLevel::Warning);

    void on_diagnostic(const Diagnostic& diag) noexcept override;

private:
    std::string prefix_;
    DiagnosticLevel min_level_;
};

class NullDiagnosticSink final : public DiagnosticSink {
public:
    void on_diagnostic(const Diagnostic&) noexcept override {}
};

const char*
diagnostic_level_name(DiagnosticLevel level) noexcept;

}  // namespace exifnote

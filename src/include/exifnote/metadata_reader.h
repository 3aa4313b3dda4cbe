#pragma once

#include "exifnote/byte_source.h"
#include "exifnote/diagnostics.h"
#include "exifnote/exif_codec.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file metadata_reader.h
 * \brief Reads the capture date and recorded original filename from a JPEG.
 */

namespace exifnote {

/// Extracted fields. Empty strings mean "not available".
struct ExifSummary final {
    /// `YYYY-MM-DD` (from DateTimeOriginal).
    std::string date_taken;
    /// Value of the `OriginalFilename:` line in UserComment.
    std::string original_file_name;
};

enum class ExtractStatus : uint8_t {
    Ok,
    ReadFailed,
    Unsupported,
    Malformed,
    LimitExceeded,
};

struct ExtractResult final {
    ExtractStatus status = ExtractStatus::Ok;
    ExifSummary summary;
};

struct ExtractOptions final {
    /// Only this many leading bytes are handed to the codec.
    uint64_t header_window_bytes = 64U * 1024U;
};

/**
 * \brief Extracts the summary and reports how the read went.
 *
 * On any non-Ok status the summary is empty. Missing tags are not errors.
 */
ExtractResult
extract_exif_summary_checked(std::span<const std::byte> file_bytes,
                             ExifCodec& codec,
                             const ExtractOptions& options = {}) noexcept;

/**
 * \brief Best-effort form of \ref extract_exif_summary_checked.
 *
 * Failures are reported as one warning on \p sink and yield an empty summary.
 */
ExifSummary
extract_exif_summary(std::span<const std::byte> file_bytes, ExifCodec& codec,
                     DiagnosticSink& sink,
                     const ExtractOptions& options = {}) noexcept;

/// Reads the header window of \p path through \p source, then extracts.
ExtractResult
extract_exif_summary_from_file(const char* path, ByteSource& source,
                               ExifCodec& codec, DiagnosticSink& sink,
                               const ExtractOptions& options = {}) noexcept;

/// `"2021:07:04 10:00:00"` -> `"2021-07-04"`.
std::string
normalize_date_taken(std::string_view date_time);

const char*
extract_status_name(ExtractStatus status) noexcept;

}  // namespace exifnote

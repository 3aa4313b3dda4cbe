#pragma once

#include "exifnote/exif_tiff_decode.h"
#include "exifnote/metadata_reader.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for reading and stamping untrusted files.
 */

namespace exifnote {

struct ExifNotePolicy final {
    /// Files larger than this are not stamped (0 = unlimited).
    uint64_t max_file_bytes = 0;

    /// Leading bytes examined when reading.
    uint64_t header_window_bytes = 64U * 1024U;

    /// EXIF/TIFF decode budgets.
    ExifDecodeLimits exif_limits;
};

inline void
apply_policy(const ExifNotePolicy& policy, ExifDecodeOptions* exif,
             ExtractOptions* extract) noexcept
{
    if (exif) {
        exif->limits = policy.exif_limits;
    }
    if (extract) {
        extract->header_window_bytes = policy.header_window_bytes;
    }
}

}  // namespace exifnote

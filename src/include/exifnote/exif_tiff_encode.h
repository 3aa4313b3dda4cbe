#pragma once

#include "exifnote/exif_dict.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * \file exif_tiff_encode.h
 * \brief Encoder for \ref ExifDict into a classic TIFF-IFD stream.
 */

namespace exifnote {

/// EXIF/TIFF encode result status.
enum class ExifEncodeStatus : uint8_t {
    Ok,
    /// A value cannot be represented with its wire type.
    Malformed,
    /// The stream would not fit a 32-bit TIFF offset.
    LimitExceeded,
};

struct ExifEncodeResult final {
    ExifEncodeStatus status  = ExifEncodeStatus::Ok;
    uint32_t ifds_written    = 0;
    uint32_t entries_written = 0;
    /// Tag id of the first value that failed to encode (0 if none).
    uint16_t failed_tag = 0;
};

/**
 * \brief Encodes \p dict as TIFF header + IFDs into \p out (replacing it).
 *
 * Layout, in \ref ExifDict::byte_order:
 * header, IFD0, EXIF IFD, GPS IFD, Interop IFD, IFD1, thumbnail.
 *
 * - IFD pointer tags are generated for non-empty sub-IFDs. An EXIF IFD is
 *   emitted when the Interop IFD is non-empty even if it has no tags itself.
 * - IFD1 carries JPEGInterchangeFormat/Length when a thumbnail is present.
 * - Entries are written in ascending tag order; values larger than four
 *   bytes follow their directory, padded to an even offset.
 * - A MakerNote value is written at \ref ExifDict::maker_note_offset when
 *   that offset is set; blocks that would overlap it are moved past it and
 *   the gaps are zero-filled.
 * - Unknown IFD tokens are ignored.
 */
ExifEncodeResult
encode_exif_tiff(const ExifDict& dict, std::vector<std::byte>* out) noexcept;

/// Returns a stable lowercase name for \p status.
const char*
exif_encode_status_name(ExifEncodeStatus status) noexcept;

}  // namespace exifnote

#pragma once

#include "exifnote/exif_dict.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file exif_tiff_decode.h
 * \brief Decoder for the TIFF-IFD stream carried in a JPEG APP1 EXIF segment.
 */

namespace exifnote {

/// EXIF/TIFF decode result status.
enum class ExifDecodeStatus : uint8_t {
    Ok,
    Unsupported,
    Malformed,
    LimitExceeded,
};

/// Resource limits applied during decode to bound hostile inputs.
struct ExifDecodeLimits final {
    uint32_t max_ifds            = 16;
    uint32_t max_entries_per_ifd = 4096;
    uint32_t max_total_entries   = 65536;
    uint64_t max_value_bytes     = 1ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref decode_exif_tiff.
struct ExifDecodeOptions final {
    /// If true, IFD pointer tags are kept as entries in addition to being followed.
    bool include_pointer_tags = false;
    ExifDecodeLimits limits;
};

/// Aggregated decode statistics.
struct ExifDecodeResult final {
    ExifDecodeStatus status  = ExifDecodeStatus::Ok;
    uint32_t ifds_decoded    = 0;
    uint32_t entries_decoded = 0;
};

/**
 * \brief Decodes a classic TIFF header + IFD tree into \p dict.
 *
 * Decoded IFDs: IFD0, IFD1 and the EXIF, GPS and Interoperability
 * sub-IFDs. The dictionary byte order is set from the TIFF header. The JPEG
 * thumbnail referenced by IFD1 is copied into \ref ExifDict::thumbnail when
 * its range is valid. The offset of an out-of-line MakerNote is recorded in
 * \ref ExifDict::maker_note_offset.
 *
 * Entry-level problems (bad offsets, unknown types) mark the result
 * \ref ExifDecodeStatus::Malformed but do not stop the decode; header-level
 * problems return immediately. Structures that are seen but not decoded
 * (an IFD chained after IFD1, SubIFDs) mark the result
 * \ref ExifDecodeStatus::Unsupported. Any status other than Ok means
 * \p dict does not hold everything the stream carries.
 *
 * \param tiff_bytes TIFF header + IFD stream (from an EXIF APP1 payload).
 * \param dict Destination (entries are added or replaced).
 * \param options Decode options + limits.
 */
ExifDecodeResult
decode_exif_tiff(std::span<const std::byte> tiff_bytes, ExifDict* dict,
                 const ExifDecodeOptions& options) noexcept;

/// Returns a stable lowercase name for \p status.
const char*
exif_decode_status_name(ExifDecodeStatus status) noexcept;

}  // namespace exifnote

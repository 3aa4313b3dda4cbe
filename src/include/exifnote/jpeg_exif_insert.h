#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file jpeg_exif_insert.h
 * \brief Rewrites the APP1 EXIF segment of a JPEG byte stream.
 */

namespace exifnote {

enum class InsertStatus : uint8_t {
    Ok,
    /// Input is not a JPEG (no SOI marker).
    Unsupported,
    /// Broken marker/segment chain before SOS.
    Malformed,
    /// APP1 payload does not fit a JPEG segment (65533 bytes max).
    LimitExceeded,
};

/// Largest payload a single JPEG marker segment can carry.
inline constexpr uint32_t kMaxJpegSegmentPayload = 65533U;

/**
 * \brief Writes \p jpeg to \p out with \p app1_payload as its only EXIF segment.
 *
 * Every existing APP1 segment starting with "Exif\0" is dropped. The new
 * segment takes the position of the first one that was dropped; when the
 * file had none it follows SOI, or a leading APP0 (JFIF) segment if present.
 * Bytes from SOS onwards are copied unchanged.
 *
 * \param app1_payload Segment payload ("Exif\0\0" + TIFF stream), no marker
 *        or length field.
 */
InsertStatus
insert_exif_segment(std::span<const std::byte> jpeg,
                    std::span<const std::byte> app1_payload,
                    std::vector<std::byte>* out) noexcept;

const char*
insert_status_name(InsertStatus status) noexcept;

}  // namespace exifnote

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file container_scan.h
 * \brief Locates EXIF blocks inside a JPEG byte stream.
 */

namespace exifnote {

enum class ScanStatus : uint8_t {
    Ok,
    OutputTruncated,
    Unsupported,
    Malformed,
};

enum class ContainerBlockKind : uint8_t {
    Unknown,
    Exif,
};

struct ContainerBlockRef final {
    ContainerBlockKind kind = ContainerBlockKind::Unknown;

    // The JPEG segment, marker included.
    uint64_t outer_offset = 0;
    uint64_t outer_size   = 0;

    // The TIFF stream inside the segment (after the "Exif\0\0" preamble).
    uint64_t data_offset = 0;
    uint64_t data_size   = 0;

    // JPEG marker (0xFFEx).
    uint32_t id = 0;
};

struct ScanResult final {
    ScanStatus status = ScanStatus::Ok;
    uint32_t written  = 0;
    uint32_t needed   = 0;
};

/**
 * \brief Scans JPEG marker segments up to SOS/EOI and reports APP1 EXIF blocks.
 *
 * Works on a prefix of a file: a segment that runs past the end of \p bytes
 * stops the scan with \ref ScanStatus::Malformed, and the blocks reported
 * before it remain valid.
 */
ScanResult
scan_jpeg(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept;

const char*
scan_status_name(ScanStatus status) noexcept;

}  // namespace exifnote

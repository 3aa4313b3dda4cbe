#pragma once

#include "exifnote/exif_dict.h"
#include "exifnote/exif_tiff_decode.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file exif_codec.h
 * \brief Pluggable EXIF parse/dump capability used by the reader and stamper.
 */

namespace exifnote {

enum class ExifCodecStatus : uint8_t {
    Ok,
    Unsupported,
    Malformed,
    LimitExceeded,
};

/// How \ref ExifCodec::parse treats damaged or partially decoded metadata.
enum class ExifParseMode : uint8_t {
    /// Keep whatever decoded. Used when only reading values.
    Lenient,
    /// Any decode problem fails the parse. Used before the dictionary is
    /// dumped back into the file, so entries that did not decode are never
    /// dropped from the rewritten segment.
    Strict,
};

/**
 * \brief Converts between file bytes and an \ref ExifDict.
 *
 * \ref parse accepts a whole file or a prefix of one. \ref dump produces an
 * APP1 payload ("Exif\0\0" followed by the TIFF stream).
 */
class ExifCodec {
public:
    virtual ~ExifCodec() = default;

    virtual ExifCodecStatus parse(std::span<const std::byte> bytes,
                                  ExifDict* dict, ExifParseMode mode) noexcept
        = 0;
    virtual ExifCodecStatus dump(const ExifDict& dict,
                                 std::vector<std::byte>* out) noexcept
        = 0;
};

/**
 * \brief JPEG implementation of \ref ExifCodec.
 *
 * A JPEG without an EXIF segment yields an empty dictionary in both modes.
 * In \ref ExifParseMode::Lenient, damage found after at least one IFD
 * decoded is not an error. In \ref ExifParseMode::Strict, any status other
 * than \ref ExifDecodeStatus::Ok from the TIFF decoder, or a broken segment
 * chain, fails the parse. Only the first EXIF segment is decoded.
 */
class JpegExifCodec final : public ExifCodec {
public:
    JpegExifCodec() noexcept = default;
    explicit JpegExifCodec(const ExifDecodeOptions& options) noexcept;

    ExifCodecStatus parse(std::span<const std::byte> bytes, ExifDict* dict,
                          ExifParseMode mode) noexcept override;
    ExifCodecStatus dump(const ExifDict& dict,
                         std::vector<std::byte>* out) noexcept override;

private:
    ExifDecodeOptions options_;
};

const char*
exif_codec_status_name(ExifCodecStatus status) noexcept;

}  // namespace exifnote

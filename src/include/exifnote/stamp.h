#pragma once

#include "exifnote/exif_codec.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file stamp.h
 * \brief Whole-file workflow: record the original filename in a JPEG.
 */

namespace exifnote {

enum class StampStatus : uint8_t {
    /// \p out holds the rewritten JPEG.
    Stamped,
    /// Nothing to write (no date, empty name, or already annotated).
    Unchanged,
    ParseFailed,
    DumpFailed,
    InsertFailed,
};

struct StampResult final {
    StampStatus status = StampStatus::Unchanged;
    /// Codec status of the failed parse or dump step.
    ExifCodecStatus codec_status = ExifCodecStatus::Ok;
};

/**
 * \brief Parses all of \p jpeg, applies \ref encode_original_filename and,
 * when the dictionary changed, writes the re-encoded file into \p out.
 *
 * The parse is \ref ExifParseMode::Strict: metadata that does not decode
 * cleanly yields \ref StampStatus::ParseFailed instead of a rewrite that
 * would lose the entries the decoder skipped.
 *
 * \p out is left untouched unless the result is \ref StampStatus::Stamped.
 */
StampResult
stamp_original_filename(std::span<const std::byte> jpeg,
                        std::string_view file_name, ExifCodec& codec,
                        std::vector<std::byte>* out) noexcept;

const char*
stamp_status_name(StampStatus status) noexcept;

}  // namespace exifnote

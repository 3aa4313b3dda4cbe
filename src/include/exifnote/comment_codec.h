#pragma once

#include "exifnote/exif_dict.h"

#include <string>
#include <string_view>

/**
 * \file comment_codec.h
 * \brief EXIF UserComment text and the `OriginalFilename:` annotation line.
 */

namespace exifnote {

/// UserComment character-code header for ASCII text ("ASCII" + 3 NULs).
inline constexpr std::string_view kAsciiCharsetPrefix { "ASCII\0\0\0", 8 };

/// Label of the annotation line (`OriginalFilename: <name>`).
inline constexpr std::string_view kOriginalFilenameLabel = "OriginalFilename";

/**
 * \brief Returns the comment text of a UserComment value.
 *
 * Null or non-text values give an empty string. A leading
 * \ref kAsciiCharsetPrefix is removed; any other content is returned as is.
 */
std::string
decode_user_comment(const ExifValue* value);

std::string
decode_user_comment(std::string_view raw);

/// Returns \p text with \ref kAsciiCharsetPrefix in front (always added).
std::string
encode_user_comment(std::string_view text);

/**
 * \brief True if any line of \p text, trimmed, starts with
 * \ref kOriginalFilenameLabel. The recorded value is not inspected.
 *
 * Here and in \ref find_annotation_value, lines end at `\n`, `\r\n` or a
 * lone `\r`.
 */
bool
has_annotation_line(std::string_view text) noexcept;

/**
 * \brief Returns the trimmed value of the first `OriginalFilename:` line
 * with a non-empty value, or an empty string.
 */
std::string
find_annotation_value(std::string_view text);

/// Appends `OriginalFilename: <file_name>` as a new line of \p text.
std::string
append_annotation_line(std::string_view text, std::string_view file_name);

}  // namespace exifnote

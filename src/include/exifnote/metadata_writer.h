#pragma once

#include "exifnote/exif_dict.h"

#include <string_view>

/**
 * \file metadata_writer.h
 * \brief Records an original filename in the EXIF UserComment.
 */

namespace exifnote {

/**
 * \brief Appends `OriginalFilename: <file_name>` to the UserComment of \p dict.
 *
 * Does nothing when \p file_name is empty, when the EXIF IFD has no
 * non-empty DateTimeOriginal, or when the comment already has a line
 * starting with `OriginalFilename` (whatever its value). Otherwise the
 * comment is rewritten with the ASCII character-code header as an
 * UNDEFINED value.
 */
void
encode_original_filename(std::string_view file_name, ExifDict& dict);

}  // namespace exifnote

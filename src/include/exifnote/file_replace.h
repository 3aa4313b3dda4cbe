#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file file_replace.h
 * \brief Whole-file rewrite through a sibling temporary and `rename` (POSIX).
 */

namespace exifnote {

enum class ReplaceFileStatus : uint8_t {
    Ok,
    /// The target could not be stat'ed (missing, or not accessible).
    StatFailed,
    /// No sibling temporary could be created.
    CreateFailed,
    WriteFailed,
    RenameFailed,
};

/**
 * \brief Replaces the contents of \p path with \p bytes.
 *
 * The bytes are written to a new, uniquely named sibling (`mkstemp`, never an
 * existing file) that is given the permission bits of \p path, flushed, and
 * renamed over \p path. On failure \p path is unchanged and the sibling is
 * removed.
 */
ReplaceFileStatus
replace_file_contents(const char* path,
                      std::span<const std::byte> bytes) noexcept;

const char*
replace_file_status_name(ReplaceFileStatus status) noexcept;

}  // namespace exifnote

#pragma once

#include "exifnote/mapped_file.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * \file byte_source.h
 * \brief Capability for reading the leading bytes of a file.
 */

namespace exifnote {

class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Replaces \p out with the first min(\p max_bytes, file size) bytes of \p path.
    virtual MappedFileStatus read_prefix(const char* path, uint64_t max_bytes,
                                         std::vector<std::byte>* out) noexcept
        = 0;
};

/// \ref ByteSource that maps the file and copies only the requested prefix.
class MappedFileSource final : public ByteSource {
public:
    MappedFileStatus read_prefix(const char* path, uint64_t max_bytes,
                                 std::vector<std::byte>* out) noexcept override;
};

}  // namespace exifnote

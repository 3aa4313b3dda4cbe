#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file mapped_file.h
 * \brief Read-only whole-file memory mapping (POSIX).
 */

namespace exifnote {

enum class MappedFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    TooLarge,
    MapFailed,
};

/**
 * \brief Owns a read-only `mmap` of one file.
 *
 * Empty files open successfully and expose an empty span.
 */
class MappedFile final {
public:
    MappedFile() noexcept = default;
    ~MappedFile() noexcept;

    MappedFile(const MappedFile&)            = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    /// Maps \p path. Files larger than \p max_file_bytes are refused (0 = no cap).
    MappedFileStatus open(const char* path,
                          uint64_t max_file_bytes = 0) noexcept;
    void close() noexcept;

    bool is_open() const noexcept { return fd_ >= 0; }
    uint64_t size() const noexcept { return size_; }
    std::span<const std::byte> bytes() const noexcept;

private:
    void take(MappedFile& other) noexcept;

    int fd_                = -1;
    const std::byte* data_ = nullptr;
    uint64_t size_         = 0;
};

const char*
mapped_file_status_name(MappedFileStatus status) noexcept;

}  // namespace exifnote

#include "exifnote/mapped_file.h"

#include <limits>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace exifnote {

MappedFile::~MappedFile() noexcept
{
    close();
}


MappedFile::MappedFile(MappedFile&& other) noexcept
{
    take(other);
}


MappedFile&
MappedFile::operator=(MappedFile&& other) noexcept
{
    if (this != &other) {
        close();
        take(other);
    }
    return *this;
}


void
MappedFile::take(MappedFile& other) noexcept
{
    fd_         = other.fd_;
    data_       = other.data_;
    size_       = other.size_;
    other.fd_   = -1;
    other.data_ = nullptr;
    other.size_ = 0;
}


MappedFileStatus
MappedFile::open(const char* path, uint64_t max_file_bytes) noexcept
{
    close();
    if (!path || !*path) {
        return MappedFileStatus::OpenFailed;
    }

    const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return MappedFileStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        (void)::close(fd);
        return MappedFileStatus::StatFailed;
    }
    const uint64_t file_size = static_cast<uint64_t>(st.st_size);
    if ((max_file_bytes != 0U && file_size > max_file_bytes)
        || file_size > std::numeric_limits<size_t>::max()) {
        (void)::close(fd);
        return MappedFileStatus::TooLarge;
    }

    if (file_size != 0U) {
        void* p = ::mmap(nullptr, static_cast<size_t>(file_size), PROT_READ,
                         MAP_PRIVATE, fd, 0);
        if (p == MAP_FAILED) {
            (void)::close(fd);
            return MappedFileStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(p);
    }
    fd_   = fd;
    size_ = file_size;
    return MappedFileStatus::Ok;
}


void
MappedFile::close() noexcept
{
    if (data_) {
        (void)::munmap(const_cast<std::byte*>(data_),
                       static_cast<size_t>(size_));
    }
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_   = -1;
    data_ = nullptr;
    size_ = 0;
}


std::span<const std::byte>
MappedFile::bytes() const noexcept
{
    if (!data_) {
        return {};
    }
    return { data_, static_cast<size_t>(size_) };
}


const char*
mapped_file_status_name(MappedFileStatus status) noexcept
{
    switch (status) {
    case MappedFileStatus::Ok: return "ok";
    case MappedFileStatus::OpenFailed: return "open_failed";
    case MappedFileStatus::StatFailed: return "stat_failed";
    case MappedFileStatus::TooLarge: return "too_large";
    case MappedFileStatus::MapFailed: return "map_failed";
    }
    return "unknown";
}

}  // namespace exifnote

#include "exifnote/byte_source.h"

namespace exifnote {

MappedFileStatus
MappedFileSource::read_prefix(const char* path, uint64_t max_bytes,
                              std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return MappedFileStatus::OpenFailed;
    }
    out->clear();

    MappedFile file;
    const MappedFileStatus status = file.open(path);
    if (status != MappedFileStatus::Ok) {
        return status;
    }
    const std::span<const std::byte> bytes = file.bytes();
    const size_t n = (max_bytes < bytes.size()) ? static_cast<size_t>(max_bytes)
                                                : bytes.size();
    out->assign(bytes.begin(), bytes.begin() + static_cast<ptrdiff_t>(n));
    return MappedFileStatus::Ok;
}

}  // namespace exifnote

#include "exifnote/file_replace.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace exifnote {
namespace {

    static bool write_all(int fd, std::span<const std::byte> bytes) noexcept
    {
        size_t done = 0;
        while (done < bytes.size()) {
            const ssize_t n = ::write(fd, bytes.data() + done,
                                      bytes.size() - done);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            done += static_cast<size_t>(n);
        }
        return true;
    }

}  // namespace

ReplaceFileStatus
replace_file_contents(const char* path,
                      std::span<const std::byte> bytes) noexcept
{
    if (!path || !*path) {
        return ReplaceFileStatus::StatFailed;
    }

    struct stat st {};
    if (::stat(path, &st) != 0) {
        return ReplaceFileStatus::StatFailed;
    }

    const std::string pattern = std::string(path) + ".exifnote-XXXXXX";
    std::vector<char> tmp(pattern.begin(), pattern.end());
    tmp.push_back('\0');

    const int fd = ::mkstemp(tmp.data());
    if (fd < 0) {
        return ReplaceFileStatus::CreateFailed;
    }

    // mkstemp creates the file 0600.
    bool ok = ::fchmod(fd, st.st_mode & 07777) == 0 && write_all(fd, bytes)
              && ::fsync(fd) == 0;
    if (::close(fd) != 0) {
        ok = false;
    }
    if (!ok) {
        (void)::unlink(tmp.data());
        return ReplaceFileStatus::WriteFailed;
    }
    if (std::rename(tmp.data(), path) != 0) {
        (void)::unlink(tmp.data());
        return ReplaceFileStatus::RenameFailed;
    }
    return ReplaceFileStatus::Ok;
}


const char*
replace_file_status_name(ReplaceFileStatus status) noexcept
{
    switch (status) {
    case ReplaceFileStatus::Ok: return "ok";
    case ReplaceFileStatus::StatFailed: return "stat_failed";
    case ReplaceFileStatus::CreateFailed: return "create_failed";
    case ReplaceFileStatus::WriteFailed: return "write_failed";
    case ReplaceFileStatus::RenameFailed: return "rename_failed";
    }
    return "unknown";
}

}  // namespace exifnote

#include "exifnote/build_info.h"
#include "exifnote/byte_source.h"
#include "exifnote/console_format.h"
#include "exifnote/diagnostics.h"
#include "exifnote/exif_codec.h"
#include "exifnote/file_replace.h"
#include "exifnote/mapped_file.h"
#include "exifnote/metadata_reader.h"
#include "exifnote/resource_policy.h"
#include "exifnote/stamp.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace exifnote {
namespace {

    static constexpr uint32_t kMaxPrintBytes = 1024U;

    struct ToolOptions final {
        ExifNotePolicy policy;
        bool stamp       = false;
        bool dry_run     = false;
        const char* name = nullptr;
    };

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file> [file...]\n", argv0);
        std::printf("options:\n");
        std::printf("  --help               print this help and exit\n");
        std::printf("  --version            print build info and exit\n");
        std::printf(
            "  --window-bytes N     header bytes examined when reading (default: 65536)\n");
        std::printf(
            "  --max-file-bytes N   refuse to stamp files larger than N bytes (default: 0=unlimited)\n");
        std::printf(
            "  --stamp              record the file's basename in UserComment\n");
        std::printf(
            "  --name NAME          with --stamp: record NAME instead of the basename\n");
        std::printf(
            "  --dry-run            with --stamp: report the outcome, do not write\n");
    }


    static void print_build_info()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(build_info(), &line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }


    static std::string_view basename_of(std::string_view path) noexcept
    {
        const size_t slash = path.find_last_of('/');
        if (slash == std::string_view::npos) {
            return path;
        }
        return path.substr(slash + 1);
    }


    static int read_one(const char* path, const ToolOptions& options,
                        ByteSource& source, ExifCodec& codec,
                        DiagnosticSink& sink)
    {
        ExtractOptions extract;
        apply_policy(options.policy, nullptr, &extract);

        const ExtractResult res
            = extract_exif_summary_from_file(path, source, codec, sink,
                                             extract);
        std::printf("== %s\n", console_escaped(path, kMaxPrintBytes).c_str());
        std::printf("date_taken=%s\n",
                    console_escaped(res.summary.date_taken, kMaxPrintBytes)
                        .c_str());
        std::printf("original_filename=%s\n",
                    console_escaped(res.summary.original_file_name,
                                    kMaxPrintBytes)
                        .c_str());
        return res.status == ExtractStatus::Ok ? 0 : 1;
    }


    static int stamp_one(const char* path, const ToolOptions& options,
                         ExifCodec& codec)
    {
        const std::string shown = console_escaped(path, kMaxPrintBytes);
        std::printf("== %s\n", shown.c_str());

        std::vector<std::byte> rewritten;
        StampResult res;
        {
            MappedFile file;
            const MappedFileStatus st
                = file.open(path, options.policy.max_file_bytes);
            if (st == MappedFileStatus::TooLarge) {
                std::fprintf(
                    stderr,
                    "exifnote: refusing to stamp `%s` (larger than --max-file-bytes=%llu)\n",
                    shown.c_str(),
                    static_cast<unsigned long long>(
                        options.policy.max_file_bytes));
                return 1;
            }
            if (st != MappedFileStatus::Ok) {
                std::fprintf(stderr, "exifnote: failed to open `%s` (%s)\n",
                             shown.c_str(), mapped_file_status_name(st));
                return 1;
            }

            const std::string_view name = options.name
                                              ? std::string_view(options.name)
                                              : basename_of(path);
            res = stamp_original_filename(file.bytes(), name, codec,
                                          &rewritten);
        }

        switch (res.status) {
        case StampStatus::Unchanged: std::printf("unchanged\n"); return 0;
        case StampStatus::Stamped: break;
        case StampStatus::ParseFailed:
        case StampStatus::DumpFailed:
            std::fprintf(stderr, "exifnote: cannot stamp `%s`: %s (%s)\n",
                         shown.c_str(), stamp_status_name(res.status),
                         exif_codec_status_name(res.codec_status));
            return 1;
        case StampStatus::InsertFailed:
            std::fprintf(stderr, "exifnote: cannot stamp `%s`: %s\n",
                         shown.c_str(), stamp_status_name(res.status));
            return 1;
        }

        if (options.dry_run) {
            std::printf("stamped (dry run)\n");
            return 0;
        }
        const ReplaceFileStatus written = replace_file_contents(path,
                                                               rewritten);
        if (written != ReplaceFileStatus::Ok) {
            std::fprintf(stderr, "exifnote: failed to write `%s` (%s)\n",
                         shown.c_str(), replace_file_status_name(written));
            return 1;
        }
        std::printf("stamped\n");
        return 0;
    }

}  // namespace
}  // namespace exifnote

int
main(int argc, char** argv)
{
    using namespace exifnote;

    ToolOptions options;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info();
            return 0;
        }
        if (std::strcmp(arg, "--stamp") == 0) {
            options.stamp = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--dry-run") == 0) {
            options.dry_run = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--name") == 0 && i + 1 < argc) {
            options.name = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--window-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v) || v == 0U) {
                std::fprintf(stderr, "invalid --window-bytes value\n");
                return 2;
            }
            options.policy.header_window_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            options.policy.max_file_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strncmp(arg, "--", 2) == 0 && arg[2] != '\0') {
            std::fprintf(stderr, "unknown option `%s`\n", arg);
            usage(argv[0]);
            return 2;
        }
        break;
    }

    if (argc <= first_path) {
        usage(argv[0]);
        return 2;
    }
    if ((options.dry_run || options.name) && !options.stamp) {
        std::fprintf(stderr, "--name and --dry-run require --stamp\n");
        return 2;
    }

    ExifDecodeOptions decode;
    apply_policy(options.policy, &decode, nullptr);
    JpegExifCodec codec(decode);
    MappedFileSource source;
    StderrDiagnosticSink sink;

    int exit_code = 0;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];
        if (!path || !*path) {
            continue;
        }
        const int rc = options.stamp ? stamp_one(path, options, codec)
                                     : read_one(path, options, source, codec,
                                                sink);
        if (rc != 0) {
            exit_code = 1;
        }
    }
    return exit_code;
}

#include "exifnote/metadata_reader.h"

#include "exifnote/comment_codec.h"

#include <optional>
#include <utility>
#include <vector>

namespace exifnote {
namespace {

    static ExtractStatus from_codec_status(ExifCodecStatus status) noexcept
    {
        switch (status) {
        case ExifCodecStatus::Ok: return ExtractStatus::Ok;
        case ExifCodecStatus::Unsupported: return ExtractStatus::Unsupported;
        case ExifCodecStatus::Malformed: return ExtractStatus::Malformed;
        case ExifCodecStatus::LimitExceeded: return ExtractStatus::LimitExceeded;
        }
        return ExtractStatus::Malformed;
    }


    static std::string date_taken_of(const ExifDict& dict)
    {
        const ExifValue* v = find_tag(dict, kExifIfd, kTagDateTimeOriginal);
        if (!v) {
            return {};
        }
        const std::optional<std::string> text = value_text(*v);
        if (!text || text->empty()) {
            return {};
        }
        return normalize_date_taken(*text);
    }


    static void report(DiagnosticSink& sink, std::string_view subject,
                       ExtractStatus status) noexcept
    {
        std::string message = "cannot read EXIF metadata (";
        message.append(extract_status_name(status));
        message.append(")");

        Diagnostic diag;
        diag.level   = DiagnosticLevel::Warning;
        diag.subject = subject;
        diag.message = message;
        sink.on_diagnostic(diag);
    }

}  // namespace

std::string
normalize_date_taken(std::string_view date_time)
{
    const size_t space = date_time.find(' ');
    if (space != std::string_view::npos) {
        date_time = date_time.substr(0, space);
    }
    std::string out(date_time);
    for (char& c : out) {
        if (c == ':') {
            c = '-';
        }
    }
    return out;
}


ExtractResult
extract_exif_summary_checked(std::span<const std::byte> file_bytes,
                             ExifCodec& codec,
                             const ExtractOptions& options) noexcept
{
    ExtractResult result;
    if (file_bytes.size() > options.header_window_bytes) {
        file_bytes = file_bytes.first(
            static_cast<size_t>(options.header_window_bytes));
    }

    ExifDict dict;
    const ExifCodecStatus status = codec.parse(file_bytes, &dict,
                                               ExifParseMode::Lenient);
    if (status != ExifCodecStatus::Ok) {
        result.status = from_codec_status(status);
        return result;
    }

    result.summary.date_taken = date_taken_of(dict);
    const std::string comment = decode_user_comment(
        find_tag(dict, kExifIfd, kTagUserComment));
    result.summary.original_file_name = find_annotation_value(comment);
    return result;
}


ExifSummary
extract_exif_summary(std::span<const std::byte> file_bytes, ExifCodec& codec,
                     DiagnosticSink& sink,
                     const ExtractOptions& options) noexcept
{
    ExtractResult res = extract_exif_summary_checked(file_bytes, codec,
                                                     options);
    if (res.status != ExtractStatus::Ok) {
        report(sink, {}, res.status);
        return {};
    }
    return std::move(res.summary);
}


ExtractResult
extract_exif_summary_from_file(const char* path, ByteSource& source,
                               ExifCodec& codec, DiagnosticSink& sink,
                               const ExtractOptions& options) noexcept
{
    const std::string_view subject = path ? std::string_view(path)
                                          : std::string_view();
    std::vector<std::byte> window;
    const MappedFileStatus read
        = source.read_prefix(path, options.header_window_bytes, &window);
    if (read != MappedFileStatus::Ok) {
        std::string message = "cannot read file (";
        message.append(mapped_file_status_name(read));
        message.append(")");

        Diagnostic diag;
        diag.level   = DiagnosticLevel::Warning;
        diag.subject = subject;
        diag.message = message;
        sink.on_diagnostic(diag);

        ExtractResult failed;
        failed.status = ExtractStatus::ReadFailed;
        return failed;
    }

    ExtractResult res = extract_exif_summary_checked(window, codec, options);
    if (res.status != ExtractStatus::Ok) {
        report(sink, subject, res.status);
    }
    return res;
}


const char*
extract_status_name(ExtractStatus status) noexcept
{
    switch (status) {
    case ExtractStatus::Ok: return "ok";
    case ExtractStatus::ReadFailed: return "read_failed";
    case ExtractStatus::Unsupported: return "unsupported";
    case ExtractStatus::Malformed: return "malformed";
    case ExtractStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace exifnote

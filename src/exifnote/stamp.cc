#include "exifnote/stamp.h"

#include "exifnote/jpeg_exif_insert.h"
#include "exifnote/metadata_writer.h"

#include <optional>

namespace exifnote {

StampResult
stamp_original_filename(std::span<const std::byte> jpeg,
                        std::string_view file_name, ExifCodec& codec,
                        std::vector<std::byte>* out) noexcept
{
    StampResult result;
    if (!out) {
        result.status = StampStatus::InsertFailed;
        return result;
    }

    ExifDict dict;
    result.codec_status = codec.parse(jpeg, &dict, ExifParseMode::Strict);
    if (result.codec_status != ExifCodecStatus::Ok) {
        result.status = StampStatus::ParseFailed;
        return result;
    }

    const ExifValue* before = find_tag(dict, kExifIfd, kTagUserComment);
    const std::optional<ExifValue> old_comment
        = before ? std::optional<ExifValue>(*before) : std::nullopt;
    encode_original_filename(file_name, dict);
    const ExifValue* after = find_tag(dict, kExifIfd, kTagUserComment);
    if (!after || (old_comment && *old_comment == *after)) {
        result.status = StampStatus::Unchanged;
        return result;
    }

    std::vector<std::byte> payload;
    result.codec_status = codec.dump(dict, &payload);
    if (result.codec_status != ExifCodecStatus::Ok) {
        result.status = StampStatus::DumpFailed;
        return result;
    }

    std::vector<std::byte> rewritten;
    if (insert_exif_segment(jpeg, payload, &rewritten) != InsertStatus::Ok) {
        result.status = StampStatus::InsertFailed;
        return result;
    }
    out->swap(rewritten);
    result.status = StampStatus::Stamped;
    return result;
}


const char*
stamp_status_name(StampStatus status) noexcept
{
    switch (status) {
    case StampStatus::Stamped: return "stamped";
    case StampStatus::Unchanged: return "unchanged";
    case StampStatus::ParseFailed: return "parse_failed";
    case StampStatus::DumpFailed: return "dump_failed";
    case StampStatus::InsertFailed: return "insert_failed";
    }
    return "unknown";
}

}  // namespace exifnote

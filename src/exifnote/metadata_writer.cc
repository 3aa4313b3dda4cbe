#include "exifnote/metadata_writer.h"

#include "exifnote/comment_codec.h"

#include <optional>
#include <string>

namespace exifnote {
namespace {

    static bool has_date_taken(const ExifDict& dict)
    {
        const ExifValue* v = find_tag(dict, kExifIfd, kTagDateTimeOriginal);
        if (!v) {
            return false;
        }
        const std::optional<std::string> text = value_text(*v);
        return text && !text->empty();
    }

}  // namespace

void
encode_original_filename(std::string_view file_name, ExifDict& dict)
{
    if (file_name.empty() || !has_date_taken(dict)) {
        return;
    }

    ExifIfdMap& exif = ifd_or_empty(dict, kExifIfd);
    const auto it    = exif.find(kTagUserComment);
    const std::string comment = decode_user_comment(
        it != exif.end() ? &it->second : nullptr);
    if (has_annotation_line(comment)) {
        return;
    }

    const std::string updated = append_annotation_line(comment, file_name);
    exif[kTagUserComment] = make_bytes_value(encode_user_comment(updated),
                                             kTiffUndefined);
}

}  // namespace exifnote

#include "exifnote/exif_codec.h"

#include "exifnote/container_scan.h"
#include "exifnote/exif_tiff_encode.h"
#include "exifnote/jpeg_exif_insert.h"

#include <array>

namespace exifnote {
namespace {

    static ExifCodecStatus from_decode_status(ExifDecodeStatus status) noexcept
    {
        switch (status) {
        case ExifDecodeStatus::Ok: return ExifCodecStatus::Ok;
        case ExifDecodeStatus::Unsupported: return ExifCodecStatus::Unsupported;
        case ExifDecodeStatus::Malformed: return ExifCodecStatus::Malformed;
        case ExifDecodeStatus::LimitExceeded:
            return ExifCodecStatus::LimitExceeded;
        }
        return ExifCodecStatus::Malformed;
    }

}  // namespace

JpegExifCodec::JpegExifCodec(const ExifDecodeOptions& options) noexcept
    : options_(options)
{
}


ExifCodecStatus
JpegExifCodec::parse(std::span<const std::byte> bytes, ExifDict* dict,
                     ExifParseMode mode) noexcept
{
    if (!dict) {
        return ExifCodecStatus::Malformed;
    }
    *dict = ExifDict {};

    std::array<ContainerBlockRef, 4> blocks {};
    const ScanResult scan = scan_jpeg(bytes, blocks);
    if (scan.status == ScanStatus::Unsupported) {
        return ExifCodecStatus::Unsupported;
    }
    if (scan.written == 0) {
        // A broken segment chain before any EXIF block is a broken file; a
        // clean chain without one is a JPEG with no metadata.
        return scan.status == ScanStatus::Malformed ? ExifCodecStatus::Malformed
                                                    : ExifCodecStatus::Ok;
    }
    if (mode == ExifParseMode::Strict
        && scan.status == ScanStatus::Malformed) {
        return ExifCodecStatus::Malformed;
    }

    const ContainerBlockRef& block = blocks[0];
    const std::span<const std::byte> tiff
        = bytes.subspan(static_cast<size_t>(block.data_offset),
                        static_cast<size_t>(block.data_size));
    const ExifDecodeResult res = decode_exif_tiff(tiff, dict, options_);
    if (res.status == ExifDecodeStatus::Ok) {
        return ExifCodecStatus::Ok;
    }
    if (mode == ExifParseMode::Lenient && res.ifds_decoded > 0) {
        return ExifCodecStatus::Ok;
    }
    return from_decode_status(res.status);
}


ExifCodecStatus
JpegExifCodec::dump(const ExifDict& dict, std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return ExifCodecStatus::Malformed;
    }

    std::vector<std::byte> tiff;
    const ExifEncodeResult res = encode_exif_tiff(dict, &tiff);
    switch (res.status) {
    case ExifEncodeStatus::Ok: break;
    case ExifEncodeStatus::Malformed: return ExifCodecStatus::Malformed;
    case ExifEncodeStatus::LimitExceeded: return ExifCodecStatus::LimitExceeded;
    }
    if (tiff.size() + 6U > kMaxJpegSegmentPayload) {
        return ExifCodecStatus::LimitExceeded;
    }

    static constexpr char kPreamble[6] = { 'E', 'x', 'i', 'f', '\0', '\0' };
    out->clear();
    out->reserve(tiff.size() + sizeof(kPreamble));
    for (char c : kPreamble) {
        out->push_back(static_cast<std::byte>(c));
    }
    out->insert(out->end(), tiff.begin(), tiff.end());
    return ExifCodecStatus::Ok;
}


const char*
exif_codec_status_name(ExifCodecStatus status) noexcept
{
    switch (status) {
    case ExifCodecStatus::Ok: return "ok";
    case ExifCodecStatus::Unsupported: return "unsupported";
    case ExifCodecStatus::Malformed: return "malformed";
    case ExifCodecStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace exifnote

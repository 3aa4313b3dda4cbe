#include "exifnote/jpeg_exif_insert.h"

#include <cstring>

namespace exifnote {
namespace {

    struct Segment final {
        uint64_t offset = 0;
        uint64_t size   = 0;
        bool is_exif    = false;
        bool is_app0    = false;
    };

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool is_exif_payload(std::span<const std::byte> bytes,
                                uint64_t offset, uint64_t size) noexcept
    {
        if (size < 6) {
            return false;
        }
        return std::memcmp(bytes.data() + offset, "Exif", 4) == 0
               && u8(bytes[offset + 4]) == 0;
    }


    static void append(std::vector<std::byte>* out,
                       std::span<const std::byte> bytes, uint64_t offset,
                       uint64_t size)
    {
        const std::byte* p = bytes.data() + offset;
        out->insert(out->end(), p, p + size);
    }


    static void append_app1(std::vector<std::byte>* out,
                            std::span<const std::byte> payload)
    {
        const uint32_t len = static_cast<uint32_t>(payload.size()) + 2U;
        out->push_back(std::byte { 0xFF });
        out->push_back(std::byte { 0xE1 });
        out->push_back(std::byte { static_cast<uint8_t>((len >> 8) & 0xFFU) });
        out->push_back(std::byte { static_cast<uint8_t>((len >> 0) & 0xFFU) });
        out->insert(out->end(), payload.begin(), payload.end());
    }

}  // namespace

InsertStatus
insert_exif_segment(std::span<const std::byte> jpeg,
                    std::span<const std::byte> app1_payload,
                    std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return InsertStatus::Malformed;
    }
    if (jpeg.size() < 2 || u8(jpeg[0]) != 0xFF || u8(jpeg[1]) != 0xD8) {
        return InsertStatus::Unsupported;
    }
    if (app1_payload.size() > kMaxJpegSegmentPayload) {
        return InsertStatus::LimitExceeded;
    }

    std::vector<Segment> segments;
    uint64_t offset   = 2;
    uint64_t tail_off = jpeg.size();
    while (offset < jpeg.size()) {
        if (u8(jpeg[offset]) != 0xFF) {
            return InsertStatus::Malformed;
        }
        const uint64_t marker_off = offset;
        while (offset < jpeg.size() && u8(jpeg[offset]) == 0xFF) {
            offset += 1;
        }
        if (offset >= jpeg.size()) {
            return InsertStatus::Malformed;
        }
        const uint8_t marker = u8(jpeg[offset]);
        offset += 1;

        if (marker == 0xD9 || marker == 0xDA) {
            tail_off = marker_off;
            break;
        }
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01) {
            Segment seg;
            seg.offset = marker_off;
            seg.size   = offset - marker_off;
            segments.push_back(seg);
            continue;
        }

        if (offset + 2 > jpeg.size()) {
            return InsertStatus::Malformed;
        }
        const uint16_t seg_len = static_cast<uint16_t>(
            (static_cast<uint16_t>(u8(jpeg[offset])) << 8)
            | static_cast<uint16_t>(u8(jpeg[offset + 1])));
        if (seg_len < 2 || offset + seg_len > jpeg.size()) {
            return InsertStatus::Malformed;
        }

        Segment seg;
        seg.offset  = marker_off;
        seg.size    = (offset - marker_off) + seg_len;
        seg.is_exif = marker == 0xE1
                      && is_exif_payload(jpeg, offset + 2, seg_len - 2U);
        seg.is_app0 = marker == 0xE0;
        segments.push_back(seg);
        offset += seg_len;
    }

    size_t insert_at = 0;
    bool found_exif  = false;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].is_exif) {
            insert_at  = i;
            found_exif = true;
            break;
        }
    }
    if (!found_exif && !segments.empty() && segments[0].is_app0) {
        insert_at = 1;
    }

    out->clear();
    out->reserve(jpeg.size() + app1_payload.size() + 4U);
    out->push_back(std::byte { 0xFF });
    out->push_back(std::byte { 0xD8 });
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i == insert_at) {
            append_app1(out, app1_payload);
        }
        if (segments[i].is_exif) {
            continue;
        }
        append(out, jpeg, segments[i].offset, segments[i].size);
    }
    if (insert_at >= segments.size()) {
        append_app1(out, app1_payload);
    }
    append(out, jpeg, tail_off, jpeg.size() - tail_off);
    return InsertStatus::Ok;
}


const char*
insert_status_name(InsertStatus status) noexcept
{
    switch (status) {
    case InsertStatus::Ok: return "ok";
    case InsertStatus::Unsupported: return "unsupported";
    case InsertStatus::Malformed: return "malformed";
    case InsertStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace exifnote

#include "exifnote/exif_tiff_encode.h"

#include <algorithm>
#include <limits>
#include <span>
#include <utility>

namespace exifnote {
namespace {

    struct EncodedEntry final {
        uint16_t tag   = 0;
        uint16_t type  = 0;
        uint32_t count = 0;
        std::vector<std::byte> payload;
        // Out-of-line value written at this offset instead of after the
        // directory (0 = after the directory).
        uint32_t fixed_offset = 0;
    };

    static void put_u8(uint8_t v, std::vector<std::byte>* out)
    {
        out->push_back(std::byte { v });
    }

    static void put_u16(bool le, uint16_t v, std::vector<std::byte>* out)
    {
        if (le) {
            put_u8(static_cast<uint8_t>((v >> 0) & 0xFF), out);
            put_u8(static_cast<uint8_t>((v >> 8) & 0xFF), out);
        } else {
            put_u8(static_cast<uint8_t>((v >> 8) & 0xFF), out);
            put_u8(static_cast<uint8_t>((v >> 0) & 0xFF), out);
        }
    }

    static void put_u32(bool le, uint32_t v, std::vector<std::byte>* out)
    {
        if (le) {
            put_u16(true, static_cast<uint16_t>(v & 0xFFFFU), out);
            put_u16(true, static_cast<uint16_t>(v >> 16U), out);
        } else {
            put_u16(false, static_cast<uint16_t>(v >> 16U), out);
            put_u16(false, static_cast<uint16_t>(v & 0xFFFFU), out);
        }
    }

    static void put_u64(bool le, uint64_t v, std::vector<std::byte>* out)
    {
        const uint32_t hi = static_cast<uint32_t>(v >> 32U);
        const uint32_t lo = static_cast<uint32_t>(v & 0xFFFFFFFFU);
        if (le) {
            put_u32(true, lo, out);
            put_u32(true, hi, out);
        } else {
            put_u32(false, hi, out);
            put_u32(false, lo, out);
        }
    }

    static bool is_generated_tag(uint16_t tag) noexcept
    {
        return tag == kTagExifIfdPointer || tag == kTagGpsIfdPointer
               || tag == kTagInteropIfdPointer || tag == kTagSubIfds
               || tag == kTagJpegInterchange
               || tag == kTagJpegInterchangeSize;
    }

    static bool encode_numbers(const ExifValue& value, bool le,
                               EncodedEntry* out)
    {
        const std::vector<uint64_t>& n = value.numbers;

        switch (value.wire_type) {
        case kTiffByte:
        case kTiffSByte:
        case kTiffUndefined:
            for (uint64_t v : n) {
                put_u8(static_cast<uint8_t>(v), &out->payload);
            }
            out->count = static_cast<uint32_t>(n.size());
            return true;
        case kTiffShort:
        case kTiffSShort:
            for (uint64_t v : n) {
                put_u16(le, static_cast<uint16_t>(v), &out->payload);
            }
            out->count = static_cast<uint32_t>(n.size());
            return true;
        case kTiffLong:
        case kTiffSLong:
        case kTiffFloat:
        case 13:  // IFD
            for (uint64_t v : n) {
                put_u32(le, static_cast<uint32_t>(v), &out->payload);
            }
            out->count = static_cast<uint32_t>(n.size());
            return true;
        case kTiffRational:
        case kTiffSRational:
            if ((n.size() % 2U) != 0U) {
                return false;
            }
            for (uint64_t v : n) {
                put_u32(le, static_cast<uint32_t>(v), &out->payload);
            }
            out->count = static_cast<uint32_t>(n.size() / 2U);
            return true;
        case kTiffDouble:
            for (uint64_t v : n) {
                put_u64(le, v, &out->payload);
            }
            out->count = static_cast<uint32_t>(n.size());
            return true;
        default: break;
        }
        return false;
    }

    static bool encode_value(uint16_t tag, const ExifValue& value, bool le,
                             EncodedEntry* out)
    {
        out->tag  = tag;
        out->type = value.wire_type;
        out->payload.clear();

        switch (value.kind) {
        case ExifValueKind::Empty: return false;
        case ExifValueKind::Text: {
            if (tiff_type_size(value.wire_type) != 1U) {
                return false;
            }
            const auto* p = reinterpret_cast<const std::byte*>(
                value.text.data());
            out->payload.assign(p, p + value.text.size());
            out->payload.push_back(std::byte { 0 });
            out->count = static_cast<uint32_t>(out->payload.size());
            return true;
        }
        case ExifValueKind::Bytes: {
            if (tiff_type_size(value.wire_type) != 1U) {
                return false;
            }
            out->payload = value.bytes;
            out->count   = static_cast<uint32_t>(out->payload.size());
            return true;
        }
        case ExifValueKind::Numbers: return encode_numbers(value, le, out);
        }
        return false;
    }

    static EncodedEntry make_long_entry(uint16_t tag, bool le)
    {
        EncodedEntry e;
        e.tag   = tag;
        e.type  = kTiffLong;
        e.count = 1;
        put_u32(le, 0, &e.payload);
        return e;
    }

    static void set_long_entry(std::vector<EncodedEntry>* entries,
                               uint16_t tag, uint32_t value, bool le)
    {
        for (EncodedEntry& e : *entries) {
            if (e.tag == tag) {
                e.payload.clear();
                put_u32(le, value, &e.payload);
                return;
            }
        }
    }

    static bool build_entries(const ExifIfdMap* ifd, bool le,
                              std::vector<EncodedEntry>* out,
                              ExifEncodeResult* result)
    {
        out->clear();
        if (!ifd) {
            return true;
        }
        out->reserve(ifd->size() + 2U);
        for (const auto& [tag, value] : *ifd) {
            if (is_generated_tag(tag)) {
                continue;
            }
            EncodedEntry e;
            if (!encode_value(tag, value, le, &e)) {
                result->status     = ExifEncodeStatus::Malformed;
                result->failed_tag = tag;
                return false;
            }
            out->push_back(std::move(e));
        }
        return true;
    }

    static void sort_entries(std::vector<EncodedEntry>* entries)
    {
        std::sort(entries->begin(), entries->end(),
                  [](const EncodedEntry& a, const EncodedEntry& b) {
                      return a.tag < b.tag;
                  });
    }

    static uint64_t padded_size(uint64_t n) noexcept
    {
        return n + (n & 1U);
    }

    static uint64_t ifd_size(std::span<const EncodedEntry> entries) noexcept
    {
        uint64_t size = 2U + 12U * static_cast<uint64_t>(entries.size()) + 4U;
        for (const EncodedEntry& e : entries) {
            if (e.payload.size() > 4U && e.fixed_offset == 0) {
                size += padded_size(e.payload.size());
            }
        }
        return size;
    }

    // Returns the offset of a `size`-byte block placed at `*cursor`, or past
    // the reserved range when the block would overlap it.
    static uint64_t place_block(uint64_t size, uint64_t reserved_off,
                                uint64_t reserved_end, uint64_t* cursor)
    {
        uint64_t off = *cursor;
        if (size != 0 && off < reserved_end && off + size > reserved_off) {
            off = padded_size(reserved_end);
        }
        *cursor = off + size;
        return off;
    }

    static void pad_to(uint64_t off, std::vector<std::byte>* out)
    {
        if (out->size() < off) {
            out->resize(static_cast<size_t>(off), std::byte { 0 });
        }
    }

    static void write_ifd(std::span<const EncodedEntry> entries,
                          uint32_t ifd_off, uint32_t next_ifd, bool le,
                          std::vector<std::byte>* out)
    {
        uint32_t value_off = ifd_off + 2U
                             + 12U * static_cast<uint32_t>(entries.size())
                             + 4U;

        put_u16(le, static_cast<uint16_t>(entries.size()), out);
        for (const EncodedEntry& e : entries) {
            put_u16(le, e.tag, out);
            put_u16(le, e.type, out);
            put_u32(le, e.count, out);
            if (e.payload.size() <= 4U) {
                out->insert(out->end(), e.payload.begin(), e.payload.end());
                for (size_t i = e.payload.size(); i < 4U; ++i) {
                    put_u8(0, out);
                }
            } else if (e.fixed_offset != 0) {
                put_u32(le, e.fixed_offset, out);
            } else {
                put_u32(le, value_off, out);
                value_off += static_cast<uint32_t>(
                    padded_size(e.payload.size()));
            }
        }
        put_u32(le, next_ifd, out);

        for (const EncodedEntry& e : entries) {
            if (e.payload.size() <= 4U || e.fixed_offset != 0) {
                continue;
            }
            out->insert(out->end(), e.payload.begin(), e.payload.end());
            if ((e.payload.size() & 1U) != 0U) {
                put_u8(0, out);
            }
        }
    }

}  // namespace

ExifEncodeResult
encode_exif_tiff(const ExifDict& dict, std::vector<std::byte>* out) noexcept
{
    ExifEncodeResult result;
    if (!out) {
        result.status = ExifEncodeStatus::Malformed;
        return result;
    }
    out->clear();

    const bool le = dict.byte_order == ExifByteOrder::LittleEndian;

    std::vector<EncodedEntry> ifd0;
    std::vector<EncodedEntry> exif;
    std::vector<EncodedEntry> gps;
    std::vector<EncodedEntry> interop;
    std::vector<EncodedEntry> ifd1;
    if (!build_entries(find_ifd(dict, kIfd0), le, &ifd0, &result)
        || !build_entries(find_ifd(dict, kExifIfd), le, &exif, &result)
        || !build_entries(find_ifd(dict, kGpsIfd), le, &gps, &result)
        || !build_entries(find_ifd(dict, kInteropIfd), le, &interop, &result)
        || !build_entries(find_ifd(dict, kIfd1), le, &ifd1, &result)) {
        return result;
    }

    const bool has_interop = !interop.empty();
    const bool has_exif    = !exif.empty() || has_interop;
    const bool has_gps     = !gps.empty();
    const bool has_thumb   = !dict.thumbnail.empty();
    const bool has_ifd1    = !ifd1.empty() || has_thumb;

    if (has_exif) {
        ifd0.push_back(make_long_entry(kTagExifIfdPointer, le));
    }
    if (has_gps) {
        ifd0.push_back(make_long_entry(kTagGpsIfdPointer, le));
    }
    if (has_interop) {
        exif.push_back(make_long_entry(kTagInteropIfdPointer, le));
    }
    if (has_thumb) {
        ifd1.push_back(make_long_entry(kTagJpegInterchange, le));
        ifd1.push_back(make_long_entry(kTagJpegInterchangeSize, le));
    }
    sort_entries(&ifd0);
    sort_entries(&exif);
    sort_entries(&gps);
    sort_entries(&interop);
    sort_entries(&ifd1);

    // The MakerNote keeps its decoded offset; the other blocks are laid out
    // around it.
    const EncodedEntry* maker_note = nullptr;
    if (dict.maker_note_offset >= 8U) {
        for (EncodedEntry& e : exif) {
            if (e.tag == kTagMakerNote && e.payload.size() > 4U) {
                e.fixed_offset = dict.maker_note_offset;
                maker_note     = &e;
            }
        }
    }
    const uint64_t mn_off = maker_note ? dict.maker_note_offset : 0U;
    const uint64_t mn_end = maker_note ? mn_off + maker_note->payload.size()
                                       : 0U;

    uint64_t cursor         = 8;
    const uint64_t ifd0_off = place_block(ifd_size(ifd0), mn_off, mn_end,
                                          &cursor);
    const uint64_t exif_off = place_block(has_exif ? ifd_size(exif) : 0U,
                                          mn_off, mn_end, &cursor);
    const uint64_t gps_off  = place_block(has_gps ? ifd_size(gps) : 0U,
                                          mn_off, mn_end, &cursor);
    const uint64_t interop_off
        = place_block(has_interop ? ifd_size(interop) : 0U, mn_off, mn_end,
                      &cursor);
    const uint64_t ifd1_off  = place_block(has_ifd1 ? ifd_size(ifd1) : 0U,
                                           mn_off, mn_end, &cursor);
    const uint64_t thumb_off = place_block(dict.thumbnail.size(), mn_off,
                                           mn_end, &cursor);
    const uint64_t total     = std::max(cursor, mn_end);
    if (total > std::numeric_limits<uint32_t>::max()) {
        result.status = ExifEncodeStatus::LimitExceeded;
        return result;
    }

    set_long_entry(&ifd0, kTagExifIfdPointer, static_cast<uint32_t>(exif_off),
                   le);
    set_long_entry(&ifd0, kTagGpsIfdPointer, static_cast<uint32_t>(gps_off),
                   le);
    set_long_entry(&exif, kTagInteropIfdPointer,
                   static_cast<uint32_t>(interop_off), le);
    set_long_entry(&ifd1, kTagJpegInterchange,
                   static_cast<uint32_t>(thumb_off), le);
    set_long_entry(&ifd1, kTagJpegInterchangeSize,
                   static_cast<uint32_t>(dict.thumbnail.size()), le);

    out->reserve(static_cast<size_t>(total));
    if (le) {
        put_u8('I', out);
        put_u8('I', out);
    } else {
        put_u8('M', out);
        put_u8('M', out);
    }
    put_u16(le, 42, out);
    put_u32(le, static_cast<uint32_t>(ifd0_off), out);

    pad_to(ifd0_off, out);
    write_ifd(ifd0, static_cast<uint32_t>(ifd0_off),
              has_ifd1 ? static_cast<uint32_t>(ifd1_off) : 0U, le, out);
    result.ifds_written += 1;
    result.entries_written += static_cast<uint32_t>(ifd0.size());
    if (has_exif) {
        pad_to(exif_off, out);
        write_ifd(exif, static_cast<uint32_t>(exif_off), 0, le, out);
        result.ifds_written += 1;
        result.entries_written += static_cast<uint32_t>(exif.size());
    }
    if (has_gps) {
        pad_to(gps_off, out);
        write_ifd(gps, static_cast<uint32_t>(gps_off), 0, le, out);
        result.ifds_written += 1;
        result.entries_written += static_cast<uint32_t>(gps.size());
    }
    if (has_interop) {
        pad_to(interop_off, out);
        write_ifd(interop, static_cast<uint32_t>(interop_off), 0, le, out);
        result.ifds_written += 1;
        result.entries_written += static_cast<uint32_t>(interop.size());
    }
    if (has_ifd1) {
        pad_to(ifd1_off, out);
        write_ifd(ifd1, static_cast<uint32_t>(ifd1_off), 0, le, out);
        result.ifds_written += 1;
        result.entries_written += static_cast<uint32_t>(ifd1.size());
    }
    if (has_thumb) {
        pad_to(thumb_off, out);
        out->insert(out->end(), dict.thumbnail.begin(), dict.thumbnail.end());
    }
    if (maker_note) {
        pad_to(mn_end, out);
        std::copy(maker_note->payload.begin(), maker_note->payload.end(),
                  out->begin() + static_cast<std::ptrdiff_t>(mn_off));
    }
    return result;
}


const char*
exif_encode_status_name(ExifEncodeStatus status) noexcept
{
    switch (status) {
    case ExifEncodeStatus::Ok: return "ok";
    case ExifEncodeStatus::Malformed: return "malformed";
    case ExifEncodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace exifnote

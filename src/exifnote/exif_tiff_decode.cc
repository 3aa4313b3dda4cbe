#include "exifnote/exif_tiff_decode.h"

#include <array>
#include <cstring>
#include <string_view>
#include <utility>

namespace exifnote {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }

    static bool read_u16be(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset + 2 > bytes.size()) {
            return false;
        }
        const uint16_t v = static_cast<uint16_t>(u8(bytes[offset + 0]) << 8U)
                           | static_cast<uint16_t>(u8(bytes[offset + 1]) << 0U);
        *out = v;
        return true;
    }

    static bool read_u16le(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset + 2 > bytes.size()) {
            return false;
        }
        const uint16_t v = static_cast<uint16_t>(u8(bytes[offset + 0]) << 0U)
                           | static_cast<uint16_t>(u8(bytes[offset + 1]) << 8U);
        *out = v;
        return true;
    }

    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        const uint32_t v
            = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24U)
              | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16U)
              | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8U)
              | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0U);
        *out = v;
        return true;
    }

    static bool read_u32le(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        const uint32_t v
            = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0U)
              | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8U)
              | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16U)
              | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 24U);
        *out = v;
        return true;
    }

    struct TiffConfig final {
        bool le = true;
    };

    static bool read_tiff_u16(const TiffConfig& cfg,
                              std::span<const std::byte> bytes, uint64_t offset,
                              uint16_t* out) noexcept
    {
        if (cfg.le) {
            return read_u16le(bytes, offset, out);
        }
        return read_u16be(bytes, offset, out);
    }

    static bool read_tiff_u32(const TiffConfig& cfg,
                              std::span<const std::byte> bytes, uint64_t offset,
                              uint32_t* out) noexcept
    {
        if (cfg.le) {
            return read_u32le(bytes, offset, out);
        }
        return read_u32be(bytes, offset, out);
    }

    static bool read_tiff_u64(const TiffConfig& cfg,
                              std::span<const std::byte> bytes, uint64_t offset,
                              uint64_t* out) noexcept
    {
        uint32_t a = 0;
        uint32_t b = 0;
        if (!read_tiff_u32(cfg, bytes, offset + 0, &a)
            || !read_tiff_u32(cfg, bytes, offset + 4, &b)) {
            return false;
        }
        *out = cfg.le ? ((static_cast<uint64_t>(b) << 32U) | a)
                      : ((static_cast<uint64_t>(a) << 32U) | b);
        return true;
    }

    static bool contains_nul(std::span<const std::byte> bytes) noexcept
    {
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (bytes[i] == std::byte { 0 }) {
                return true;
            }
        }
        return false;
    }

    enum class IfdKind : uint8_t {
        Ifd0,
        Ifd1,
        ExifIfd,
        GpsIfd,
        InteropIfd,
    };

    static std::string_view ifd_token(IfdKind kind) noexcept
    {
        switch (kind) {
        case IfdKind::Ifd0: return kIfd0;
        case IfdKind::Ifd1: return kIfd1;
        case IfdKind::ExifIfd: return kExifIfd;
        case IfdKind::GpsIfd: return kGpsIfd;
        case IfdKind::InteropIfd: return kInteropIfd;
        }
        return std::string_view();
    }

    static uint8_t ifd_kind_bit(IfdKind kind) noexcept
    {
        switch (kind) {
        case IfdKind::Ifd0: return 1U << 0U;
        case IfdKind::Ifd1: return 1U << 1U;
        case IfdKind::ExifIfd: return 1U << 2U;
        case IfdKind::GpsIfd: return 1U << 3U;
        case IfdKind::InteropIfd: return 1U << 4U;
        }
        return 0;
    }

    struct IfdTask final {
        IfdKind kind    = IfdKind::Ifd0;
        uint64_t offset = 0;
    };

    static void update_status(ExifDecodeResult* out,
                              ExifDecodeStatus status) noexcept
    {
        if (out->status == ExifDecodeStatus::LimitExceeded) {
            return;
        }
        if (status == ExifDecodeStatus::LimitExceeded) {
            out->status = status;
            return;
        }
        if (out->status == ExifDecodeStatus::Malformed) {
            return;
        }
        if (status == ExifDecodeStatus::Malformed) {
            out->status = status;
            return;
        }
        if (out->status == ExifDecodeStatus::Unsupported) {
            return;
        }
        if (status == ExifDecodeStatus::Unsupported) {
            out->status = status;
            return;
        }
    }

    static bool is_pointer_tag(uint16_t tag) noexcept
    {
        return tag == kTagExifIfdPointer || tag == kTagGpsIfdPointer
               || tag == kTagInteropIfdPointer || tag == kTagSubIfds;
    }

    static ExifValue decode_text_value(std::span<const std::byte> raw,
                                       uint16_t type)
    {
        if (raw.empty()) {
            return make_text_value(std::string_view(), type);
        }

        size_t trimmed = raw.size();
        if (raw[trimmed - 1] == std::byte { 0 }) {
            trimmed -= 1;
        }
        const std::span<const std::byte> payload = raw.subspan(0, trimmed);
        if (contains_nul(payload)) {
            // Padded or multi-string values keep their exact bytes.
            return make_bytes_value(raw, type);
        }

        const std::string_view text(reinterpret_cast<const char*>(
                                        payload.data()),
                                    payload.size());
        return make_text_value(text, type);
    }

    static bool decode_tiff_value(const TiffConfig& cfg,
                                  std::span<const std::byte> bytes,
                                  uint16_t type, uint32_t count,
                                  uint64_t value_off, uint64_t value_bytes,
                                  ExifValue* out) noexcept
    {
        const std::span<const std::byte> raw
            = bytes.subspan(static_cast<size_t>(value_off),
                            static_cast<size_t>(value_bytes));

        switch (type) {
        case kTiffByte:
        case kTiffSByte:
        case kTiffUndefined: *out = make_bytes_value(raw, type); return true;
        case kTiffAscii:
        case kTiffUtf8: *out = decode_text_value(raw, type); return true;
        default: break;
        }

        ExifValue v;
        v.kind      = ExifValueKind::Numbers;
        v.wire_type = type;

        switch (type) {
        case kTiffShort:
        case kTiffSShort: {
            v.numbers.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                uint16_t value = 0;
                if (!read_tiff_u16(cfg, bytes,
                                   value_off + static_cast<uint64_t>(i) * 2U,
                                   &value)) {
                    return false;
                }
                v.numbers.push_back(value);
            }
            break;
        }
        case kTiffLong:
        case kTiffSLong:
        case kTiffFloat:
        case 13: {  // IFD
            v.numbers.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                uint32_t value = 0;
                if (!read_tiff_u32(cfg, bytes,
                                   value_off + static_cast<uint64_t>(i) * 4U,
                                   &value)) {
                    return false;
                }
                v.numbers.push_back(value);
            }
            break;
        }
        case kTiffRational:
        case kTiffSRational: {
            v.numbers.reserve(static_cast<size_t>(count) * 2U);
            for (uint32_t i = 0; i < count; ++i) {
                uint32_t numer      = 0;
                uint32_t denom      = 0;
                const uint64_t base = value_off + static_cast<uint64_t>(i) * 8U;
                if (!read_tiff_u32(cfg, bytes, base + 0, &numer)
                    || !read_tiff_u32(cfg, bytes, base + 4, &denom)) {
                    return false;
                }
                v.numbers.push_back(numer);
                v.numbers.push_back(denom);
            }
            break;
        }
        case kTiffDouble: {
            v.numbers.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                uint64_t bits = 0;
                if (!read_tiff_u64(cfg, bytes,
                                   value_off + static_cast<uint64_t>(i) * 8U,
                                   &bits)) {
                    return false;
                }
                v.numbers.push_back(bits);
            }
            break;
        }
        default: return false;
        }

        *out = std::move(v);
        return true;
    }

    static bool push_task(std::span<IfdTask> stack, uint32_t* stack_size,
                          IfdKind kind, uint64_t offset,
                          const ExifDecodeLimits& limits,
                          ExifDecodeResult* result) noexcept
    {
        if (*stack_size >= stack.size() || *stack_size >= limits.max_ifds) {
            update_status(result, ExifDecodeStatus::LimitExceeded);
            return false;
        }
        stack[*stack_size] = IfdTask { kind, offset };
        *stack_size += 1;
        return true;
    }

    static void follow_ifd_pointer(const TiffConfig& cfg,
                                   std::span<const std::byte> bytes,
                                   uint16_t tag, uint16_t type, uint32_t count,
                                   uint64_t value_off, std::span<IfdTask> stack,
                                   uint32_t* stack_size,
                                   const ExifDecodeLimits& limits,
                                   ExifDecodeResult* result) noexcept
    {
        IfdKind kind = IfdKind::ExifIfd;
        if (tag == kTagExifIfdPointer) {
            kind = IfdKind::ExifIfd;
        } else if (tag == kTagGpsIfdPointer) {
            kind = IfdKind::GpsIfd;
        } else if (tag == kTagInteropIfdPointer) {
            kind = IfdKind::InteropIfd;
        } else {
            return;
        }
        if (count == 0 || (type != kTiffLong && type != 13)) {
            update_status(result, ExifDecodeStatus::Malformed);
            return;
        }

        uint32_t ptr = 0;
        if (!read_tiff_u32(cfg, bytes, value_off, &ptr)) {
            update_status(result, ExifDecodeStatus::Malformed);
            return;
        }
        (void)push_task(stack, stack_size, kind, ptr, limits, result);
    }

}  // namespace

ExifDecodeResult
decode_exif_tiff(std::span<const std::byte> tiff_bytes, ExifDict* dict,
                 const ExifDecodeOptions& options) noexcept
{
    ExifDecodeResult result;
    if (!dict) {
        result.status = ExifDecodeStatus::Malformed;
        return result;
    }
    if (tiff_bytes.size() < 8) {
        result.status = ExifDecodeStatus::Malformed;
        return result;
    }

    TiffConfig cfg;
    const uint8_t b0 = u8(tiff_bytes[0]);
    const uint8_t b1 = u8(tiff_bytes[1]);
    if (b0 == 0x49 && b1 == 0x49) {
        cfg.le = true;
    } else if (b0 == 0x4D && b1 == 0x4D) {
        cfg.le = false;
    } else {
        result.status = ExifDecodeStatus::Unsupported;
        return result;
    }

    uint16_t version = 0;
    if (!read_tiff_u16(cfg, tiff_bytes, 2, &version)) {
        result.status = ExifDecodeStatus::Malformed;
        return result;
    }
    if (version != 42) {
        // BigTIFF (43) never appears inside a JPEG APP1 segment.
        result.status = ExifDecodeStatus::Unsupported;
        return result;
    }

    uint32_t first_ifd = 0;
    if (!read_tiff_u32(cfg, tiff_bytes, 4, &first_ifd)) {
        result.status = ExifDecodeStatus::Malformed;
        return result;
    }

    dict->byte_order = cfg.le ? ExifByteOrder::LittleEndian
                              : ExifByteOrder::BigEndian;

    std::array<IfdTask, 16> stack_buf {};
    std::array<uint64_t, 16> visited_offs {};
    std::array<uint8_t, 16> visited_masks {};
    uint32_t stack_size    = 0;
    uint32_t visited_count = 0;

    uint64_t thumb_off  = 0;
    uint64_t thumb_size = 0;

    if (first_ifd != 0) {
        stack_buf[0] = IfdTask { IfdKind::Ifd0, first_ifd };
        stack_size   = 1;
    }

    while (stack_size > 0) {
        const IfdTask task = stack_buf[stack_size - 1];
        stack_size -= 1;

        if (task.offset == 0 || task.offset >= tiff_bytes.size()) {
            update_status(&result, ExifDecodeStatus::Malformed);
            continue;
        }

        const uint8_t kind_bit = ifd_kind_bit(task.kind);
        bool seen              = false;
        for (uint32_t i = 0; i < visited_count; ++i) {
            if (visited_offs[i] == task.offset) {
                // The same directory reached twice (pointer loop) is decoded
                // once; a different kind at the same offset is malformed.
                if ((visited_masks[i] & kind_bit) == 0) {
                    update_status(&result, ExifDecodeStatus::Malformed);
                }
                seen = true;
                break;
            }
        }
        if (seen) {
            continue;
        }
        if (visited_count >= visited_offs.size()
            || result.ifds_decoded >= options.limits.max_ifds) {
            update_status(&result, ExifDecodeStatus::LimitExceeded);
            break;
        }
        visited_offs[visited_count]  = task.offset;
        visited_masks[visited_count] = kind_bit;
        visited_count += 1;

        uint16_t n16 = 0;
        if (!read_tiff_u16(cfg, tiff_bytes, task.offset, &n16)) {
            update_status(&result, ExifDecodeStatus::Malformed);
            continue;
        }
        const uint64_t entry_count      = n16;
        const uint64_t entries_off      = task.offset + 2;
        const uint64_t next_ifd_off_pos = entries_off + entry_count * 12U;

        if (entry_count > options.limits.max_entries_per_ifd) {
            update_status(&result, ExifDecodeStatus::LimitExceeded);
            continue;
        }
        if (next_ifd_off_pos > tiff_bytes.size()) {
            update_status(&result, ExifDecodeStatus::Malformed);
            continue;
        }
        if (result.entries_decoded + entry_count
            > options.limits.max_total_entries) {
            update_status(&result, ExifDecodeStatus::LimitExceeded);
            continue;
        }

        if (task.kind == IfdKind::Ifd0) {
            uint32_t next32 = 0;
            if (read_tiff_u32(cfg, tiff_bytes, next_ifd_off_pos, &next32)) {
                if (next32 != 0) {
                    (void)push_task(std::span<IfdTask>(stack_buf), &stack_size,
                                    IfdKind::Ifd1, next32, options.limits,
                                    &result);
                }
            } else {
                // Truncated next-IFD pointer field. Decode entries anyway.
                update_status(&result, ExifDecodeStatus::Malformed);
            }
        } else if (task.kind == IfdKind::Ifd1) {
            uint32_t next32 = 0;
            if (!read_tiff_u32(cfg, tiff_bytes, next_ifd_off_pos, &next32)) {
                update_status(&result, ExifDecodeStatus::Malformed);
            } else if (next32 != 0) {
                // IFD2 and later are not decoded.
                update_status(&result, ExifDecodeStatus::Unsupported);
            }
        }

        result.ifds_decoded += 1;
        ExifIfdMap& ifd = ifd_or_empty(*dict, ifd_token(task.kind));

        for (uint64_t i = 0; i < entry_count; ++i) {
            const uint64_t eoff = entries_off + i * 12U;

            uint16_t tag   = 0;
            uint16_t type  = 0;
            uint32_t count = 0;
            uint32_t v32   = 0;
            if (!read_tiff_u16(cfg, tiff_bytes, eoff + 0, &tag)
                || !read_tiff_u16(cfg, tiff_bytes, eoff + 2, &type)
                || !read_tiff_u32(cfg, tiff_bytes, eoff + 4, &count)
                || !read_tiff_u32(cfg, tiff_bytes, eoff + 8, &v32)) {
                update_status(&result, ExifDecodeStatus::Malformed);
                continue;
            }

            const uint64_t unit = tiff_type_size(type);
            if (unit == 0) {
                // Unknown type: the value size cannot be determined.
                update_status(&result, ExifDecodeStatus::Malformed);
                continue;
            }
            const uint64_t value_bytes = static_cast<uint64_t>(count) * unit;
            const uint64_t value_off   = (value_bytes <= 4U) ? eoff + 8 : v32;
            if (value_off + value_bytes > tiff_bytes.size()) {
                update_status(&result, ExifDecodeStatus::Malformed);
                continue;
            }
            if (value_bytes > options.limits.max_value_bytes) {
                update_status(&result, ExifDecodeStatus::LimitExceeded);
                continue;
            }

            follow_ifd_pointer(cfg, tiff_bytes, tag, type, count, value_off,
                               std::span<IfdTask>(stack_buf), &stack_size,
                               options.limits, &result);

            if (task.kind == IfdKind::Ifd1) {
                if (tag == kTagJpegInterchange && count == 1) {
                    thumb_off = v32;
                    continue;
                }
                if (tag == kTagJpegInterchangeSize && count == 1) {
                    if (type == kTiffShort) {
                        uint16_t s16 = 0;
                        (void)read_tiff_u16(cfg, tiff_bytes, value_off, &s16);
                        thumb_size = s16;
                    } else {
                        thumb_size = v32;
                    }
                    continue;
                }
            }

            if (tag == kTagSubIfds) {
                update_status(&result, ExifDecodeStatus::Unsupported);
            }
            if (!options.include_pointer_tags && is_pointer_tag(tag)) {
                continue;
            }
            if (task.kind == IfdKind::ExifIfd && tag == kTagMakerNote
                && value_bytes > 4U) {
                dict->maker_note_offset = static_cast<uint32_t>(value_off);
            }

            ExifValue value;
            if (!decode_tiff_value(cfg, tiff_bytes, type, count, value_off,
                                   value_bytes, &value)) {
                update_status(&result, ExifDecodeStatus::Malformed);
                continue;
            }
            ifd.insert_or_assign(tag, std::move(value));
            result.entries_decoded += 1;
        }
    }

    if (thumb_size != 0) {
        if (thumb_off != 0 && thumb_off + thumb_size <= tiff_bytes.size()) {
            const std::span<const std::byte> thumb
                = tiff_bytes.subspan(static_cast<size_t>(thumb_off),
                                     static_cast<size_t>(thumb_size));
            dict->thumbnail.assign(thumb.begin(), thumb.end());
        } else {
            update_status(&result, ExifDecodeStatus::Malformed);
        }
    }

    return result;
}


const char*
exif_decode_status_name(ExifDecodeStatus status) noexcept
{
    switch (status) {
    case ExifDecodeStatus::Ok: return "ok";
    case ExifDecodeStatus::Unsupported: return "unsupported";
    case ExifDecodeStatus::Malformed: return "malformed";
    case ExifDecodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace exifnote

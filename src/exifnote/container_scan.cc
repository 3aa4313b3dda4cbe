#include "exifnote/container_scan.h"

#include <cstring>

namespace exifnote {
namespace {

    struct BlockSink final {
        ContainerBlockRef* out = nullptr;
        uint32_t cap           = 0;
        ScanResult result;
    };

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool match(std::span<const std::byte> bytes, uint64_t offset,
                      const char* s, uint32_t s_len) noexcept
    {
        const uint64_t size = static_cast<uint64_t>(bytes.size());
        if (offset + s_len > size) {
            return false;
        }
        return std::memcmp(bytes.data() + static_cast<size_t>(offset), s,
                           static_cast<size_t>(s_len))
               == 0;
    }


    static void sink_emit(BlockSink* sink,
                          const ContainerBlockRef& block) noexcept
    {
        sink->result.needed += 1;
        if (sink->result.written < sink->cap) {
            sink->out[sink->result.written] = block;
            sink->result.written += 1;
        } else if (sink->result.status == ScanStatus::Ok) {
            sink->result.status = ScanStatus::OutputTruncated;
        }
    }


    static bool read_u16be(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset + 2 > bytes.size()) {
            return false;
        }
        const uint16_t v = static_cast<uint16_t>(u8(bytes[offset + 0]) << 8)
                           | static_cast<uint16_t>(u8(bytes[offset + 1]) << 0);
        *out = v;
        return true;
    }


    static bool skip_exif_preamble(ContainerBlockRef* block,
                                   std::span<const std::byte> bytes) noexcept
    {
        // EXIF segment preamble is typically "Exif\0\0" before the TIFF header.
        // Some real-world files use a non-zero second terminator byte; accept
        // these variants as long as the following bytes look like a TIFF header.
        if (block->data_size < 10) {
            return false;
        }
        if (!match(bytes, block->data_offset, "Exif", 4)) {
            return false;
        }
        if (u8(bytes[block->data_offset + 4]) != 0) {
            return false;
        }

        const uint64_t tiff_off = block->data_offset + 6;
        if (tiff_off + 4 > bytes.size()) {
            return false;
        }
        const uint8_t a    = u8(bytes[tiff_off + 0]);
        const uint8_t b    = u8(bytes[tiff_off + 1]);
        const uint8_t c    = u8(bytes[tiff_off + 2]);
        const uint8_t d    = u8(bytes[tiff_off + 3]);
        const bool is_tiff = (a == 'I' && b == 'I' && c == 0x2A && d == 0x00)
                             || (a == 'M' && b == 'M' && c == 0x00
                                 && d == 0x2A);
        if (!is_tiff) {
            return false;
        }

        block->data_offset += 6;
        block->data_size -= 6;
        return true;
    }

}  // namespace

ScanResult
scan_jpeg(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept
{
    BlockSink sink;
    sink.out = out.data();
    sink.cap = static_cast<uint32_t>(out.size());

    if (bytes.size() < 2) {
        sink.result.status = ScanStatus::Malformed;
        return sink.result;
    }
    if (u8(bytes[0]) != 0xFF || u8(bytes[1]) != 0xD8) {
        sink.result.status = ScanStatus::Unsupported;
        return sink.result;
    }

    uint64_t offset = 2;
    while (offset + 2 <= bytes.size()) {
        if (u8(bytes[offset]) != 0xFF) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }
        while (offset < bytes.size() && u8(bytes[offset]) == 0xFF) {
            offset += 1;
        }
        if (offset >= bytes.size()) {
            break;
        }
        const uint64_t marker_off = offset - 1;
        const uint8_t marker_lo   = u8(bytes[offset]);
        offset += 1;

        const uint16_t marker = static_cast<uint16_t>(
            0xFF00U | static_cast<uint16_t>(marker_lo));

        if (marker == 0xFFD9) {
            break;
        }
        if (marker == 0xFFDA) {
            // Start of Scan: metadata lives before the compressed scan stream.
            break;
        }
        if ((marker >= 0xFFD0 && marker <= 0xFFD7) || marker == 0xFF01) {
            continue;
        }

        uint16_t seg_len = 0;
        if (!read_u16be(bytes, offset, &seg_len)) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }
        if (seg_len < 2) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }
        const uint64_t seg_payload_off  = offset + 2;
        const uint64_t seg_payload_size = static_cast<uint64_t>(seg_len - 2);
        const uint64_t seg_total_size   = 2 + static_cast<uint64_t>(seg_len);
        if (seg_payload_off + seg_payload_size > bytes.size()) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }

        if (marker == 0xFFE1 && seg_payload_size >= 10
            && match(bytes, seg_payload_off, "Exif", 4)
            && u8(bytes[seg_payload_off + 4]) == 0) {
            ContainerBlockRef block;
            block.kind         = ContainerBlockKind::Exif;
            block.outer_offset = marker_off;
            block.outer_size   = seg_total_size;
            block.data_offset  = seg_payload_off;
            block.data_size    = seg_payload_size;
            block.id           = marker;
            if (skip_exif_preamble(&block, bytes)) {
                sink_emit(&sink, block);
            }
        }

        offset = seg_payload_off + seg_payload_size;
    }

    return sink.result;
}


const char*
scan_status_name(ScanStatus status) noexcept
{
    switch (status) {
    case ScanStatus::Ok: return "ok";
    case ScanStatus::OutputTruncated: return "output_truncated";
    case ScanStatus::Unsupported: return "unsupported";
    case ScanStatus::Malformed: return "malformed";
    }
    return "unknown";
}

}  // namespace exifnote

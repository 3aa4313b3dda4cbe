#include "exifnote/exif_dict.h"

namespace exifnote {
namespace {

    static bool is_rational_type(uint16_t wire_type) noexcept
    {
        return wire_type == kTiffRational || wire_type == kTiffSRational;
    }

}  // namespace

bool
operator==(const ExifValue& a, const ExifValue& b) noexcept
{
    return a.kind == b.kind && a.wire_type == b.wire_type && a.text == b.text
           && a.bytes == b.bytes && a.numbers == b.numbers;
}


ExifValue
make_text_value(std::string_view text, uint16_t wire_type)
{
    ExifValue v;
    v.kind      = ExifValueKind::Text;
    v.wire_type = wire_type;
    v.text.assign(text.data(), text.size());
    return v;
}


ExifValue
make_bytes_value(std::span<const std::byte> bytes, uint16_t wire_type)
{
    ExifValue v;
    v.kind      = ExifValueKind::Bytes;
    v.wire_type = wire_type;
    v.bytes.assign(bytes.begin(), bytes.end());
    return v;
}


ExifValue
make_bytes_value(std::string_view bytes, uint16_t wire_type)
{
    return make_bytes_value(
        std::span<const std::byte>(reinterpret_cast<const std::byte*>(
                                       bytes.data()),
                                   bytes.size()),
        wire_type);
}


ExifValue
make_u16_value(uint16_t value)
{
    ExifValue v;
    v.kind      = ExifValueKind::Numbers;
    v.wire_type = kTiffShort;
    v.numbers.push_back(value);
    return v;
}


ExifValue
make_u32_value(uint32_t value)
{
    ExifValue v;
    v.kind      = ExifValueKind::Numbers;
    v.wire_type = kTiffLong;
    v.numbers.push_back(value);
    return v;
}


ExifValue
make_urational_value(uint32_t numer, uint32_t denom)
{
    ExifValue v;
    v.kind      = ExifValueKind::Numbers;
    v.wire_type = kTiffRational;
    v.numbers.push_back(numer);
    v.numbers.push_back(denom);
    return v;
}


const ExifIfdMap*
find_ifd(const ExifDict& dict, std::string_view ifd) noexcept
{
    const auto it = dict.ifds.find(ifd);
    if (it == dict.ifds.end()) {
        return nullptr;
    }
    return &it->second;
}


const ExifValue*
find_tag(const ExifDict& dict, std::string_view ifd, uint16_t tag) noexcept
{
    const ExifIfdMap* map = find_ifd(dict, ifd);
    if (!map) {
        return nullptr;
    }
    const auto it = map->find(tag);
    if (it == map->end()) {
        return nullptr;
    }
    return &it->second;
}


ExifIfdMap&
ifd_or_empty(ExifDict& dict, std::string_view ifd)
{
    const auto it = dict.ifds.find(ifd);
    if (it != dict.ifds.end()) {
        return it->second;
    }
    return dict.ifds.emplace(std::string(ifd), ExifIfdMap {}).first->second;
}


std::optional<std::string>
value_text(const ExifValue& value)
{
    switch (value.kind) {
    case ExifValueKind::Text: return value.text;
    case ExifValueKind::Bytes:
        return std::string(reinterpret_cast<const char*>(value.bytes.data()),
                           value.bytes.size());
    case ExifValueKind::Empty:
    case ExifValueKind::Numbers: break;
    }
    return std::nullopt;
}


uint32_t
value_component_count(const ExifValue& value) noexcept
{
    switch (value.kind) {
    case ExifValueKind::Empty: return 0;
    case ExifValueKind::Text:
        return static_cast<uint32_t>(value.text.size() + 1U);
    case ExifValueKind::Bytes: return static_cast<uint32_t>(value.bytes.size());
    case ExifValueKind::Numbers:
        if (is_rational_type(value.wire_type)) {
            return static_cast<uint32_t>(value.numbers.size() / 2U);
        }
        return static_cast<uint32_t>(value.numbers.size());
    }
    return 0;
}


uint32_t
tiff_type_size(uint16_t wire_type) noexcept
{
    switch (wire_type) {
    case kTiffByte:
    case kTiffAscii:
    case kTiffSByte:
    case kTiffUndefined:
    case kTiffUtf8: return 1;
    case kTiffShort:
    case kTiffSShort: return 2;
    case kTiffLong:
    case kTiffSLong:
    case kTiffFloat:
    case 13:  // IFD
        return 4;
    case kTiffRational:
    case kTiffSRational:
    case kTiffDouble: return 8;
    default: return 0;
    }
}

}  // namespace exifnote

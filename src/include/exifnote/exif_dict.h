#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file exif_dict.h
 * \brief Editable EXIF container: IFD token -> tag id -> typed value.
 */

namespace exifnote {

/// IFD tokens used as section names in \ref ExifDict.
inline constexpr std::string_view kIfd0       = "ifd0";
inline constexpr std::string_view kIfd1       = "ifd1";
inline constexpr std::string_view kExifIfd    = "exififd";
inline constexpr std::string_view kGpsIfd     = "gpsifd";
inline constexpr std::string_view kInteropIfd = "interopifd";

/** \name Well-known tag ids
 *  @{
 */
inline constexpr uint16_t kTagExifIfdPointer      = 0x8769;
inline constexpr uint16_t kTagGpsIfdPointer       = 0x8825;
inline constexpr uint16_t kTagInteropIfdPointer   = 0xA005;
inline constexpr uint16_t kTagSubIfds             = 0x014A;
inline constexpr uint16_t kTagJpegInterchange     = 0x0201;
inline constexpr uint16_t kTagJpegInterchangeSize = 0x0202;
inline constexpr uint16_t kTagDateTimeOriginal    = 0x9003;
inline constexpr uint16_t kTagMakerNote           = 0x927C;
inline constexpr uint16_t kTagUserComment         = 0x9286;
/** @} */

/** \name TIFF field type codes
 *  @{
 */
inline constexpr uint16_t kTiffByte      = 1;
inline constexpr uint16_t kTiffAscii     = 2;
inline constexpr uint16_t kTiffShort     = 3;
inline constexpr uint16_t kTiffLong      = 4;
inline constexpr uint16_t kTiffRational  = 5;
inline constexpr uint16_t kTiffSByte     = 6;
inline constexpr uint16_t kTiffUndefined = 7;
inline constexpr uint16_t kTiffSShort    = 8;
inline constexpr uint16_t kTiffSLong     = 9;
inline constexpr uint16_t kTiffSRational = 10;
inline constexpr uint16_t kTiffFloat     = 11;
inline constexpr uint16_t kTiffDouble    = 12;
inline constexpr uint16_t kTiffUtf8      = 129;
/** @} */

/// Byte order used when the dictionary is dumped.
enum class ExifByteOrder : uint8_t {
    LittleEndian,
    BigEndian,
};

/// Storage kind of an \ref ExifValue.
enum class ExifValueKind : uint8_t {
    Empty,
    /// ASCII/UTF-8 text in \ref ExifValue::text (no terminator).
    Text,
    /// Raw bytes in \ref ExifValue::bytes (BYTE, SBYTE, UNDEFINED).
    Bytes,
    /// Numeric components in \ref ExifValue::numbers.
    Numbers,
};

/**
 * \brief A single tag value with its TIFF wire type.
 *
 * Numbers layout:
 * - SHORT/LONG/SSHORT/SLONG: one element per component (signed values
 *   stored as their two's-complement bit pattern)
 * - FLOAT/DOUBLE: one element per component holding the IEEE-754 bits
 * - RATIONAL/SRATIONAL: two elements per component (numerator, denominator)
 */
struct ExifValue final {
    ExifValueKind kind = ExifValueKind::Empty;
    uint16_t wire_type = 0;
    std::string text;
    std::vector<std::byte> bytes;
    std::vector<uint64_t> numbers;
};

bool
operator==(const ExifValue& a, const ExifValue& b) noexcept;

using ExifIfdMap = std::map<uint16_t, ExifValue>;

/**
 * \brief Editable metadata container.
 *
 * Keyed by IFD token (\ref kIfd0, \ref kExifIfd, ...) then by tag id.
 * IFD pointer tags and thumbnail offset tags are not stored; the encoder
 * recomputes them from the layout.
 */
struct ExifDict final {
    ExifByteOrder byte_order = ExifByteOrder::BigEndian;
    std::map<std::string, ExifIfdMap, std::less<>> ifds;
    /// JPEG thumbnail referenced by IFD1 (empty when absent).
    std::vector<std::byte> thumbnail;
    /**
     * TIFF offset the MakerNote value was decoded from (0 when unknown).
     * Vendor MakerNotes may hold offsets relative to the TIFF header, so the
     * encoder writes the value back at this offset.
     */
    uint32_t maker_note_offset = 0;
};

/** \name Value constructors
 *  @{
 */
ExifValue
make_text_value(std::string_view text, uint16_t wire_type = kTiffAscii);
ExifValue
make_bytes_value(std::span<const std::byte> bytes,
                 uint16_t wire_type = kTiffUndefined);
ExifValue
make_bytes_value(std::string_view bytes, uint16_t wire_type = kTiffUndefined);
ExifValue
make_u16_value(uint16_t value);
ExifValue
make_u32_value(uint32_t value);
ExifValue
make_urational_value(uint32_t numer, uint32_t denom);
/** @} */

/// Returns the value for (\p ifd, \p tag) or nullptr.
const ExifValue*
find_tag(const ExifDict& dict, std::string_view ifd, uint16_t tag) noexcept;

/// Returns the named IFD, or nullptr when the dictionary has none.
const ExifIfdMap*
find_ifd(const ExifDict& dict, std::string_view ifd) noexcept;

/// Returns the named IFD, inserting an empty one when missing.
ExifIfdMap&
ifd_or_empty(ExifDict& dict, std::string_view ifd);

/**
 * \brief Returns the value as a byte string for text-like kinds.
 *
 * Text and Bytes values are returned verbatim; Numbers and Empty values
 * yield std::nullopt.
 */
std::optional<std::string>
value_text(const ExifValue& value);

/// Returns the TIFF count of \p value (components, or bytes for text).
uint32_t
value_component_count(const ExifValue& value) noexcept;

/// Returns the byte size of one component of \p wire_type (0 if unknown).
uint32_t
tiff_type_size(uint16_t wire_type) noexcept;

}  // namespace exifnote

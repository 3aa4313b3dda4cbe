#include "exifnote/exif_tiff_decode.h"

#include "support/jpeg_fixture.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace exifnote {
namespace {

    using test::append_bytes;
    using test::append_u16be;
    using test::append_u16le;
    using test::append_u32be;
    using test::append_u32le;

    static std::vector<std::byte> make_test_tiff_le()
    {
        std::vector<std::byte> tiff;
        append_bytes(&tiff, "II");
        append_u16le(&tiff, 42);
        append_u32le(&tiff, 8);

        // IFD0 (offset 8).
        append_u16le(&tiff, 2);

        // Make (0x010F) ASCII "Canon\0" at offset 38.
        append_u16le(&tiff, 0x010F);
        append_u16le(&tiff, 2);
        append_u32le(&tiff, 6);
        append_u32le(&tiff, 38);

        // ExifIFDPointer (0x8769) LONG offset 44.
        append_u16le(&tiff, 0x8769);
        append_u16le(&tiff, 4);
        append_u32le(&tiff, 1);
        append_u32le(&tiff, 44);

        append_u32le(&tiff, 0);

        EXPECT_EQ(tiff.size(), 38U);
        append_bytes(&tiff, "Canon");
        tiff.push_back(std::byte { 0 });

        EXPECT_EQ(tiff.size(), 44U);

        // ExifIFD (offset 44).
        append_u16le(&tiff, 2);

        // DateTimeOriginal (0x9003) ASCII at offset 74.
        append_u16le(&tiff, 0x9003);
        append_u16le(&tiff, 2);
        append_u32le(&tiff, 20);
        append_u32le(&tiff, 74);

        // ExposureTime (0x829A) RATIONAL 1/250 at offset 94.
        append_u16le(&tiff, 0x829A);
        append_u16le(&tiff, 5);
        append_u32le(&tiff, 1);
        append_u32le(&tiff, 94);

        append_u32le(&tiff, 0);

        EXPECT_EQ(tiff.size(), 74U);
        append_bytes(&tiff, "2024:01:01 00:00:00");
        tiff.push_back(std::byte { 0 });

        EXPECT_EQ(tiff.size(), 94U);
        append_u32le(&tiff, 1);
        append_u32le(&tiff, 250);
        return tiff;
    }

    static std::vector<std::byte> make_test_tiff_be()
    {
        std::vector<std::byte> tiff;
        append_bytes(&tiff, "MM");
        append_u16be(&tiff, 42);
        append_u32be(&tiff, 8);

        // IFD0 (offset 8): Orientation SHORT 6 (inline).
        append_u16be(&tiff, 1);
        append_u16be(&tiff, 0x0112);
        append_u16be(&tiff, 3);
        append_u32be(&tiff, 1);
        append_u16be(&tiff, 6);
        append_u16be(&tiff, 0);
        append_u32be(&tiff, 0);
        return tiff;
    }

}  // namespace

TEST(ExifTiffDecode, DecodesLittleEndianIfdTree)
{
    const std::vector<std::byte> tiff = make_test_tiff_le();

    ExifDict dict;
    const ExifDecodeResult res = decode_exif_tiff(tiff, &dict, {});
    EXPECT_EQ(res.status, ExifDecodeStatus::Ok);
    EXPECT_EQ(res.ifds_decoded, 2U);
    EXPECT_EQ(res.entries_decoded, 3U);
    EXPECT_EQ(dict.byte_order, ExifByteOrder::LittleEndian);

    const ExifValue* make = find_tag(dict, kIfd0, 0x010F);
    ASSERT_NE(make, nullptr);
    EXPECT_EQ(make->kind, ExifValueKind::Text);
    EXPECT_EQ(make->text, "Canon");

    const ExifValue* dt = find_tag(dict, kExifIfd, kTagDateTimeOriginal);
    ASSERT_NE(dt, nullptr);
    EXPECT_EQ(dt->text, "2024:01:01 00:00:00");

    const ExifValue* exposure = find_tag(dict, kExifIfd, 0x829A);
    ASSERT_NE(exposure, nullptr);
    EXPECT_EQ(exposure->kind, ExifValueKind::Numbers);
    EXPECT_EQ(exposure->numbers, (std::vector<uint64_t> { 1, 250 }));

    // Pointer tags are not kept by default.
    EXPECT_EQ(find_tag(dict, kIfd0, kTagExifIfdPointer), nullptr);
}


TEST(ExifTiffDecode, KeepsPointerTagsWhenAsked)
{
    const std::vector<std::byte> tiff = make_test_tiff_le();

    ExifDecodeOptions options;
    options.include_pointer_tags = true;
    ExifDict dict;
    const ExifDecodeResult res = decode_exif_tiff(tiff, &dict, options);
    EXPECT_EQ(res.status, ExifDecodeStatus::Ok);

    const ExifValue* ptr = find_tag(dict, kIfd0, kTagExifIfdPointer);
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(ptr->numbers, (std::vector<uint64_t> { 44 }));
}


TEST(ExifTiffDecode, DecodesBigEndianInlineShort)
{
    const std::vector<std::byte> tiff = make_test_tiff_be();

    ExifDict dict;
    const ExifDecodeResult res = decode_exif_tiff(tiff, &dict, {});
    EXPECT_EQ(res.status, ExifDecodeStatus::Ok);
    EXPECT_EQ(dict.byte_order, ExifByteOrder::BigEndian);

    const ExifValue* orientation = find_tag(dict, kIfd0, 0x0112);
    ASSERT_NE(orientation, nullptr);
    EXPECT_EQ(orientation->wire_type, kTiffShort);
    EXPECT_EQ(orientation->numbers, (std::vector<uint64_t> { 6 }));
}


TEST(ExifTiffDecode, RejectsBadHeaders)
{
    ExifDict dict;
    std::vector<std::byte> junk;
    append_bytes(&junk, std::string_view("XX*\0\x08\0\0\0", 8));
    EXPECT_EQ(decode_exif_tiff(junk, &dict, {}).status,
              ExifDecodeStatus::Unsupported);

    std::vector<std::byte> bigtiff;
    append_bytes(&bigtiff, "II");
    append_u16le(&bigtiff, 43);
    append_u32le(&bigtiff, 8);
    EXPECT_EQ(decode_exif_tiff(bigtiff, &dict, {}).status,
              ExifDecodeStatus::Unsupported);

    std::vector<std::byte> tiny;
    append_bytes(&tiny, "II");
    EXPECT_EQ(decode_exif_tiff(tiny, &dict, {}).status,
              ExifDecodeStatus::Malformed);

    EXPECT_EQ(decode_exif_tiff(make_test_tiff_le(), nullptr, {}).status,
              ExifDecodeStatus::Malformed);
}


TEST(ExifTiffDecode, OutOfRangeValueMarksMalformedButKeepsOthers)
{
    std::vector<std::byte> tiff = make_test_tiff_le();
    // Point the DateTimeOriginal value past the end of the stream.
    tiff[46 + 8] = std::byte { 0xF0 };
    tiff[46 + 9] = std::byte { 0xFF };

    ExifDict dict;
    const ExifDecodeResult res = decode_exif_tiff(tiff, &dict, {});
    EXPECT_EQ(res.status, ExifDecodeStatus::Malformed);
    EXPECT_EQ(find_tag(dict, kExifIfd, kTagDateTimeOriginal), nullptr);
    EXPECT_NE(find_tag(dict, kExifIfd, 0x829A), nullptr);
    EXPECT_NE(find_tag(dict, kIfd0, 0x010F), nullptr);
}


TEST(ExifTiffDecode, SurvivesIfdPointerLoop)
{
    std::vector<std::byte> tiff;
    append_bytes(&tiff, "II");
    append_u16le(&tiff, 42);
    append_u32le(&tiff, 8);

    // IFD0 whose ExifIFDPointer and next-IFD both point back at itself.
    append_u16le(&tiff, 1);
    append_u16le(&tiff, 0x8769);
    append_u16le(&tiff, 4);
    append_u32le(&tiff, 1);
    append_u32le(&tiff, 8);
    append_u32le(&tiff, 8);

    ExifDict dict;
    const ExifDecodeResult res = decode_exif_tiff(tiff, &dict, {});
    EXPECT_EQ(res.ifds_decoded, 1U);
    EXPECT_EQ(res.status, ExifDecodeStatus::Malformed);
}


TEST(ExifTiffDecode, EntryLimit)
{
    const std::vector<std::byte> tiff = make_test_tiff_le();

    ExifDecodeOptions options;
    options.limits.max_entries_per_ifd = 1;
    ExifDict dict;
    const ExifDecodeResult res = decode_exif_tiff(tiff, &dict, options);
    EXPECT_EQ(res.status, ExifDecodeStatus::LimitExceeded);
}


TEST(ExifTiffDecode, AsciiWithEmbeddedNulIsBytes)
{
    std::vector<std::byte> tiff;
    append_bytes(&tiff, "II");
    append_u16le(&tiff, 42);
    append_u32le(&tiff, 8);

    append_u16le(&tiff, 1);
    append_u16le(&tiff, 0x010E);
    append_u16le(&tiff, 2);
    append_u32le(&tiff, 6);
    append_u32le(&tiff, 26);
    append_u32le(&tiff, 0);
    append_bytes(&tiff, std::string_view("ab\0cd\0", 6));

    ExifDict dict;
    EXPECT_EQ(decode_exif_tiff(tiff, &dict, {}).status, ExifDecodeStatus::Ok);
    const ExifValue* v = find_tag(dict, kIfd0, 0x010E);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->kind, ExifValueKind::Bytes);
    EXPECT_EQ(v->wire_type, kTiffAscii);
    EXPECT_EQ(v->bytes.size(), 6U);
}



TEST(ExifTiffDecode, UnknownTypeMarksMalformed)
{
    std::vector<std::byte> tiff = make_test_tiff_le();
    // ExposureTime entry (second in the EXIF IFD) gets field type 16.
    tiff[58 + 2] = std::byte { 16 };

    ExifDict dict;
    const ExifDecodeResult res = decode_exif_tiff(tiff, &dict, {});
    EXPECT_EQ(res.status, ExifDecodeStatus::Malformed);
    EXPECT_EQ(find_tag(dict, kExifIfd, 0x829A), nullptr);
    EXPECT_NE(find_tag(dict, kExifIfd, kTagDateTimeOriginal), nullptr);
}


TEST(ExifTiffDecode, SubIfdsAreUnsupported)
{
    std::vector<std::byte> tiff;
    append_bytes(&tiff, "II");
    append_u16le(&tiff, 42);
    append_u32le(&tiff, 8);

    append_u16le(&tiff, 1);
    append_u16le(&tiff, 0x014A);
    append_u16le(&tiff, 4);
    append_u32le(&tiff, 1);
    append_u32le(&tiff, 8);
    append_u32le(&tiff, 0);

    ExifDict dict;
    const ExifDecodeResult res = decode_exif_tiff(tiff, &dict, {});
    EXPECT_EQ(res.status, ExifDecodeStatus::Unsupported);
    EXPECT_EQ(res.ifds_decoded, 1U);
}


TEST(ExifTiffDecode, IfdChainedAfterIfd1IsUnsupported)
{
    std::vector<std::byte> tiff;
    append_bytes(&tiff, "II");
    append_u16le(&tiff, 42);
    append_u32le(&tiff, 8);

    // IFD0 (8) -> IFD1 (14) -> IFD2 (20), all empty.
    append_u16le(&tiff, 0);
    append_u32le(&tiff, 14);
    append_u16le(&tiff, 0);
    append_u32le(&tiff, 20);
    append_u16le(&tiff, 0);
    append_u32le(&tiff, 0);

    ExifDict dict;
    const ExifDecodeResult res = decode_exif_tiff(tiff, &dict, {});
    EXPECT_EQ(res.status, ExifDecodeStatus::Unsupported);
    EXPECT_EQ(res.ifds_decoded, 2U);
}


TEST(ExifTiffDecode, RecordsMakerNoteOffset)
{
    std::vector<std::byte> tiff;
    append_bytes(&tiff, "II");
    append_u16le(&tiff, 42);
    append_u32le(&tiff, 8);

    // IFD0 (8): ExifIFDPointer -> 26.
    append_u16le(&tiff, 1);
    append_u16le(&tiff, 0x8769);
    append_u16le(&tiff, 4);
    append_u32le(&tiff, 1);
    append_u32le(&tiff, 26);
    append_u32le(&tiff, 0);

    // ExifIFD (26): MakerNote UNDEFINED[6] at 44.
    append_u16le(&tiff, 1);
    append_u16le(&tiff, 0x927C);
    append_u16le(&tiff, 7);
    append_u32le(&tiff, 6);
    append_u32le(&tiff, 44);
    append_u32le(&tiff, 0);

    EXPECT_EQ(tiff.size(), 44U);
    append_bytes(&tiff, "Nikon");
    tiff.push_back(std::byte { 0 });

    ExifDict dict;
    EXPECT_EQ(decode_exif_tiff(tiff, &dict, {}).status, ExifDecodeStatus::Ok);
    EXPECT_EQ(dict.maker_note_offset, 44U);
    ASSERT_NE(find_tag(dict, kExifIfd, kTagMakerNote), nullptr);
}

}  // namespace exifnote

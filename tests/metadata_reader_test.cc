#include "exifnote/metadata_reader.h"

#include "exifnote/comment_codec.h"
#include "exifnote/metadata_writer.h"
#include "support/jpeg_fixture.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace exifnote {
namespace {

    using test::append_bytes;
    using test::make_dated_dict;
    using test::make_jpeg;
    using test::make_jpeg_with_exif;

    class FakeCodec final : public ExifCodec {
    public:
        ExifDict dict;
        ExifCodecStatus parse_status = ExifCodecStatus::Ok;
        size_t last_parse_size       = 0;
        uint32_t parse_calls         = 0;

        ExifCodecStatus parse(std::span<const std::byte> bytes,
                              ExifDict* out, ExifParseMode) noexcept override
        {
            parse_calls += 1;
            last_parse_size = bytes.size();
            if (parse_status != ExifCodecStatus::Ok) {
                return parse_status;
            }
            *out = dict;
            return ExifCodecStatus::Ok;
        }

        ExifCodecStatus dump(const ExifDict&,
                             std::vector<std::byte>*) noexcept override
        {
            return ExifCodecStatus::Unsupported;
        }
    };

    class RecordingSink final : public DiagnosticSink {
    public:
        std::vector<DiagnosticLevel> levels;
        std::vector<std::string> subjects;
        std::vector<std::string> messages;

        void on_diagnostic(const Diagnostic& diag) noexcept override
        {
            levels.push_back(diag.level);
            subjects.emplace_back(diag.subject);
            messages.emplace_back(diag.message);
        }
    };

    class FakeSource final : public ByteSource {
    public:
        std::vector<std::byte> bytes;
        MappedFileStatus status = MappedFileStatus::Ok;
        uint64_t last_max_bytes = 0;

        MappedFileStatus read_prefix(const char*, uint64_t max_bytes,
                                     std::vector<std::byte>* out) noexcept
            override
        {
            last_max_bytes = max_bytes;
            if (status != MappedFileStatus::Ok) {
                return status;
            }
            *out = bytes;
            return MappedFileStatus::Ok;
        }
    };

    static std::string prefixed(std::string_view text)
    {
        return std::string(kAsciiCharsetPrefix) + std::string(text);
    }

}  // namespace

TEST(MetadataReader, NormalizeDateTaken)
{
    EXPECT_EQ(normalize_date_taken("2021:07:04 10:00:00"), "2021-07-04");
    EXPECT_EQ(normalize_date_taken("2021:07:04"), "2021-07-04");
    EXPECT_EQ(normalize_date_taken(""), "");
    EXPECT_EQ(normalize_date_taken(" 10:00"), "");
}


TEST(MetadataReader, ReadsDateAndAnnotationFromCodec)
{
    FakeCodec codec;
    codec.dict = make_dated_dict();
    ifd_or_empty(codec.dict, kExifIfd)[kTagUserComment] = make_bytes_value(
        prefixed("OriginalFilename: IMG_0001.jpg"));

    const std::vector<std::byte> bytes(16);
    const ExtractResult res = extract_exif_summary_checked(bytes, codec);
    EXPECT_EQ(res.status, ExtractStatus::Ok);
    EXPECT_EQ(res.summary.date_taken, "2021-07-04");
    EXPECT_EQ(res.summary.original_file_name, "IMG_0001.jpg");
}


TEST(MetadataReader, MissingTagsAreEmpty)
{
    FakeCodec codec;
    RecordingSink sink;
    const std::vector<std::byte> bytes(16);

    const ExifSummary s = extract_exif_summary(bytes, codec, sink);
    EXPECT_EQ(s.date_taken, "");
    EXPECT_EQ(s.original_file_name, "");
    EXPECT_TRUE(sink.messages.empty());
}


TEST(MetadataReader, NonTextDateIsIgnored)
{
    FakeCodec codec;
    ifd_or_empty(codec.dict, kExifIfd)[kTagDateTimeOriginal] = make_u32_value(
        20210704U);
    const std::vector<std::byte> bytes(16);

    const ExtractResult res = extract_exif_summary_checked(bytes, codec);
    EXPECT_EQ(res.status, ExtractStatus::Ok);
    EXPECT_EQ(res.summary.date_taken, "");
}


TEST(MetadataReader, UnprefixedCommentIsSearched)
{
    FakeCodec codec;
    ifd_or_empty(codec.dict, kExifIfd)[kTagUserComment] = make_text_value(
        "first line\nOriginalFilename:   spaced name.jpg  ");
    const std::vector<std::byte> bytes(16);

    const ExtractResult res = extract_exif_summary_checked(bytes, codec);
    EXPECT_EQ(res.summary.original_file_name, "spaced name.jpg");
}


TEST(MetadataReader, ParseFailureIsFlattenedWithOneWarning)
{
    FakeCodec codec;
    codec.parse_status = ExifCodecStatus::Malformed;
    RecordingSink sink;
    const std::vector<std::byte> bytes(16);

    const ExifSummary s = extract_exif_summary(bytes, codec, sink);
    EXPECT_EQ(s.date_taken, "");
    EXPECT_EQ(s.original_file_name, "");
    ASSERT_EQ(sink.messages.size(), 1U);
    EXPECT_EQ(sink.levels[0], DiagnosticLevel::Warning);
    EXPECT_NE(sink.messages[0].find("malformed"), std::string::npos);

    const ExtractResult res = extract_exif_summary_checked(bytes, codec);
    EXPECT_EQ(res.status, ExtractStatus::Malformed);
}


TEST(MetadataReader, BoundsInputToHeaderWindow)
{
    FakeCodec codec;
    const std::vector<std::byte> bytes(200000);

    (void)extract_exif_summary_checked(bytes, codec);
    EXPECT_EQ(codec.last_parse_size, 65536U);

    ExtractOptions options;
    options.header_window_bytes = 100;
    (void)extract_exif_summary_checked(bytes, codec, options);
    EXPECT_EQ(codec.last_parse_size, 100U);

    const std::vector<std::byte> small(10);
    (void)extract_exif_summary_checked(small, codec);
    EXPECT_EQ(codec.last_parse_size, 10U);
}


TEST(MetadataReader, NonJpegInputYieldsEmptySummary)
{
    JpegExifCodec codec;
    RecordingSink sink;
    std::vector<std::byte> bytes;
    append_bytes(&bytes, "this is not a jpeg");

    const ExifSummary s = extract_exif_summary(bytes, codec, sink);
    EXPECT_EQ(s.date_taken, "");
    EXPECT_EQ(s.original_file_name, "");
    EXPECT_EQ(sink.messages.size(), 1U);

    sink.messages.clear();
    const ExifSummary e = extract_exif_summary({}, codec, sink);
    EXPECT_EQ(e.date_taken, "");
    EXPECT_EQ(sink.messages.size(), 1U);
}


TEST(MetadataReader, JpegWithoutExifIsNotAnError)
{
    JpegExifCodec codec;
    const std::vector<std::byte> jpeg = make_jpeg({});

    const ExtractResult res = extract_exif_summary_checked(jpeg, codec);
    EXPECT_EQ(res.status, ExtractStatus::Ok);
    EXPECT_EQ(res.summary.date_taken, "");
    EXPECT_EQ(res.summary.original_file_name, "");
}


TEST(MetadataReader, RoundTripThroughWriterAndRealJpeg)
{
    ExifDict dict = make_dated_dict();
    encode_original_filename("IMG_0001.jpg", dict);
    const std::vector<std::byte> jpeg = make_jpeg_with_exif(dict);

    JpegExifCodec codec;
    const ExtractResult res = extract_exif_summary_checked(jpeg, codec);
    EXPECT_EQ(res.status, ExtractStatus::Ok);
    EXPECT_EQ(res.summary.date_taken, "2021-07-04");
    EXPECT_EQ(res.summary.original_file_name, "IMG_0001.jpg");
}


TEST(MetadataReader, ExifReadWhenWindowCutsLaterData)
{
    ExifDict dict = make_dated_dict();
    encode_original_filename("a.jpg", dict);
    std::vector<std::byte> jpeg = make_jpeg_with_exif(dict);
    // Pad the scan so the window ends inside entropy-coded data.
    jpeg.insert(jpeg.end() - 2, 100000, std::byte { 0x11 });

    JpegExifCodec codec;
    const ExtractResult res = extract_exif_summary_checked(jpeg, codec);
    EXPECT_EQ(res.status, ExtractStatus::Ok);
    EXPECT_EQ(res.summary.original_file_name, "a.jpg");
}


TEST(MetadataReader, WindowCuttingExifSegmentFailsGracefully)
{
    ExifDict dict = make_dated_dict();
    encode_original_filename("a.jpg", dict);
    const std::vector<std::byte> jpeg = make_jpeg_with_exif(dict);

    JpegExifCodec codec;
    RecordingSink sink;
    ExtractOptions options;
    options.header_window_bytes = 40;
    const ExifSummary s = extract_exif_summary(jpeg, codec, sink, options);
    EXPECT_EQ(s.date_taken, "");
    EXPECT_EQ(s.original_file_name, "");
    EXPECT_EQ(sink.messages.size(), 1U);
}


TEST(MetadataReader, FromFileReportsReadFailure)
{
    FakeSource source;
    source.status = MappedFileStatus::OpenFailed;
    FakeCodec codec;
    RecordingSink sink;

    const ExtractResult res = extract_exif_summary_from_file(
        "/missing.jpg", source, codec, sink);
    EXPECT_EQ(res.status, ExtractStatus::ReadFailed);
    EXPECT_EQ(res.summary.date_taken, "");
    EXPECT_EQ(codec.parse_calls, 0U);
    ASSERT_EQ(sink.subjects.size(), 1U);
    EXPECT_EQ(sink.subjects[0], "/missing.jpg");
}


TEST(MetadataReader, FromFileUsesWindow)
{
    FakeSource source;
    source.bytes.resize(32);
    FakeCodec codec;
    codec.dict = make_dated_dict("2020:01:02 03:04:05");
    RecordingSink sink;
    ExtractOptions options;
    options.header_window_bytes = 1234;

    const ExtractResult res = extract_exif_summary_from_file(
        "x.jpg", source, codec, sink, options);
    EXPECT_EQ(res.status, ExtractStatus::Ok);
    EXPECT_EQ(res.summary.date_taken, "2020-01-02");
    EXPECT_EQ(source.last_max_bytes, 1234U);
    EXPECT_TRUE(sink.messages.empty());
}

}  // namespace exifnote

#include <gtest/gtest.h>

#include <limits>

#include "extensions/capture_time.hpp"
#include "test_helpers.hpp"

using copysort::extensions::CaptureTime;
using copysort::extensions::parse_exif_datetime;
using copysort::infra::ErrorCode;

TEST(CaptureTimeTest, ParsesExifDateTime)
{
    auto parsed = parse_exif_datetime("2023:05:10 10:00:00");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->year(), 2023);
    EXPECT_EQ(parsed->month(), 5u);
    EXPECT_EQ(parsed->day(), 10u);
    EXPECT_EQ(*parsed, CaptureTime::from_civil(2023, 5, 10, 10, 0, 0));
}

TEST(CaptureTimeTest, ToleratesTrailingPaddingFromCameras)
{
    using namespace std::string_view_literals;
    auto parsed = parse_exif_datetime("2019:12:31 23:59:59\0"sv);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->day(), 31u);
}

TEST(CaptureTimeTest, RejectsMalformedValues)
{
    for (const char* bad : {"", "2023-05-10 10:00:00", "2023:05:10", "    :  :     :  :  ",
                            "0000:00:00 00:00:00", "2023:02:30 10:00:00", "2023:05:10 25:00:00",
                            "2023:05:1x 10:00:00"}) {
        auto parsed = parse_exif_datetime(bad);
        ASSERT_FALSE(parsed) << bad;
        EXPECT_EQ(parsed.error().code, ErrorCode::NoMetadata) << bad;
    }
}

TEST(CaptureTimeTest, LocalTimeOfModificationStamp)
{
    const auto when = copysort::testing::local_noon(2021, 1, 2);
    const auto local = copysort::extensions::to_local_time(when);
    EXPECT_EQ(local.year(), 2021);
    EXPECT_EQ(local.month(), 1u);
    EXPECT_EQ(local.day(), 2u);
}

TEST(CaptureTimeTest, UnrepresentableStampStillGivesValidDate)
{
    const std::timespec huge{std::numeric_limits<std::time_t>::max(), 0};
    const auto local = copysort::extensions::to_local_time(huge);
    EXPECT_TRUE(local.date().ok());
    EXPECT_EQ(local, CaptureTime::from_civil(1970, 1, 1));
}

TEST(CaptureTimeTest, Exiv2ReadsDateTimeOriginal)
{
    copysort::testing::TempDir dir;
    const auto photo = dir / "IMG_0001.jpg";
    copysort::testing::write_file(photo, copysort::testing::make_exif_jpeg("2023:05:10 10:00:00"));

    copysort::extensions::Exiv2CaptureTimeExtractor extractor;
    auto when = extractor.extract(photo);
    ASSERT_TRUE(when) << when.error().message;
    EXPECT_EQ(*when, CaptureTime::from_civil(2023, 5, 10, 10, 0, 0));
}

TEST(CaptureTimeTest, Exiv2FailsOnFileWithoutImageData)
{
    copysort::testing::TempDir dir;
    const auto fake = dir / "not_a_photo.jpg";
    copysort::testing::write_file(fake, "this is plain text");

    copysort::extensions::Exiv2CaptureTimeExtractor extractor;
    EXPECT_FALSE(extractor.extract(fake));
}

TEST(CaptureTimeTest, Exiv2FailsOnMissingFile)
{
    copysort::testing::TempDir dir;
    copysort::extensions::Exiv2CaptureTimeExtractor extractor;
    EXPECT_FALSE(extractor.extract(dir / "gone.jpg"));
}

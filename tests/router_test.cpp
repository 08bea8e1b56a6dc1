#include <gtest/gtest.h>

#include <stdexcept>

#include "core/router/router.hpp"
#include "test_helpers.hpp"

using copysort::core::FileClass;
using copysort::core::Router;
using copysort::core::classify;
using copysort::extensions::CaptureTime;
using copysort::infra::ErrorCode;

namespace {

// Возвращает заданную дату и считает вызовы
class FakeExtractor final : public copysort::extensions::CaptureTimeExtractor {
public:
    explicit FakeExtractor(std::optional<CaptureTime> when) : when_(when) {}

    auto extract(const std::filesystem::path&) const
        -> copysort::infra::Result<CaptureTime> override
    {
        ++calls;
        if (!when_) {
            return std::unexpected(copysort::infra::make_error(ErrorCode::NoMetadata, "none"));
        }
        return *when_;
    }

    mutable int calls = 0;

private:
    std::optional<CaptureTime> when_;
};

class ThrowingExtractor final : public copysort::extensions::CaptureTimeExtractor {
public:
    auto extract(const std::filesystem::path&) const
        -> copysort::infra::Result<CaptureTime> override
    {
        throw std::runtime_error("corrupt");
    }
};

} // namespace

TEST(RouterTest, ClassifiesByLowerCasedExtension)
{
    for (const char* name : {"a.jpg", "a.JPG", "a.jpeg", "a.Jpeg", "a.mp4", "a.MOV", "a.avi", "a.3gp"}) {
        EXPECT_EQ(classify(name), FileClass::Media) << name;
    }
    for (const char* name : {"a.png", "a.PNG", "a.webp", "a.gif", "dir/b.GiF"}) {
        EXPECT_EQ(classify(name), FileClass::Excluded) << name;
    }
    for (const char* name : {"a.txt", "Makefile", "a.jpg.bak", ".jpg", "a.heic", "a."}) {
        EXPECT_EQ(classify(name), FileClass::Other) << name;
    }
}

TEST(RouterTest, DatedDestinationIsZeroPadded)
{
    const auto dest = copysort::core::dated_destination(
        "/dest", CaptureTime::from_civil(2023, 5, 1, 10, 0, 0), "IMG_1.jpg");
    EXPECT_EQ(dest, std::filesystem::path("/dest/sorted_photos/2023/05/01/IMG_1.jpg"));
}

TEST(RouterTest, MediaUsesCaptureTime)
{
    FakeExtractor extractor{CaptureTime::from_civil(2023, 5, 10, 10, 0, 0)};
    Router router{"/dest", extractor};

    const auto mtime = copysort::testing::local_noon(2021, 1, 2);
    auto dest = router.destination_for("/src/camera/IMG_1.jpg", "camera/IMG_1.jpg", mtime);
    ASSERT_TRUE(dest);
    EXPECT_EQ(*dest, std::filesystem::path("/dest/sorted_photos/2023/05/10/IMG_1.jpg"));
    EXPECT_EQ(extractor.calls, 1);
}

TEST(RouterTest, MediaFallsBackToModificationTime)
{
    FakeExtractor extractor{std::nullopt};
    Router router{"/dest", extractor};

    const auto mtime = copysort::testing::local_noon(2021, 1, 2);
    auto dest = router.destination_for("/src/clips/VID.MOV", "clips/VID.MOV", mtime);
    ASSERT_TRUE(dest);
    EXPECT_EQ(*dest, std::filesystem::path("/dest/sorted_photos/2021/01/02/VID.MOV"));
}

TEST(RouterTest, ThrowingExtractorFallsBackToModificationTime)
{
    ThrowingExtractor extractor;
    Router router{"/dest", extractor};

    const auto mtime = copysort::testing::local_noon(2021, 1, 2);
    std::optional<std::filesystem::path> dest;
    ASSERT_NO_THROW(dest = router.destination_for("/src/IMG.jpg", "IMG.jpg", mtime));
    ASSERT_TRUE(dest);
    EXPECT_EQ(*dest, std::filesystem::path("/dest/sorted_photos/2021/01/02/IMG.jpg"));
}

TEST(RouterTest, OtherKeepsRelativePathWithoutExtraction)
{
    FakeExtractor extractor{CaptureTime::from_civil(2023, 5, 10)};
    Router router{"/dest", extractor};

    auto dest = router.destination_for("/src/docs/notes.txt", "docs/notes.txt",
                                       copysort::testing::local_noon(2020, 1, 1));
    ASSERT_TRUE(dest);
    EXPECT_EQ(*dest, std::filesystem::path("/dest/docs/notes.txt"));
    EXPECT_EQ(extractor.calls, 0);
}

TEST(RouterTest, ExcludedHasNoDestination)
{
    FakeExtractor extractor{CaptureTime::from_civil(2023, 5, 10)};
    Router router{"/dest", extractor};

    EXPECT_FALSE(router.destination_for("/src/a/shot.png", "a/shot.png",
                                        copysort::testing::local_noon(2020, 1, 1)));
    EXPECT_EQ(extractor.calls, 0);
}

TEST(RouterTest, SameBasenameCollidesInDatedBucket)
{
    FakeExtractor extractor{CaptureTime::from_civil(2022, 7, 4)};
    Router router{"/dest", extractor};
    const auto mtime = copysort::testing::local_noon(2020, 1, 1);

    auto first = router.destination_for("/src/a/IMG.jpg", "a/IMG.jpg", mtime);
    auto second = router.destination_for("/src/b/IMG.jpg", "b/IMG.jpg", mtime);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, *second);
}

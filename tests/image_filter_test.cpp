#include "image_filter.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace vetscan;

namespace {

constexpr std::size_t kPhotoBytes = 64 * 1024;

RawImageCandidate candidate(const std::size_t page, const std::size_t index, const std::uint8_t content,
                            const std::size_t width = 800, const std::size_t height = 600,
                            const std::size_t bytes = kPhotoBytes) {
    RawImageCandidate c;
    c.page_number = page;
    c.index_on_page = index;
    c.width = width;
    c.height = height;
    c.format = ImageFormat::Jpeg;
    c.bytes.resize(bytes);
    for (std::size_t i = 0; i < bytes; ++i) {
        c.bytes[i] = static_cast<std::uint8_t>((i * 31 + content * 131 + i / 97) & 0xFF);
    }
    return c;
}

} // namespace

TEST(ImageFilterTest, RepetitionThresholdFollowsPageCount) {
    const ImageFilterConfig config;
    EXPECT_EQ(repetition_threshold(1, config), 2u);
    EXPECT_EQ(repetition_threshold(6, config), 2u);
    EXPECT_EQ(repetition_threshold(9, config), 2u);
    EXPECT_EQ(repetition_threshold(10, config), 3u);
    EXPECT_EQ(repetition_threshold(20, config), 6u);
}

TEST(ImageFilterTest, LetterheadOnEveryPageIsDropped) {
    std::vector<RawImageCandidate> images;
    for (std::size_t page = 0; page < 6; ++page) {
        images.push_back(candidate(page, 0, 1)); // letterhead
    }
    images.push_back(candidate(2, 1, 2));
    images.push_back(candidate(4, 1, 3));

    const auto kept = filter_images(std::move(images), 6, ImageFilterConfig{});
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].page_number, 2u);
    EXPECT_EQ(kept[0].index_on_page, 1u);
    EXPECT_EQ(kept[1].page_number, 4u);
}

TEST(ImageFilterTest, RepeatedBelowThresholdKeepsFirstOccurrence) {
    // 20 pages: threshold 6, so an image on 5 pages is content
    std::vector<RawImageCandidate> images;
    for (const std::size_t page : {17u, 3u, 9u, 12u, 5u}) {
        images.push_back(candidate(page, 0, 7));
    }

    const auto kept = filter_images(std::move(images), 20, ImageFilterConfig{});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].page_number, 3u);
}

TEST(ImageFilterTest, DuplicateOnOnePageCountsOnce) {
    // twice on the same page is one page; below the threshold of 2
    std::vector<RawImageCandidate> images = {candidate(0, 0, 4), candidate(0, 1, 4)};
    const auto kept = filter_images(std::move(images), 6, ImageFilterConfig{});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].index_on_page, 0u);
}

TEST(ImageFilterTest, SurvivorsAreOrderedByPageThenIndex) {
    std::vector<RawImageCandidate> images = {candidate(3, 1, 10), candidate(0, 2, 11), candidate(3, 0, 12),
                                             candidate(1, 0, 13)};
    const auto kept = filter_images(std::move(images), 4, ImageFilterConfig{});
    ASSERT_EQ(kept.size(), 4u);
    EXPECT_TRUE(std::ranges::is_sorted(kept, [](const auto& a, const auto& b) {
        return std::pair(a.page_number, a.index_on_page) < std::pair(b.page_number, b.index_on_page);
    }));
}

TEST(ImageFilterTest, GeometryRejections) {
    const ImageFilterConfig config;

    EXPECT_FALSE(geometry_rejection(candidate(0, 0, 1), config).has_value());

    const auto small = geometry_rejection(candidate(0, 0, 1, 300, 300), config);
    ASSERT_TRUE(small.has_value());
    EXPECT_NE(small->find("too small"), std::string::npos);

    const auto light = geometry_rejection(candidate(0, 0, 1, 800, 600, 1024), config);
    ASSERT_TRUE(light.has_value());
    EXPECT_NE(light->find("file too small"), std::string::npos);

    const auto strip = geometry_rejection(candidate(0, 0, 1, 4000, 400), config);
    ASSERT_TRUE(strip.has_value());
    EXPECT_NE(strip->find("strip"), std::string::npos);
}

TEST(ImageFilterTest, SmallSquareImageIsAnIcon) {
    ImageFilterConfig config;
    config.min_image_width = 0;
    config.min_image_height = 0;
    config.min_image_bytes = 0;

    EXPECT_EQ(geometry_rejection(candidate(0, 0, 1, 200, 190, 100), config), std::optional<std::string>("icon"));
    EXPECT_FALSE(geometry_rejection(candidate(0, 0, 1, 200, 120, 100), config).has_value());
    EXPECT_FALSE(geometry_rejection(candidate(0, 0, 1, 512, 512, 100), config).has_value());
}

TEST(ImageFilterTest, SignatureDistinguishesContent) {
    const auto a = candidate(0, 0, 1);
    const auto b = candidate(0, 0, 2);
    EXPECT_EQ(signature_of(a.bytes), signature_of(candidate(5, 3, 1).bytes));
    EXPECT_NE(signature_of(a.bytes), signature_of(b.bytes));
    EXPECT_EQ(signature_of(a.bytes).length, kPhotoBytes);
}

TEST(ImageFilterTest, NothingInNothingOut) {
    EXPECT_TRUE(filter_images({}, 3, ImageFilterConfig{}).empty());
}

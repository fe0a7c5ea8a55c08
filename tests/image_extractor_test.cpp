#include "image_extractor.hpp"
#include "errors.hpp"
#include "pdf_fixtures.hpp"
#include <gtest/gtest.h>
#include <stop_token>

using namespace vetscan;

namespace {

constexpr std::size_t kMaxBytes = 20 * 1024 * 1024;

PdfDocument load(test::PdfBuilder& builder) {
    return PdfDocument::load(builder.bytes(), kMaxBytes);
}

} // namespace

class ImageExtractorTest : public ::testing::Test {
protected:
    DecoderRegistry registry_;
    ImageExtractor extractor_{registry_, 0};
    std::stop_source stop_;
};

TEST_F(ImageExtractorTest, ImagesComeInDrawingOrder) {
    test::PdfBuilder builder;
    const auto page = builder.add_page();
    // registered in one order, drawn in another
    builder.add_resource(page, "/A", builder.gray_image(10, 10, 1));
    builder.add_resource(page, "/B", builder.jpeg_image(20, 20, 2));
    builder.add_resource(page, "/C", builder.jpx_image(30, 30));
    builder.add_content(page, "q /C Do Q q /A Do Q q /B Do Q\n");
    const auto doc = load(builder);

    const auto images = extractor_.extract_page(doc, 0, stop_.get_token());
    ASSERT_EQ(images.candidates.size(), 3u);
    EXPECT_TRUE(images.skipped.empty());

    EXPECT_EQ(images.candidates[0].width, 30u);
    EXPECT_EQ(images.candidates[0].format, ImageFormat::Jpeg2000);
    EXPECT_EQ(images.candidates[1].width, 10u);
    EXPECT_EQ(images.candidates[1].format, ImageFormat::Png);
    EXPECT_EQ(images.candidates[2].width, 20u);
    EXPECT_EQ(images.candidates[2].format, ImageFormat::Jpeg);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(images.candidates[i].index_on_page, i);
        EXPECT_EQ(images.candidates[i].page_number, 0u);
    }
}

TEST_F(ImageExtractorTest, UndrawnResourcesAreIgnored) {
    test::PdfBuilder builder;
    const auto page = builder.add_page();
    builder.add_resource(page, "/Unused", builder.gray_image(10, 10, 1));
    builder.draw(page, "/Used", builder.gray_image(12, 12, 2));
    const auto doc = load(builder);

    const auto images = extractor_.extract_page(doc, 0, stop_.get_token());
    ASSERT_EQ(images.candidates.size(), 1u);
    EXPECT_EQ(images.candidates[0].width, 12u);
}

TEST_F(ImageExtractorTest, FormsAreFollowed) {
    test::PdfBuilder builder;
    const auto page = builder.add_page();
    auto inner = builder.form({{"/Deep", builder.gray_image(8, 8, 3)}});
    builder.draw(page, "/Fm0", builder.form({{"/Im0", builder.gray_image(16, 16, 1)}, {"/Fm1", inner}}));
    builder.draw(page, "/Im9", builder.gray_image(24, 24, 2));
    const auto doc = load(builder);

    const auto images = extractor_.extract_page(doc, 0, stop_.get_token());
    ASSERT_EQ(images.candidates.size(), 3u);
    EXPECT_EQ(images.candidates[0].width, 16u);
    EXPECT_EQ(images.candidates[1].width, 8u);
    EXPECT_EQ(images.candidates[2].width, 24u);
}

TEST_F(ImageExtractorTest, FormWithoutResourcesUsesThePageResources) {
    test::PdfBuilder builder;
    const auto page = builder.add_page();
    builder.add_resource(page, "/Shared", builder.gray_image(14, 14, 4));
    builder.draw(page, "/Fm0", builder.form({{"/Shared", builder.gray_image(1, 1, 0)}}, false));
    const auto doc = load(builder);

    const auto images = extractor_.extract_page(doc, 0, stop_.get_token());
    ASSERT_EQ(images.candidates.size(), 1u);
    EXPECT_EQ(images.candidates[0].width, 14u);
}

TEST_F(ImageExtractorTest, SelfDrawingFormTerminates) {
    test::PdfBuilder builder;
    const auto page = builder.add_page();
    builder.draw(page, "/Loop", builder.self_drawing_form());
    builder.draw(page, "/Im0", builder.gray_image(10, 10, 1));
    const auto doc = load(builder);

    const auto images = extractor_.extract_page(doc, 0, stop_.get_token());
    ASSERT_EQ(images.candidates.size(), 1u);
    EXPECT_EQ(images.candidates[0].width, 10u);
}

TEST_F(ImageExtractorTest, MalformedImageIsSkippedAndOthersSurvive) {
    test::PdfBuilder builder;
    for (int i = 0; i < 4; ++i) {
        builder.add_page();
    }
    builder.draw(2, "/Bad", builder.broken_jpeg_image(40, 40));
    builder.draw(2, "/Good", builder.gray_image(40, 40, 5));
    const auto doc = load(builder);

    const auto images = extractor_.extract_page(doc, 2, stop_.get_token());
    ASSERT_EQ(images.skipped.size(), 1u);
    EXPECT_EQ(images.skipped[0].index_on_page, 0u);
    EXPECT_FALSE(images.skipped[0].reason.empty());
    ASSERT_EQ(images.candidates.size(), 1u);
    EXPECT_EQ(images.candidates[0].index_on_page, 1u);
    EXPECT_EQ(images.candidates[0].page_number, 2u);
}

TEST_F(ImageExtractorTest, SmallImagesAreDroppedButKeepTheirIndex) {
    test::PdfBuilder builder;
    const auto page = builder.add_page();
    builder.draw(page, "/Tiny", builder.gray_image(10, 10, 1));
    builder.draw(page, "/Big", builder.gray_image(120, 100, 2));
    const auto doc = load(builder);

    const ImageExtractor strict(registry_, 10000);
    const auto images = strict.extract_page(doc, 0, stop_.get_token());
    EXPECT_TRUE(images.skipped.empty());
    ASSERT_EQ(images.candidates.size(), 1u);
    EXPECT_EQ(images.candidates[0].width, 120u);
    EXPECT_EQ(images.candidates[0].index_on_page, 1u);
}

TEST_F(ImageExtractorTest, PageWithoutImagesYieldsNothing) {
    const auto doc = PdfDocument::load(test::blank_pdf(2), kMaxBytes);
    const auto images = extractor_.extract_page(doc, 1, stop_.get_token());
    EXPECT_EQ(images.page_number, 1u);
    EXPECT_TRUE(images.candidates.empty());
    EXPECT_TRUE(images.skipped.empty());
}

TEST_F(ImageExtractorTest, StoppedWalkThrowsCancelled) {
    test::PdfBuilder builder;
    const auto page = builder.add_page();
    builder.draw(page, "/Im0", builder.gray_image(10, 10, 1));
    const auto doc = load(builder);

    stop_.request_stop();
    EXPECT_THROW((void)extractor_.extract_page(doc, 0, stop_.get_token()), CancelledError);
}

TEST_F(ImageExtractorTest, PageOutsideDocumentIsRejected) {
    const auto doc = PdfDocument::load(test::blank_pdf(2), kMaxBytes);
    EXPECT_THROW((void)extractor_.extract_page(doc, 2, stop_.get_token()), std::out_of_range);
}

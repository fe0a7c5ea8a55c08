#include "pdf_document.hpp"
#include "errors.hpp"
#include "pdf_fixtures.hpp"
#include "qpdf_session.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace vetscan;

namespace {

constexpr std::size_t kMaxBytes = 20 * 1024 * 1024;

std::vector<std::uint8_t> to_bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

TEST(PdfDocumentTest, LoadCountsPages) {
    const auto doc = PdfDocument::load(test::blank_pdf(5), kMaxBytes);
    EXPECT_EQ(doc.page_count(), 5u);
    EXPECT_GT(doc.byte_length(), 0u);
}

TEST(PdfDocumentTest, EmptyInputIsRejected) {
    EXPECT_THROW((void)PdfDocument::load({}, kMaxBytes), InvalidDocumentError);
}

TEST(PdfDocumentTest, OversizedInputIsRejected) {
    auto bytes = test::blank_pdf(1);
    EXPECT_THROW((void)PdfDocument::load(bytes, bytes.size() - 1), InvalidDocumentError);
}

TEST(PdfDocumentTest, MissingSignatureIsRejected) {
    EXPECT_THROW((void)PdfDocument::load(to_bytes("PK\x03\x04 definitely a zip"), kMaxBytes),
                 InvalidDocumentError);
}

TEST(PdfDocumentTest, UnparsableBodyIsRejected) {
    EXPECT_THROW((void)PdfDocument::load(to_bytes("%PDF-1.7\nnothing else here\n"), kMaxBytes),
                 InvalidDocumentError);
}

TEST(PdfDocumentTest, ZeroPageDocumentIsRejected) {
    EXPECT_THROW((void)PdfDocument::load(test::blank_pdf(0), kMaxBytes), InvalidDocumentError);
}

TEST(PdfDocumentTest, ExtractPagesProducesStandaloneChunk) {
    test::PdfBuilder builder;
    for (int i = 0; i < 6; ++i) {
        const auto page = builder.add_page();
        builder.draw(page, "/Im0", builder.gray_image(10 + i, 10, static_cast<std::uint8_t>(i)));
    }
    const auto doc = PdfDocument::load(builder.bytes(), kMaxBytes);

    const auto chunk = doc.extract_pages({2, 5});
    QpdfSession session(chunk, "chunk", "test");
    auto pages = session.pdf().getAllPages();
    ASSERT_EQ(pages.size(), 3u);

    // the first page of the chunk is page 2 of the source, whose image is 12 pixels wide
    auto image = pages[0].getKey("/Resources").getKey("/XObject").getKey("/Im0");
    EXPECT_EQ(image.getDict().getKey("/Width").getIntValue(), 12);
}

TEST(PdfDocumentTest, ExtractPagesRejectsRangesOutsideTheDocument) {
    const auto doc = PdfDocument::load(test::blank_pdf(3), kMaxBytes);
    EXPECT_THROW((void)doc.extract_pages({2, 4}), std::out_of_range);
    EXPECT_THROW((void)doc.extract_pages({1, 1}), std::out_of_range);
}

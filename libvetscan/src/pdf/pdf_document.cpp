#include "../../include/pdf_document.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/qpdf_session.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <algorithm>
#include <stdexcept>
#include <string_view>

namespace {

constexpr std::string_view kPdfMagic = "%PDF-";
constexpr std::string_view kPdfMime = "application/pdf";

bool has_pdf_signature(const std::span<const std::uint8_t> bytes) {
    return bytes.size() >= kPdfMagic.size() &&
           std::equal(kPdfMagic.begin(), kPdfMagic.end(), bytes.begin(),
                      [](const char a, const std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; });
}

} // namespace

namespace vetscan {

PdfDocument PdfDocument::load(std::vector<std::uint8_t> bytes, const std::size_t max_bytes) {
    if (bytes.empty()) {
        throw InvalidDocumentError("File is empty");
    }
    if (bytes.size() > max_bytes) {
        throw InvalidDocumentError("File exceeds maximum size of " +
                                   std::to_string(max_bytes / (1024 * 1024)) + "MB");
    }
    if (!has_pdf_signature(bytes)) {
        throw InvalidDocumentError("File does not appear to be a valid PDF");
    }
    if (const auto mime = MimeDetector::detect(bytes); !mime.empty() && mime != kPdfMime) {
        throw InvalidDocumentError("Invalid file type: " + mime + ". Only PDF files are accepted.");
    }

    auto shared = std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes));
    std::size_t pages = 0;
    try {
        QpdfSession session(*shared, "input document", "pdf_document");
        pages = session.pdf().getAllPages().size();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("qpdf rejected document: ") + e.what(), "pdf_document");
        throw InvalidDocumentError(std::string("File could not be parsed as PDF: ") + e.what());
    }
    if (pages == 0) {
        throw InvalidDocumentError("document has no pages");
    }

    Logger::log(LogLevel::Debug,
                "Validated PDF: " + std::to_string(shared->size()) + " bytes, " + std::to_string(pages) + " pages",
                "pdf_document");
    return {std::move(shared), pages};
}

std::vector<std::uint8_t> PdfDocument::extract_pages(const ChunkRange& range) const {
    if (range.start_page >= range.end_page || range.end_page > page_count_) {
        throw std::out_of_range("page range " + range.to_string() + " outside document of " +
                                std::to_string(page_count_) + " pages");
    }

    QpdfSession source(*bytes_, "chunk source", "pdf_document");
    QpdfSession chunk("pdf_document");
    chunk.pdf().emptyPDF();

    const auto pages = QPDFPageDocumentHelper(source.pdf()).getAllPages();
    QPDFPageDocumentHelper dest(chunk.pdf());
    for (std::size_t p = range.start_page; p < range.end_page; ++p) {
        // foreign pages are copied (with their resources) by addPage
        dest.addPage(pages[p], false);
    }

    QPDFWriter writer(chunk.pdf());
    writer.setOutputMemory();
    writer.setDeterministicID(true);
    writer.write();

    const std::shared_ptr<Buffer> buf = writer.getBufferSharedPointer();
    return {buf->getBuffer(), buf->getBuffer() + buf->getSize()};
}

} // namespace vetscan

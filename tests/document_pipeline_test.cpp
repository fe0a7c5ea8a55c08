#include "document_pipeline.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "pdf_fixtures.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

using namespace vetscan;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Scripted OCR backend: page N reads "página N", page 0 carries the
 * report header. A chunk can be told to fail transiently a few times first.
 */
class FakeOcr final : public IOcrAdapter {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "fake"; }
    [[nodiscard]] PageNumbering numbering() const noexcept override { return PageNumbering::ChunkLocal; }

    std::vector<PageText> extract_text(const OcrRequest& request, std::stop_token) override {
        {
            std::lock_guard lock(mtx_);
            chunks_seen.push_back(request.pages);
            if (auto& left = failures_[request.pages.start_page]; left > 0) {
                --left;
                throw OcrTransientError("deadline exceeded");
            }
        }
        if (request.chunk_pdf.empty()) {
            throw OcrFatalError("empty chunk");
        }

        std::vector<PageText> pages;
        for (std::size_t i = 0; i < request.pages.size(); ++i) {
            const auto global = request.pages.start_page + i;
            pages.push_back({i, global == 0 ? std::string(kHeader) : "página " + std::to_string(global)});
        }
        if (drop_last_page && !pages.empty()) pages.pop_back();
        return pages;
    }

    void fail_chunk(const std::size_t start_page, const int times) {
        std::lock_guard lock(mtx_);
        failures_[start_page] = times;
    }

    static constexpr std::string_view kHeader = "Paciente: Luna\nEspecie: Felino\nFecha: 02/05/2024\n";

    std::vector<ChunkRange> chunks_seen;
    bool drop_last_page = false;

private:
    std::mutex mtx_;
    std::map<std::size_t, int> failures_;
};

/**
 * @brief Keeps stored images in memory.
 */
class MemoryStore final : public IImageStore {
public:
    std::string put(std::span<const std::uint8_t> bytes, const std::string& document_id,
                    const std::size_t page_number, const std::size_t index,
                    const std::string_view mime_type) override {
        if (fail) {
            throw StorageWriteError("bucket unavailable");
        }
        const auto ref = "mem://" + document_id + "/" + FilesystemImageStore::relative_path(
            document_id, page_number, index, mime_type).filename().string();
        std::lock_guard lock(mtx_);
        objects[ref].assign(bytes.begin(), bytes.end());
        return ref;
    }

    std::atomic<bool> fail{false};
    std::map<std::string, std::vector<std::uint8_t>> objects;

private:
    std::mutex mtx_;
};

/**
 * @brief Each reading is 2.5 s after the previous one.
 */
class ManualClock final : public IClock {
public:
    [[nodiscard]] time_point now() const override {
        return time_point{} + std::chrono::milliseconds(2500) * ticks_++;
    }

private:
    mutable std::atomic<int> ticks_{0};
};

PipelineConfig fast_config() {
    PipelineConfig config;
    config.ocr_retry_backoff_ms = 1;
    return config;
}

} // namespace

class DocumentPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_.subscribe<PipelineStateEvent>([this](const PipelineStateEvent& e) {
            std::lock_guard lock(mtx_);
            states_.push_back(e.state);
        });
        bus_.subscribe<ChunkOcrRetryEvent>([this](const ChunkOcrRetryEvent&) { ++retries_; });
        bus_.subscribe<ImageSkippedEvent>([this](const ImageSkippedEvent& e) {
            std::lock_guard lock(mtx_);
            skipped_.push_back(e);
        });
        bus_.subscribe<ImageStoreErrorEvent>([this](const ImageStoreErrorEvent&) { ++store_errors_; });
        bus_.subscribe<DocumentErrorEvent>([this](const DocumentErrorEvent& e) {
            std::lock_guard lock(mtx_);
            errors_.push_back(e);
        });
        bus_.subscribe<DocumentCompleteEvent>([this](const DocumentCompleteEvent&) { ++completed_; });
    }

    ProcessingResult run(std::vector<std::uint8_t> bytes, const PipelineConfig& config = fast_config(),
                         const std::string& id = "doc-1") {
        return pipeline_.process(id, "report.pdf", std::move(bytes), config);
    }

    /// Four pages: a letterhead on each, a photo on page 1, a corrupt image on page 2.
    static std::vector<std::uint8_t> illustrated_report() {
        test::PdfBuilder builder;
        for (std::size_t page = 0; page < 4; ++page) {
            builder.add_page();
            builder.draw(page, "/Logo", builder.jpeg_image(500, 400, 9));
        }
        builder.draw(1, "/Photo", builder.jpeg_image(500, 400, 1));
        builder.draw(2, "/Bad", builder.broken_jpeg_image(500, 400));
        return builder.bytes();
    }

    FakeOcr ocr_;
    MemoryStore store_;
    ManualClock clock_;
    EventBus bus_;
    ThreadPool pool_{4};
    DocumentPipeline pipeline_{ocr_, store_, clock_, bus_, pool_};

    std::mutex mtx_;
    std::vector<PipelineState> states_;
    std::vector<ImageSkippedEvent> skipped_;
    std::vector<DocumentErrorEvent> errors_;
    std::atomic<int> retries_{0};
    std::atomic<int> store_errors_{0};
    std::atomic<int> completed_{0};
};

TEST_F(DocumentPipelineTest, TwentyPagesInTwoChunks) {
    const auto result = run(test::blank_pdf(20));

    EXPECT_EQ(result.document_id, "doc-1");
    EXPECT_EQ(result.filename, "report.pdf");
    EXPECT_EQ(result.total_pages, 20u);
    ASSERT_EQ(result.pages.size(), 20u);
    for (std::size_t i = 1; i < 20; ++i) {
        EXPECT_EQ(result.pages[i].page_number, i);
        EXPECT_EQ(result.pages[i].text, "página " + std::to_string(i));
    }
    EXPECT_EQ(ocr_.chunks_seen.size(), 2u);
    EXPECT_TRUE(result.images.empty());
    EXPECT_DOUBLE_EQ(result.processing_time_seconds, 2.5);
    EXPECT_EQ(completed_.load(), 1);
}

TEST_F(DocumentPipelineTest, ReportFieldsComeFromTheText) {
    const auto result = run(test::blank_pdf(3));
    EXPECT_EQ(result.report_info.get(ReportField::PatientName), "Luna");
    EXPECT_EQ(result.report_info.get(ReportField::Species), "Felino");
    EXPECT_EQ(result.report_info.get(ReportField::Date), "02/05/2024");
    EXPECT_FALSE(result.report_info.get(ReportField::Diagnosis).has_value());
}

TEST_F(DocumentPipelineTest, StatesAdvanceInOrder) {
    (void)run(test::blank_pdf(2));
    const std::vector<PipelineState> expected = {
        PipelineState::Received, PipelineState::Validated, PipelineState::Chunked,
        PipelineState::OCRed, PipelineState::Reassembled, PipelineState::ImagesExtracted,
        PipelineState::Parsed, PipelineState::Complete};
    EXPECT_EQ(states_, expected);
}

TEST_F(DocumentPipelineTest, TransientOcrFailuresAreRetried) {
    ocr_.fail_chunk(15, 2);
    const auto result = run(test::blank_pdf(20));
    EXPECT_EQ(result.pages.size(), 20u);
    EXPECT_EQ(retries_.load(), 2);
    EXPECT_EQ(ocr_.chunks_seen.size(), 4u);
}

TEST_F(DocumentPipelineTest, ExhaustedRetriesFailTheDocument) {
    ocr_.fail_chunk(15, 3);
    try {
        (void)run(test::blank_pdf(20));
        FAIL() << "expected OcrFatalError";
    } catch (const OcrFatalError& e) {
        EXPECT_EQ(e.state(), PipelineState::Chunked);
        EXPECT_NE(std::string(e.what()).find("3 attempts"), std::string::npos);
    }
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].kind, ErrorKind::OcrFatal);
    EXPECT_EQ(errors_[0].state, PipelineState::Chunked);
    EXPECT_EQ(states_.back(), PipelineState::Chunked);
    EXPECT_EQ(completed_.load(), 0);
}

TEST_F(DocumentPipelineTest, RetryLimitZeroMeansOneAttempt) {
    auto config = fast_config();
    config.ocr_retry_limit = 0;
    ocr_.fail_chunk(0, 1);
    EXPECT_THROW((void)run(test::blank_pdf(5), config), OcrFatalError);
    EXPECT_EQ(retries_.load(), 0);
}

TEST_F(DocumentPipelineTest, MissingOcrPageIsAReassemblyError) {
    ocr_.drop_last_page = true;
    try {
        (void)run(test::blank_pdf(4));
        FAIL() << "expected ReassemblyError";
    } catch (const ReassemblyError& e) {
        EXPECT_EQ(e.state(), PipelineState::OCRed);
    }
}

TEST_F(DocumentPipelineTest, InvalidDocumentStopsAtReceived) {
    const std::string junk = "this is a text file";
    try {
        (void)run({junk.begin(), junk.end()});
        FAIL() << "expected InvalidDocumentError";
    } catch (const InvalidDocumentError& e) {
        EXPECT_EQ(e.state(), PipelineState::Received);
    }
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].kind, ErrorKind::InvalidDocument);
    EXPECT_TRUE(ocr_.chunks_seen.empty());
}

TEST_F(DocumentPipelineTest, OversizedDocumentIsRejected) {
    auto config = fast_config();
    config.max_document_bytes = 64;
    EXPECT_THROW((void)run(test::blank_pdf(2), config), InvalidDocumentError);
}

TEST_F(DocumentPipelineTest, InvalidConfigIsRejectedBeforeProcessing) {
    auto config = fast_config();
    config.max_pages_per_call = 0;
    EXPECT_THROW((void)run(test::blank_pdf(2), config), std::invalid_argument);
    EXPECT_TRUE(states_.empty());
}

TEST_F(DocumentPipelineTest, StoppedPipelineCancels) {
    pipeline_.request_stop();
    EXPECT_TRUE(pipeline_.is_stopped());
    try {
        (void)run(test::blank_pdf(2));
        FAIL() << "expected CancelledError";
    } catch (const CancelledError& e) {
        EXPECT_EQ(e.state(), PipelineState::Received);
    }
}

TEST_F(DocumentPipelineTest, ImagesAreFilteredAndStored) {
    const auto result = run(illustrated_report());

    ASSERT_EQ(result.images.size(), 1u);
    const auto& photo = result.images[0];
    EXPECT_EQ(photo.page_number, 1u);
    EXPECT_EQ(photo.index_on_page, 1u);
    EXPECT_EQ(photo.width, 500u);
    EXPECT_EQ(photo.height, 400u);
    EXPECT_EQ(photo.mime_type, "image/jpeg");
    EXPECT_EQ(photo.byte_size, test::encode_jpeg(500, 400, 1).size());
    EXPECT_EQ(photo.storage_reference, "mem://doc-1/page2_img1.jpg");
    EXPECT_EQ(store_.objects.at(photo.storage_reference), test::encode_jpeg(500, 400, 1));

    ASSERT_EQ(skipped_.size(), 1u);
    EXPECT_EQ(skipped_[0].page_number, 2u);
    EXPECT_EQ(skipped_[0].index_on_page, 1u);
}

TEST_F(DocumentPipelineTest, StorageFailureSkipsImageByDefault) {
    store_.fail = true;
    const auto result = run(illustrated_report());
    EXPECT_TRUE(result.images.empty());
    EXPECT_EQ(store_errors_.load(), 1);
    EXPECT_EQ(completed_.load(), 1);
}

TEST_F(DocumentPipelineTest, StorageFailureCanFailTheDocument) {
    store_.fail = true;
    auto config = fast_config();
    config.storage_failure_policy = StorageFailurePolicy::FailDocument;
    try {
        (void)run(illustrated_report(), config);
        FAIL() << "expected StorageWriteError";
    } catch (const StorageWriteError& e) {
        EXPECT_EQ(e.state(), PipelineState::Reassembled);
    }
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].kind, ErrorKind::StorageWrite);
}

TEST_F(DocumentPipelineTest, ReprocessingGivesTheSameResult) {
    const auto bytes = illustrated_report();
    const auto first = run(bytes);
    const auto second = run(bytes);

    EXPECT_EQ(first.images, second.images);
    EXPECT_EQ(first.report_info, second.report_info);
    EXPECT_EQ(first.pages, second.pages);
    EXPECT_EQ(first.processing_time_seconds, second.processing_time_seconds);
    EXPECT_EQ(store_.objects.size(), 1u);
}

#include "command_ocr_adapter.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <stop_token>

using namespace vetscan;
using namespace std::chrono_literals;

namespace {

const std::vector<std::uint8_t> kChunk = {'%', 'P', 'D', 'F', '-', '1', '.', '7', '\n'};

OcrRequest request(const std::chrono::milliseconds timeout = 10s) {
    return {kChunk, ChunkRange{15, 17}, timeout};
}

} // namespace

TEST(CommandOcrAdapterTest, TokenizeHonoursQuotes) {
    EXPECT_EQ(CommandOcrAdapter::tokenize("pdftotext -layout {input} {output}"),
              (std::vector<std::string>{"pdftotext", "-layout", "{input}", "{output}"}));
    EXPECT_EQ(CommandOcrAdapter::tokenize("  sh -c \"printf 'a b'\"   {input} "),
              (std::vector<std::string>{"sh", "-c", "printf 'a b'", "{input}"}));
    EXPECT_EQ(CommandOcrAdapter::tokenize("tool \"\" {input}"),
              (std::vector<std::string>{"tool", "", "{input}"}));
    EXPECT_TRUE(CommandOcrAdapter::tokenize("   ").empty());
}

TEST(CommandOcrAdapterTest, SplitPagesOnFormFeeds) {
    const auto pages = CommandOcrAdapter::split_pages("first\fsecond\f\fFOURTH\f");
    ASSERT_EQ(pages.size(), 4u);
    EXPECT_EQ(pages[0], (PageText{0, "first"}));
    EXPECT_EQ(pages[1], (PageText{1, "second"}));
    EXPECT_EQ(pages[2], (PageText{2, ""}));
    EXPECT_EQ(pages[3], (PageText{3, "FOURTH"}));
}

TEST(CommandOcrAdapterTest, TextWithoutFormFeedIsOnePage) {
    const auto pages = CommandOcrAdapter::split_pages("only page\n");
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].text, "only page\n");
    EXPECT_EQ(CommandOcrAdapter::split_pages("").size(), 1u);
}

TEST(CommandOcrAdapterTest, ConstructorValidatesTemplate) {
    EXPECT_THROW(CommandOcrAdapter(""), std::invalid_argument);
    EXPECT_THROW(CommandOcrAdapter("pdftotext -layout"), std::invalid_argument);
    EXPECT_NO_THROW(CommandOcrAdapter("pdftotext {input} -"));
}

TEST(CommandOcrAdapterTest, NameAndNumbering) {
    const CommandOcrAdapter adapter("/usr/bin/pdftotext {input} {output}");
    EXPECT_EQ(adapter.get_name(), "pdftotext");
    EXPECT_EQ(adapter.numbering(), PageNumbering::ChunkLocal);
}

TEST(CommandOcrAdapterTest, ScannedPresetWritesASidecar) {
    const auto words = CommandOcrAdapter::tokenize(CommandOcrAdapter::kScannedCommand);
    EXPECT_NE(std::ranges::find(words, "{input}"), words.end());
    EXPECT_NE(std::ranges::find(words, "{output}"), words.end());

    const CommandOcrAdapter adapter{std::string(CommandOcrAdapter::kScannedCommand)};
    EXPECT_EQ(adapter.get_name(), "ocrmypdf");
    EXPECT_EQ(adapter.numbering(), PageNumbering::ChunkLocal);
}

TEST(CommandOcrAdapterTest, CapturesStdout) {
    CommandOcrAdapter adapter("sh -c \"printf 'page one\\fpage two\\f'\" {input}");
    const auto pages = adapter.extract_text(request(), std::stop_token{});
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0], (PageText{0, "page one"}));
    EXPECT_EQ(pages[1], (PageText{1, "page two"}));
}

TEST(CommandOcrAdapterTest, ReadsOutputFile) {
    CommandOcrAdapter adapter("sh -c \"printf 'x\\fy' > $0\" {output} {input}");
    const auto pages = adapter.extract_text(request(), std::stop_token{});
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[1].text, "y");
}

TEST(CommandOcrAdapterTest, CommandSeesTheChunk) {
    CommandOcrAdapter adapter("cat {input}");
    const auto pages = adapter.extract_text(request(), std::stop_token{});
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].text, std::string(kChunk.begin(), kChunk.end()));
}

TEST(CommandOcrAdapterTest, NonZeroExitIsTransient) {
    CommandOcrAdapter adapter("sh -c \"echo scanner offline >&2; exit 3\" {input}");
    try {
        (void)adapter.extract_text(request(), std::stop_token{});
        FAIL() << "expected OcrTransientError";
    } catch (const OcrTransientError& e) {
        EXPECT_NE(std::string(e.what()).find("exit status 3"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("scanner offline"), std::string::npos);
    }
}

TEST(CommandOcrAdapterTest, TimeoutIsTransient) {
    CommandOcrAdapter adapter("sh -c \"sleep 5\" {input}");
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW((void)adapter.extract_text(request(100ms), std::stop_token{}), OcrTransientError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST(CommandOcrAdapterTest, MissingCommandIsFatal) {
    CommandOcrAdapter adapter("vetscan-no-such-ocr-tool {input}");
    EXPECT_THROW((void)adapter.extract_text(request(), std::stop_token{}), OcrFatalError);
}

TEST(CommandOcrAdapterTest, StoppedCallIsCancelled) {
    CommandOcrAdapter adapter("cat {input}");
    std::stop_source stop;
    stop.request_stop();
    EXPECT_THROW((void)adapter.extract_text(request(), stop.get_token()), CancelledError);
}

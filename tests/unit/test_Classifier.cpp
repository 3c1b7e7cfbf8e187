#include <gtest/gtest.h>
#include "detect/Classifier.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <sys/stat.h>

using namespace fv::detect;
using namespace fv::test;

namespace {

// Bytes that satisfy exactly this pattern: wildcards and padding are zero.
std::vector<uint8_t> bytesFor(const MagicPattern& p) {
    std::vector<uint8_t> data(p.span(), 0x00);
    for (size_t i = 0; i < p.bytes.size(); ++i)
        if (p.bytes[i] >= 0) data[p.offset + i] = static_cast<uint8_t>(p.bytes[i]);
    return data;
}

std::vector<uint8_t> zipLocalHeader(const std::string& firstEntry) {
    std::vector<uint8_t> data = {0x50, 0x4B, 0x03, 0x04};
    data.resize(30, 0x00);
    data.insert(data.end(), firstEntry.begin(), firstEntry.end());
    data.resize(200, 0x00);
    return data;
}

}

class ClassifierTest : public ::testing::Test {
protected:
    SignatureTable table = SignatureTable::builtin();
    Classifier classifier{table};
    TempDir dir;
};

TEST_F(ClassifierTest, EveryRegisteredPatternIdentifiesItsType) {
    for (const auto& entry : table.ordered()) {
        const auto& pattern = table.patternOf(entry);
        const auto& expected = table.signatureOf(entry).content_type;

        const auto result = classifier.classify(bytesFor(pattern));
        EXPECT_TRUE(result.identified()) << expected;
        EXPECT_EQ(result.content_type, expected);
    }
}

TEST_F(ClassifierTest, ClassificationIgnoresFileName) {
    writeBytes(dir / "report.jpg", pdfBytes());
    writeBytes(dir / "report.pdf", pdfBytes());
    writeBytes(dir / "report", pdfBytes());

    for (const auto* name : {"report.jpg", "report.pdf", "report"}) {
        const auto result = classifier.classifyFile(dir / name);
        EXPECT_EQ(result.content_type, "pdf") << name;
        ASSERT_TRUE(result.matched_pattern.has_value());
        EXPECT_EQ(*result.matched_pattern, (std::vector<uint8_t>{'%', 'P', 'D', 'F'}));
    }
}

TEST_F(ClassifierTest, OfficeContainerBeatsGenericZip) {
    EXPECT_EQ(classifier.classify(zipLocalHeader("[Content_Types].xml")).content_type, "ooxml");
    EXPECT_EQ(classifier.classify(zipLocalHeader("readme.txt")).content_type, "zip");
}

TEST_F(ClassifierTest, TruncatedOfficeHeaderFallsBackToZip) {
    auto data = zipLocalHeader("[Content_Types].xml");
    data.resize(40);
    EXPECT_EQ(classifier.classify(data).content_type, "zip");
}

TEST_F(ClassifierTest, NoMatchIsUnknown) {
    const std::string text = "just some plain text that starts with nothing special";
    const auto result = classifier.classify(std::vector<uint8_t>(text.begin(), text.end()));
    EXPECT_EQ(result.status, ClassificationStatus::Unknown);
    EXPECT_EQ(result.content_type, UNKNOWN_CONTENT_TYPE);
    EXPECT_FALSE(result.matched_pattern.has_value());
}

TEST_F(ClassifierTest, EmptyFileIsUnknown) {
    writeText(dir / "empty.pdf", "");
    const auto result = classifier.classifyFile(dir / "empty.pdf");
    EXPECT_EQ(result.status, ClassificationStatus::Unknown);
    EXPECT_TRUE(result.header.empty());
}

TEST_F(ClassifierTest, ShortFileStillClassifies) {
    writeBytes(dir / "tiny.gz", {0x1F, 0x8B});
    EXPECT_EQ(classifier.classifyFile(dir / "tiny.gz").content_type, "gz");
}

TEST_F(ClassifierTest, TarDetectedAtOffset) {
    std::vector<uint8_t> data(512, 0x00);
    std::ranges::copy(std::string_view("notes.txt"), data.begin());
    std::ranges::copy(std::string_view("ustar"), data.begin() + 257);
    EXPECT_EQ(classifier.classify(data).content_type, "tar");
}

TEST_F(ClassifierTest, MissingFileIsUnreadableNotUnknown) {
    const auto result = classifier.classifyFile(dir / "does-not-exist.pdf");
    EXPECT_TRUE(result.unreadable());
    EXPECT_FALSE(result.error.empty());
}

TEST_F(ClassifierTest, DirectoryIsUnreadable) {
    fs::create_directories(dir / "sub.pdf");
    EXPECT_TRUE(classifier.classifyFile(dir / "sub.pdf").unreadable());
}

TEST_F(ClassifierTest, FifoIsUnreadableAndDoesNotBlock) {
    const auto fifo = dir / "pipe.pdf";
    ASSERT_EQ(::mkfifo(fifo.c_str(), 0600), 0);
    EXPECT_TRUE(classifier.classifyFile(fifo).unreadable());
}

TEST_F(ClassifierTest, HeaderIsBoundedByTable) {
    writeBytes(dir / "big.bin", std::vector<uint8_t>(table.requiredHeaderBytes() + 4096, 0x41));
    const auto result = classifier.classifyFile(dir / "big.bin");
    EXPECT_EQ(result.header.size(), table.requiredHeaderBytes());
}

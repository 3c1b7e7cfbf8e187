#include <gtest/gtest.h>
#include "detect/VerdictEngine.hpp"

using namespace fv::detect;

class VerdictEngineTest : public ::testing::Test {
protected:
    SignatureTable table = SignatureTable::builtin();
    VerdictEngine engine{table};

    Verdict verdictFor(const std::string& file, const std::string& type) const {
        return engine.evaluate(file, VerdictEngine::claimedExtension(file), type);
    }
};

TEST_F(VerdictEngineTest, ClaimedExtensionIsLastNormalizedSuffix) {
    EXPECT_EQ(VerdictEngine::claimedExtension("/tmp/archive.tar.gz"), "gz");
    EXPECT_EQ(VerdictEngine::claimedExtension("/home/u/Report.PDF"), "pdf");
    EXPECT_EQ(VerdictEngine::claimedExtension("/home/u/.bashrc"), "");
    EXPECT_EQ(VerdictEngine::claimedExtension("/usr/bin/ls"), "");
    EXPECT_EQ(VerdictEngine::claimedExtension("/tmp/odd."), "");
}

TEST_F(VerdictEngineTest, NormalizeExtension) {
    EXPECT_EQ(VerdictEngine::normalizeExtension(".JPG"), "jpg");
    EXPECT_EQ(VerdictEngine::normalizeExtension("Docx"), "docx");
    EXPECT_EQ(VerdictEngine::normalizeExtension(""), "");
}

TEST_F(VerdictEngineTest, GenuineFilesMatch) {
    EXPECT_EQ(verdictFor("/x/invoice.pdf", "pdf"), Verdict::Match);
    EXPECT_EQ(verdictFor("/x/photo.JPEG", "jpg"), Verdict::Match);
    EXPECT_EQ(verdictFor("/x/report.docx", "ooxml"), Verdict::Match);
    EXPECT_EQ(verdictFor("/x/report.docx", "zip"), Verdict::Match);
    EXPECT_EQ(verdictFor("/x/bundle.zip", "ooxml"), Verdict::Match);
    EXPECT_EQ(verdictFor("/usr/local/bin/tool", "elf"), Verdict::Match);
    EXPECT_EQ(verdictFor("/x/run", "shell"), Verdict::Match);
}

TEST_F(VerdictEngineTest, EveryAcceptedExtensionMatches) {
    for (const auto& sig : table.signatures())
        for (const auto& ext : sig.accepted_extensions)
            EXPECT_EQ(engine.evaluate("/x/file", ext, sig.content_type), Verdict::Match) << sig.content_type << " ." << ext;
}

TEST_F(VerdictEngineTest, PdfNamedJpgIsMismatch) {
    EXPECT_EQ(verdictFor("/tmp/holiday.jpg", "pdf"), Verdict::Mismatch);
}

TEST_F(VerdictEngineTest, ExecutableDisguisedAsDocumentIsMismatch) {
    EXPECT_EQ(verdictFor("/tmp/invoice.pdf", "exe"), Verdict::Mismatch);
    EXPECT_EQ(verdictFor("/tmp/invoice.docx", "elf"), Verdict::Mismatch);
    EXPECT_EQ(verdictFor("/tmp/notes", "pdf"), Verdict::Mismatch);
}

TEST_F(VerdictEngineTest, UnknownContentIsNeverMismatch) {
    EXPECT_EQ(verdictFor("/tmp/notes.txt", UNKNOWN_CONTENT_TYPE), Verdict::Unknown);
    EXPECT_EQ(verdictFor("/tmp/invoice.pdf", UNKNOWN_CONTENT_TYPE), Verdict::Unknown);
}

TEST_F(VerdictEngineTest, UnregisteredContentTypeIsUnknown) {
    EXPECT_EQ(verdictFor("/tmp/a.pdf", "made-up"), Verdict::Unknown);
}

TEST_F(VerdictEngineTest, VerdictNames) {
    EXPECT_EQ(to_string(Verdict::Match), "MATCH");
    EXPECT_EQ(to_string(Verdict::Mismatch), "MISMATCH");
    EXPECT_EQ(to_string(Verdict::Unknown), "UNKNOWN");
}

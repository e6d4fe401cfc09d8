#include <gtest/gtest.h>
#include "archive_extractor.hpp"
#include "sanitize_error.hpp"
#include "testing.hpp"

namespace cbzsan {

namespace fs = std::filesystem;

class ArchiveExtractorTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    ArchiveExtractor extractor;

    fs::path Archive() const { return temp_dir.Path() / "book.cbz"; }
    fs::path Tree() const { return temp_dir.Path() / "tree"; }
};

TEST_F(ArchiveExtractorTest, ExtractsNestedEntries) {
    testutil::WriteZip(Archive(), {
        {"chapter1/", "", true},
        {"chapter1/001.jpg", "one"},
        {"chapter2/001.jpg", "two"},
        {"cover.png", "cover"},
    });

    const ExtractionReport report = extractor.extract(Archive(), Tree());
    EXPECT_EQ(report.extracted, 3u);
    EXPECT_EQ(report.extracted_bytes, 11u);
    EXPECT_TRUE(report.duplicates.empty());
    EXPECT_TRUE(report.rejected.empty());
    EXPECT_EQ(testutil::ReadFile(Tree() / "chapter1" / "001.jpg"), "one");
    EXPECT_EQ(testutil::ReadFile(Tree() / "chapter2" / "001.jpg"), "two");
    EXPECT_EQ(testutil::ReadFile(Tree() / "cover.png"), "cover");
}

TEST_F(ArchiveExtractorTest, FirstDuplicateWins) {
    testutil::WriteZip(Archive(), {
        {"page1.jpg", "first"},
        {"page2.jpg", "other"},
        {"page1.jpg", "second"},
        {"page1.jpg", "third"},
    });

    const ExtractionReport report = extractor.extract(Archive(), Tree());
    EXPECT_EQ(report.extracted, 2u);
    ASSERT_EQ(report.duplicates.size(), 2u);
    EXPECT_EQ(report.duplicates[0], "page1.jpg");
    EXPECT_EQ(testutil::ReadFile(Tree() / "page1.jpg"), "first");
}

TEST_F(ArchiveExtractorTest, EquivalentSpellingsAreDuplicates) {
    testutil::WriteZip(Archive(), {
        {"a/page.jpg", "first"},
        {"a/./page.jpg", "second"},
        {"a\\page.jpg", "third"},
    });

    const ExtractionReport report = extractor.extract(Archive(), Tree());
    EXPECT_EQ(report.extracted, 1u);
    EXPECT_EQ(report.duplicates.size(), 2u);
    EXPECT_EQ(testutil::ReadFile(Tree() / "a" / "page.jpg"), "first");
}

TEST_F(ArchiveExtractorTest, RejectsEscapingEntriesAndContinues) {
    testutil::WriteZip(Archive(), {
        {"../evil.jpg", "evil"},
        {"page1.jpg", "good"},
        {"/etc/passwd_cbzsan", "root"},
        {"a/../../evil2.jpg", "evil"},
        {"page2.jpg", "good too"},
    });

    const ExtractionReport report = extractor.extract(Archive(), Tree());
    EXPECT_EQ(report.extracted, 2u);
    ASSERT_EQ(report.rejected.size(), 3u);
    EXPECT_EQ(report.rejected[0], "../evil.jpg");
    EXPECT_EQ(report.rejected[1], "/etc/passwd_cbzsan");
    EXPECT_EQ(report.rejected[2], "a/../../evil2.jpg");

    EXPECT_TRUE(fs::exists(Tree() / "page1.jpg"));
    EXPECT_TRUE(fs::exists(Tree() / "page2.jpg"));
    EXPECT_FALSE(fs::exists(temp_dir.Path() / "evil.jpg"));
    EXPECT_FALSE(fs::exists(temp_dir.Path() / "evil2.jpg"));
    EXPECT_FALSE(fs::exists("/etc/passwd_cbzsan"));
}

TEST_F(ArchiveExtractorTest, CorruptArchiveThrows) {
    testutil::WriteFile(Archive(), "this is not a zip file at all");
    try {
        (void)extractor.extract(Archive(), Tree());
        FAIL() << "expected SanitizeError";
    } catch (const SanitizeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CorruptArchive);
    }
}

TEST_F(ArchiveExtractorTest, MissingArchiveThrowsCorrupt) {
    EXPECT_THROW((void)extractor.extract(temp_dir.Path() / "missing.cbz", Tree()), SanitizeError);
}

TEST_F(ArchiveExtractorTest, ArchiveIsNotModified) {
    testutil::WriteZip(Archive(), {{"page1.jpg", "data"}, {"page1.jpg", "dup"}});
    const std::string before = testutil::ReadFile(Archive());
    (void)extractor.extract(Archive(), Tree());
    EXPECT_EQ(testutil::ReadFile(Archive()), before);
}

namespace {

std::string Resolved(const std::string_view name) {
    const auto p = ArchiveExtractor::resolve_entry_path(name, "/work");
    return p ? p->generic_string() : "<rejected>";
}

} // namespace

TEST(ResolveEntryPathTest, AcceptsRelativeNames) {
    EXPECT_EQ(Resolved("page.jpg"), "/work/page.jpg");
    EXPECT_EQ(Resolved("a/b/c.png"), "/work/a/b/c.png");
    EXPECT_EQ(Resolved("a/../b.png"), "/work/b.png");
    EXPECT_EQ(Resolved("a\\b.png"), "/work/a/b.png");
    EXPECT_EQ(Resolved("..foo.jpg"), "/work/..foo.jpg");
}

TEST(ResolveEntryPathTest, RejectsEscapes) {
    const fs::path root = "/work";
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path("", root).has_value());
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path(".", root).has_value());
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path("..", root).has_value());
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path("../x.jpg", root).has_value());
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path("a/../../x.jpg", root).has_value());
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path("/etc/passwd", root).has_value());
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path("\\windows\\x.jpg", root).has_value());
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path("C:/x.jpg", root).has_value());
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path("..\\x.jpg", root).has_value());
    EXPECT_FALSE(ArchiveExtractor::resolve_entry_path(std::string_view("a\0b", 3), root).has_value());
}

} // namespace cbzsan

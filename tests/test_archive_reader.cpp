#include "cbxconv/archive_reader.hpp"
#include "cbxconv/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace cbxconv;
namespace fs = std::filesystem;

TEST(ArchiveFormatTest, DetectsByExtension) {
    EXPECT_EQ(format_from_extension("a.cbz"), ArchiveFormat::ZIP);
    EXPECT_EQ(format_from_extension("a.ZIP"), ArchiveFormat::ZIP);
    EXPECT_EQ(format_from_extension("a.cbr"), ArchiveFormat::RAR);
    EXPECT_EQ(format_from_extension("a.cb7"), ArchiveFormat::SEVEN_ZIP);
    EXPECT_EQ(format_from_extension("a.7z"), ArchiveFormat::SEVEN_ZIP);
    EXPECT_FALSE(format_from_extension("a.pdf").has_value());
    EXPECT_EQ(archive_extension(ArchiveFormat::ZIP), ".cbz");
    EXPECT_EQ(archive_extension(ArchiveFormat::SEVEN_ZIP, false), ".7z");
}

TEST(ArchiveReaderTest, DescribeRejectsUnknownExtension) {
    test::TempDir dir;
    test::write_bytes(dir / "book.pdf", "%PDF-1.4");
    EXPECT_THROW(describe_archive(dir / "book.pdf"), UnsupportedFormat);
}

TEST(ArchiveReaderTest, DescribeMissingFileIsExtractionFailure) {
    test::TempDir dir;
    EXPECT_THROW(describe_archive(dir / "missing.cbz"), ExtractionFailure);
}

TEST(ArchiveReaderTest, DescribeReportsSize) {
    test::TempDir dir;
    test::write_zip(dir / "book.cbz", {{"a.txt", "hello"}});
    auto source = describe_archive(dir / "book.cbz");
    EXPECT_EQ(source.format, ArchiveFormat::ZIP);
    EXPECT_EQ(source.size, fs::file_size(dir / "book.cbz"));
}

TEST(ArchiveReaderTest, ExtractsNestedEntries) {
    test::TempDir dir;
    test::write_zip(dir / "book.cbz", {
        {"chapter1/001.png", "one"},
        {"chapter1/002.png", "two"},
        {"ComicInfo.xml", "<ComicInfo/>"},
    });

    auto count = extract(describe_archive(dir / "book.cbz"), dir / "out");
    EXPECT_EQ(count, 3u);
    EXPECT_EQ(test::read_bytes(dir / "out" / "chapter1" / "001.png"), "one");
    EXPECT_EQ(test::read_bytes(dir / "out" / "chapter1" / "002.png"), "two");
    EXPECT_EQ(test::read_bytes(dir / "out" / "ComicInfo.xml"), "<ComicInfo/>");
}

TEST(ArchiveReaderTest, RejectsPathTraversal) {
    test::TempDir dir;
    test::write_zip(dir / "evil.cbz", {
        {"page.png", "ok"},
        {"../../etc/passwd", "root::0:0"},
    });

    fs::path dest = dir / "nested" / "out";
    EXPECT_THROW(extract(describe_archive(dir / "evil.cbz"), dest), UnsafeEntryPath);
    EXPECT_FALSE(fs::exists(dir / "etc" / "passwd"));
    EXPECT_FALSE(fs::exists(dir / "nested" / "etc" / "passwd"));
}

TEST(ArchiveReaderTest, ResolveEntryPathChecks) {
    fs::path dest = "/tmp/staging";
    EXPECT_EQ(resolve_entry_path(dest, "a/b.png"), fs::path("/tmp/staging/a/b.png"));
    EXPECT_EQ(resolve_entry_path(dest, "a\\b.png"), fs::path("/tmp/staging/a/b.png"));
    EXPECT_EQ(resolve_entry_path(dest, "a/../b.png"), fs::path("/tmp/staging/b.png"));
    EXPECT_FALSE(resolve_entry_path(dest, "").has_value());
    EXPECT_FALSE(resolve_entry_path(dest, "./").has_value());

    EXPECT_THROW(resolve_entry_path(dest, "/etc/passwd"), UnsafeEntryPath);
    EXPECT_THROW(resolve_entry_path(dest, "../x.png"), UnsafeEntryPath);
    EXPECT_THROW(resolve_entry_path(dest, "a/../../x.png"), UnsafeEntryPath);
    EXPECT_THROW(resolve_entry_path(dest, "..\\..\\x.png"), UnsafeEntryPath);
    EXPECT_THROW(resolve_entry_path(dest, "C:\\Windows\\x.png"), UnsafeEntryPath);
}

TEST(ArchiveReaderTest, CorruptArchiveFails) {
    test::TempDir dir;
    test::write_bytes(dir / "broken.cbz", std::string(512, '\xAB'));
    EXPECT_THROW(extract(describe_archive(dir / "broken.cbz"), dir / "out"), ExtractionFailure);
}

TEST(ArchiveReaderTest, TruncatedArchiveFails) {
    test::TempDir dir;
    test::write_comic(dir / "full.cbz", 3, 128, 128);
    std::string bytes = test::read_bytes(dir / "full.cbz");
    test::write_bytes(dir / "cut.cbz", bytes.substr(0, bytes.size() / 2));
    EXPECT_THROW(extract(describe_archive(dir / "cut.cbz"), dir / "out"), ExtractionFailure);
}

TEST(ArchiveReaderTest, ListEntriesKeepsArchiveOrder) {
    test::TempDir dir;
    test::write_zip(dir / "b.cbz", {{"z.png", "1"}, {"a.png", "2"}});
    EXPECT_EQ(list_entries(dir / "b.cbz"), (std::vector<std::string>{"z.png", "a.png"}));
}

TEST(ArchiveReaderTest, FindArchivesSortedAndRecursive) {
    test::TempDir dir;
    test::write_bytes(dir / "b.cbz", "x");
    test::write_bytes(dir / "a.cbr", "x");
    test::write_bytes(dir / "notes.txt", "x");
    test::write_bytes(dir / "sub" / "c.cb7", "x");

    auto flat = find_archives(dir.path(), false);
    ASSERT_EQ(flat.size(), 2u);
    EXPECT_EQ(flat[0].filename(), "a.cbr");
    EXPECT_EQ(flat[1].filename(), "b.cbz");

    auto deep = find_archives(dir.path(), true);
    ASSERT_EQ(deep.size(), 3u);
    EXPECT_EQ(deep[2].filename(), "c.cb7");
}

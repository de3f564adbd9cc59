#include "cbxconv/stats_store.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace cbxconv;

TEST(FileStatsStoreTest, MissingFileMeansNoRuns) {
    test::TempDir dir;
    FileStatsStore store(dir / "stats.tsv");
    auto lifetime = store.lifetime();
    EXPECT_EQ(lifetime.run_count, 0u);
    EXPECT_EQ(lifetime.totals.files_processed, 0u);
}

TEST(FileStatsStoreTest, SumsAllRuns) {
    test::TempDir dir;
    FileStatsStore store(dir / "nested" / "stats.tsv");

    RunStats first;
    first.totals.files_processed = 2;
    first.totals.original_bytes = 1000;
    first.totals.converted_bytes = 400;
    first.elapsed_seconds = 1.5;
    store.record_run(first);

    RunStats second;
    second.totals.files_processed = 1;
    second.totals.original_bytes = 500;
    second.totals.converted_bytes = 450;
    store.record_run(second);

    auto lifetime = store.lifetime();
    EXPECT_EQ(lifetime.run_count, 2u);
    EXPECT_EQ(lifetime.totals.files_processed, 3u);
    EXPECT_EQ(lifetime.totals.original_bytes, 1500u);
    EXPECT_EQ(lifetime.totals.converted_bytes, 850u);
    EXPECT_EQ(lifetime.totals.bytes_saved(), 650);
}

TEST(FileStatsStoreTest, SkipsBrokenLines) {
    test::TempDir dir;
    test::write_bytes(dir / "stats.tsv", "garbage\n2024-01-01T00:00:00\t1\t10\t5\t0.1\n\n");
    FileStatsStore store(dir / "stats.tsv");
    auto lifetime = store.lifetime();
    EXPECT_EQ(lifetime.run_count, 1u);
    EXPECT_EQ(lifetime.totals.original_bytes, 10u);
}

TEST(FileStatsStoreTest, UnwritablePathThrows) {
    test::TempDir dir;
    test::write_bytes(dir / "blocker", "file");
    FileStatsStore store(dir / "blocker" / "stats.tsv");
    EXPECT_THROW(store.record_run(RunStats{}), std::runtime_error);
}

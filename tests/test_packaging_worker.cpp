#include "cbxconv/archive_writer.hpp"
#include "cbxconv/errors.hpp"
#include "cbxconv/packaging_worker.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <mutex>
#include <thread>

using namespace cbxconv;
namespace fs = std::filesystem;

namespace {

// merkt sich die reihenfolge, packt nix
class RecordingPackager : public Packager {
public:
    PackagingOutcome package(const PackagingTask& task) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        std::lock_guard<std::mutex> lock(mutex_);
        order.push_back(task.output_path.filename().string());
        PackagingOutcome outcome;
        outcome.success = true;
        outcome.new_size = order.size();
        return outcome;
    }

    std::mutex mutex_;
    std::vector<std::string> order;
};

class ThrowingPackager : public Packager {
public:
    PackagingOutcome package(const PackagingTask&) override {
        throw std::runtime_error("disk on fire");
    }
};

void make_staging(const fs::path& dir) {
    test::write_bytes(dir / "c.webp", "ccc");
    test::write_bytes(dir / "a.webp", "a");
    test::write_bytes(dir / "sub" / "b.webp", "bb");
}

} // namespace

TEST(ArchiveWriterTest, EntriesAreSortedByRelativePath) {
    test::TempDir dir;
    make_staging(dir / "staging");

    auto count = write_archive(dir / "staging", dir / "out.cbz", ArchiveFormat::ZIP, 6);
    EXPECT_EQ(count, 3u);
    EXPECT_EQ(list_entries(dir / "out.cbz"),
              (std::vector<std::string>{"a.webp", "c.webp", "sub/b.webp"}));
}

TEST(ArchiveWriterTest, SevenZipOutput) {
    test::TempDir dir;
    make_staging(dir / "staging");

    write_archive(dir / "staging", dir / "out.cb7", ArchiveFormat::SEVEN_ZIP, 9);
    EXPECT_EQ(list_entries(dir / "out.cb7"),
              (std::vector<std::string>{"a.webp", "c.webp", "sub/b.webp"}));
}

TEST(ArchiveWriterTest, RarIsNotWritable) {
    test::TempDir dir;
    make_staging(dir / "staging");
    EXPECT_FALSE(is_writable_format(ArchiveFormat::RAR));
    EXPECT_THROW(write_archive(dir / "staging", dir / "out.cbr", ArchiveFormat::RAR, 6),
                 PackagingFailure);
    EXPECT_FALSE(fs::exists(dir / "out.cbr"));
}

TEST(ArchivePackagerTest, SuccessRemovesStaging) {
    test::TempDir dir;
    make_staging(dir / "staging");

    NullLogger logger;
    ArchivePackager packager(logger);
    auto outcome = packager.package(dir / "staging", dir / "book.cbz", 6);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.new_size, fs::file_size(dir / "book.cbz"));
    EXPECT_FALSE(fs::exists(dir / "staging"));
}

TEST(ArchivePackagerTest, KeepOriginalsKeepsStaging) {
    test::TempDir dir;
    make_staging(dir / "staging");

    NullLogger logger;
    ArchivePackager packager(logger, true);
    auto outcome = packager.package(dir / "staging", dir / "book.cbz", 6);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_TRUE(fs::exists(dir / "staging" / "a.webp"));
}

TEST(ArchivePackagerTest, FailureKeepsStaging) {
    test::TempDir dir;
    make_staging(dir / "staging");
    test::write_bytes(dir / "blocker", "i am a file");

    NullLogger logger;
    ArchivePackager packager(logger);
    auto outcome = packager.package(dir / "staging", dir / "blocker" / "book.cbz", 6);

    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.error_message.empty());
    EXPECT_TRUE(fs::exists(dir / "staging" / "sub" / "b.webp"));
}

TEST(ArchivePackagerTest, EmptyStagingFails) {
    test::TempDir dir;
    fs::create_directories(dir / "staging");

    NullLogger logger;
    ArchivePackager packager(logger);
    auto outcome = packager.package(dir / "staging", dir / "book.cbz", 6);
    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(fs::exists(dir / "book.cbz"));
}

TEST(ArchivePackagerTest, ExtractAndRepackageRoundTrip) {
    test::TempDir dir;
    test::write_zip(dir / "in.cbz", {{"p/2.txt", "two"}, {"p/1.txt", "one"}, {"cover.txt", "c"}});

    extract(describe_archive(dir / "in.cbz"), dir / "staging");
    NullLogger logger;
    ArchivePackager packager(logger);
    auto outcome = packager.package(dir / "staging", dir / "out.cbz", 0);
    ASSERT_TRUE(outcome.success) << outcome.error_message;

    extract(describe_archive(dir / "out.cbz"), dir / "again");
    EXPECT_EQ(test::read_bytes(dir / "again" / "p" / "1.txt"), "one");
    EXPECT_EQ(test::read_bytes(dir / "again" / "p" / "2.txt"), "two");
    EXPECT_EQ(test::read_bytes(dir / "again" / "cover.txt"), "c");
}

TEST(RunPackagingTest, ExceptionBecomesFailedOutcome) {
    ThrowingPackager packager;
    test::RecordingLogger logger;

    PackagingTask task;
    task.staging_dir = "/nonexistent";
    task.output_path = "/nonexistent.cbz";
    task.result = std::make_shared<PackagingOutcome>();

    auto outcome = run_packaging(packager, task, logger);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_message, "disk on fire");
    EXPECT_FALSE(task.result->success);
    EXPECT_EQ(task.result->error_message, "disk on fire");
    EXPECT_EQ(logger.count(EventKind::PACKAGING_FINISHED), 1u);
}

TEST(AsyncPackagingWorkerTest, ProcessesInSubmitOrder) {
    RecordingPackager packager;
    NullLogger logger;
    BlockingQueue<PackagingReport> reports;

    std::vector<std::shared_ptr<PackagingOutcome>> slots;
    {
        AsyncPackagingWorker worker(packager, logger, &reports);
        for (int i = 0; i < 6; ++i) {
            PackagingTask task;
            task.output_path = "out_" + std::to_string(i) + ".cbz";
            slots.push_back(worker.submit(std::move(task)));
        }
        EXPECT_TRUE(worker.running());
        worker.finish();
        EXPECT_FALSE(worker.running());
    }

    ASSERT_EQ(packager.order.size(), 6u);
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(packager.order[i], "out_" + std::to_string(i) + ".cbz");
        ASSERT_TRUE(slots[i]);
        EXPECT_TRUE(slots[i]->success);
        EXPECT_EQ(slots[i]->new_size, static_cast<uint64_t>(i + 1));
    }

    EXPECT_EQ(reports.size(), 6u);
    auto first = reports.pop();
    EXPECT_EQ(first.output_path, "out_0.cbz");
}

TEST(AsyncPackagingWorkerTest, FinishWithoutTasksAndTwice) {
    RecordingPackager packager;
    NullLogger logger;
    AsyncPackagingWorker worker(packager, logger);
    worker.start();
    worker.finish();
    worker.finish();
    EXPECT_TRUE(packager.order.empty());
}

TEST(AsyncPackagingWorkerTest, FailureDoesNotStopLaterTasks) {
    ThrowingPackager packager;
    NullLogger logger;
    AsyncPackagingWorker worker(packager, logger);

    auto a = worker.submit(PackagingTask{});
    auto b = worker.submit(PackagingTask{});
    worker.finish();
    EXPECT_FALSE(a->success);
    EXPECT_FALSE(b->success);
    EXPECT_EQ(b->error_message, "disk on fire");
}

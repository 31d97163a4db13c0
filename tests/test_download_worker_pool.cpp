#include "s3downloader/download_worker_pool.hpp"

#include "fake_object_store.hpp"
#include "temp_directory.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include <gtest/gtest.h>

using namespace s3downloader;
using s3downloader::test::FakeObjectStore;
using s3downloader::test::TempDirectory;
using s3downloader::test::readFile;
using s3downloader::test::writeFile;

namespace fs = std::filesystem;

class DownloadWorkerPoolTest : public ::testing::Test {
protected:
    DownloadWorkerPoolTest() : errors_(8, progress_) { config_.max_workers = 2; }

    FakeObjectStore store_;
    TempDirectory temp_;
    TransferConfig config_;
    ProgressAggregator progress_;
    ErrorCollector errors_;
};

TEST_F(DownloadWorkerPoolTest, DownloadsIntoNestedPath) {
    store_.put("a/b/c.txt", "hello");
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};

    EXPECT_EQ(pool.processObject({"a/b/c.txt", 5}, {}), ObjectResult::Downloaded);
    EXPECT_TRUE(fs::is_directory(temp_.path() / "a"));
    EXPECT_TRUE(fs::is_directory(temp_.path() / "a" / "b"));
    EXPECT_EQ(readFile(temp_.path() / "a" / "b" / "c.txt"), "hello");

    const auto snapshot = progress_.snapshot();
    EXPECT_EQ(snapshot.files_downloaded, 1);
    EXPECT_EQ(snapshot.total_bytes, 5);
}

TEST_F(DownloadWorkerPoolTest, SkipsExistingFileWithoutTransfer) {
    store_.put("f1.txt", "remote");
    writeFile(temp_.path() / "f1.txt", "local");
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};

    EXPECT_EQ(pool.processObject({"f1.txt", 6}, {}), ObjectResult::Skipped);
    EXPECT_EQ(store_.downloadCalls(), 0);
    EXPECT_EQ(readFile(temp_.path() / "f1.txt"), "local");
    EXPECT_EQ(progress_.snapshot().files_skipped, 1);
    EXPECT_EQ(progress_.snapshot().files_downloaded, 0);
}

TEST_F(DownloadWorkerPoolTest, OverwriteReplacesExistingFile) {
    store_.put("f1.txt", "remote");
    writeFile(temp_.path() / "f1.txt", "a much longer local file");
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), true, config_, progress_, errors_};

    EXPECT_EQ(pool.processObject({"f1.txt", 6}, {}), ObjectResult::Downloaded);
    EXPECT_EQ(readFile(temp_.path() / "f1.txt"), "remote");
    EXPECT_EQ(progress_.snapshot().files_skipped, 0);
}

TEST_F(DownloadWorkerPoolTest, FailedTransferRemovesPartialFile) {
    store_.put("bad.bin", "data");
    store_.failDownload("bad.bin");
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};

    EXPECT_EQ(pool.processObject({"bad.bin", 4}, {}), ObjectResult::Failed);
    EXPECT_FALSE(fs::exists(temp_.path() / "bad.bin"));
    EXPECT_EQ(errors_.errorCount(), 1);

    errors_.close();
    const auto reported = errors_.drain();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].kind, ErrorKind::Transfer);
    EXPECT_EQ(reported[0].key, "bad.bin");
}

TEST_F(DownloadWorkerPoolTest, DirectoryFailureIsFilesystemError) {
    store_.put("blocked/file.txt", "data");
    writeFile(temp_.path() / "blocked", "a file where a directory should be");
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};

    EXPECT_EQ(pool.processObject({"blocked/file.txt", 4}, {}), ObjectResult::Failed);
    EXPECT_EQ(store_.downloadCalls(), 0);

    errors_.close();
    const auto reported = errors_.drain();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].kind, ErrorKind::Filesystem);
}

TEST_F(DownloadWorkerPoolTest, UnsafeKeyIsRejected) {
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};

    EXPECT_EQ(pool.processObject({"../escape.txt", 1}, {}), ObjectResult::Failed);
    EXPECT_FALSE(fs::exists(temp_.path().parent_path() / "escape.txt"));
    EXPECT_EQ(errors_.errorCount(), 1);
}

TEST_F(DownloadWorkerPoolTest, NoTransferStartsAfterCancellation) {
    store_.put("f.txt", "data");
    CancellationSource source;
    source.cancel();
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};

    EXPECT_EQ(pool.processObject({"f.txt", 4}, source.token()), ObjectResult::Canceled);
    EXPECT_EQ(store_.downloadCalls(), 0);
    EXPECT_FALSE(fs::exists(temp_.path() / "f.txt"));
    EXPECT_EQ(errors_.errorCount(), 0);
}

TEST_F(DownloadWorkerPoolTest, CancelledTransferLeavesNoFile) {
    store_.put("slow.bin", "data");
    store_.blockDownloads();
    CancellationSource source;
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};

    std::thread canceller([&source]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        source.cancel();
    });
    EXPECT_EQ(pool.processObject({"slow.bin", 4}, source.token()), ObjectResult::Canceled);
    canceller.join();

    EXPECT_FALSE(fs::exists(temp_.path() / "slow.bin"));
    EXPECT_EQ(errors_.errorCount(), 1);
    EXPECT_EQ(progress_.snapshot().files_downloaded, 0);

    errors_.close();
    const auto reported = errors_.drain();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].kind, ErrorKind::Canceled);
    EXPECT_EQ(reported[0].key, "slow.bin");
    EXPECT_EQ(reported[0].message, "download of 'slow.bin' canceled");
}

TEST_F(DownloadWorkerPoolTest, PerObjectDeadlineFailsOnlyTheSlowObject) {
    config_.per_object_timeout = std::chrono::milliseconds(30);
    store_.put("slow.bin", "0123456789");
    store_.setKeyLatency("slow.bin", std::chrono::seconds(2));
    store_.put("fast.bin", "fast");
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};

    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(pool.processObject({"slow.bin", 10}, {}), ObjectResult::Failed);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
    EXPECT_FALSE(fs::exists(temp_.path() / "slow.bin"));

    EXPECT_EQ(pool.processObject({"fast.bin", 4}, {}), ObjectResult::Downloaded);
    EXPECT_EQ(readFile(temp_.path() / "fast.bin"), "fast");
    EXPECT_EQ(progress_.snapshot().files_downloaded, 1);
    EXPECT_EQ(progress_.snapshot().total_bytes, 4);

    errors_.close();
    const auto reported = errors_.drain();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].kind, ErrorKind::Transfer);
    EXPECT_EQ(reported[0].key, "slow.bin");
    EXPECT_NE(reported[0].message.find("deadline exceeded"), std::string::npos);
}

TEST_F(DownloadWorkerPoolTest, StartedWorkersStopWhenNoProducerRuns) {
    config_.max_workers = 4;
    store_.put("never.txt", "x");
    TaskQueue queue{4};
    CancellationSource source;
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};
    pool.start(queue, source.token());

    // What the engine does when it cannot start its lister.
    source.cancel();
    queue.close();
    pool.wait();

    EXPECT_EQ(store_.downloadCalls(), 0);
    EXPECT_EQ(errors_.errorCount(), 0);
}

TEST_F(DownloadWorkerPoolTest, WorkersDrainQueueWithBoundedConcurrency) {
    config_.max_workers = 3;
    store_.setDownloadLatency(std::chrono::milliseconds(5));
    TaskQueue queue{4};
    DownloadWorkerPool pool{store_, "bucket", temp_.path(), false, config_, progress_, errors_};
    pool.start(queue, {});

    for (int i = 0; i < 20; ++i) {
        const std::string key = "obj/" + std::to_string(i);
        store_.put(key, "payload");
        EXPECT_TRUE(queue.push({key, 7}, {}));
    }
    queue.close();
    pool.wait();

    EXPECT_EQ(progress_.snapshot().files_downloaded, 20);
    EXPECT_EQ(progress_.snapshot().total_bytes, 140);
    EXPECT_LE(store_.maxActiveDownloads(), 3);
    EXPECT_EQ(readFile(temp_.path() / "obj" / "19"), "payload");
}

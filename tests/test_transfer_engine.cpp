#include "s3downloader/transfer_engine.hpp"

#include "fake_object_store.hpp"
#include "temp_directory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <gtest/gtest.h>

using namespace s3downloader;
using s3downloader::test::FakeObjectStore;
using s3downloader::test::TempDirectory;
using s3downloader::test::readFile;
using s3downloader::test::writeFile;

namespace fs = std::filesystem;

class TransferEngineTest : public ::testing::Test {
protected:
    TransferEngineTest() : store_(std::make_shared<FakeObjectStore>()), engine_(store_) {
        config_.max_workers = 2;
        config_.queue_capacity = 8;
    }

    void putScenarioObjects() {
        store_->put("f1.txt", std::string(100, '1'));
        store_->put("f2.txt", std::string(200, '2'));
        store_->put("dir/f3.txt", std::string(50, '3'));
    }

    TransferOutcome run(bool overwrite, ProgressStream* sink = nullptr, const CancellationToken& token = {}) {
        return engine_.run("bucket", "", temp_.path(), overwrite, config_, sink, token);
    }

    std::shared_ptr<FakeObjectStore> store_;
    TransferEngine engine_;
    TempDirectory temp_;
    TransferConfig config_;
};

TEST_F(TransferEngineTest, DownloadsEveryListedObject) {
    putScenarioObjects();
    ProgressStream stream{100};

    const auto outcome = run(false, &stream);

    ASSERT_EQ(outcome.status(), TransferOutcome::Status::Success);
    const ProgressSnapshot expected{3, 3, 0, 350, 0};
    EXPECT_EQ(outcome.totals(), expected);
    EXPECT_EQ(outcome.summary(), "Download completed: 3 downloaded, 0 skipped, 350 bytes");

    ProgressSnapshot last;
    while (auto snapshot = stream.tryPop()) {
        last = *snapshot;
    }
    EXPECT_EQ(last, expected);
}

TEST_F(TransferEngineTest, PreExistingFileIsSkippedAndNettedOut) {
    putScenarioObjects();
    writeFile(temp_.path() / "f1.txt", "already here");

    const auto outcome = run(false);

    ASSERT_EQ(outcome.status(), TransferOutcome::Status::Success);
    const ProgressSnapshot expected{3, 2, 1, 250, 0};
    EXPECT_EQ(outcome.totals(), expected);
    EXPECT_EQ(readFile(temp_.path() / "f1.txt"), "already here");
}

TEST_F(TransferEngineTest, SecondRunTransfersNothing) {
    putScenarioObjects();
    ASSERT_TRUE(run(false).ok());
    const int transfers = store_->downloadCalls();
    EXPECT_EQ(transfers, 3);

    const auto second = run(false);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(store_->downloadCalls(), transfers);
    EXPECT_EQ(second.totals().files_skipped, second.totals().files_found);
    EXPECT_EQ(second.totals().files_downloaded, 0);
    EXPECT_EQ(second.totals().total_bytes, 0);
}

TEST_F(TransferEngineTest, OverwriteReplacesExistingFiles) {
    putScenarioObjects();
    writeFile(temp_.path() / "f1.txt", "stale");

    const auto outcome = run(true);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.totals().files_skipped, 0);
    EXPECT_EQ(outcome.totals().files_downloaded, 3);
    EXPECT_EQ(readFile(temp_.path() / "f1.txt"), std::string(100, '1'));
}

TEST_F(TransferEngineTest, MaterializesNestedKeys) {
    store_->put("a/b/c.txt", "content");
    store_->putMarker("a/");

    const auto outcome = run(false);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.totals().files_found, 1);
    EXPECT_TRUE(fs::is_directory(temp_.path() / "a"));
    EXPECT_TRUE(fs::is_directory(temp_.path() / "a" / "b"));
    EXPECT_EQ(readFile(temp_.path() / "a" / "b" / "c.txt"), "content");
}

TEST_F(TransferEngineTest, OneFailingObjectDoesNotStopTheOthers) {
    putScenarioObjects();
    store_->put("blocked/x.txt", "x");
    writeFile(temp_.path() / "blocked", "not a directory");

    const auto outcome = run(false);

    ASSERT_EQ(outcome.status(), TransferOutcome::Status::Failed);
    EXPECT_GE(outcome.errorCount(), 1);
    ASSERT_TRUE(outcome.firstError().has_value());
    EXPECT_EQ(outcome.firstError()->kind, ErrorKind::Filesystem);
    EXPECT_EQ(outcome.firstError()->key, "blocked/x.txt");
    EXPECT_EQ(outcome.totals().files_downloaded, 3);
    EXPECT_LT(outcome.totals().files_downloaded + outcome.totals().files_skipped, outcome.totals().files_found);
    EXPECT_EQ(readFile(temp_.path() / "dir" / "f3.txt"), std::string(50, '3'));
    EXPECT_EQ(outcome.summary().rfind("encountered 1 errors during download. First error: ", 0), 0u);
}

TEST_F(TransferEngineTest, TransferErrorsAreCountedBeyondRetainedDetail) {
    for (int i = 0; i < 6; ++i) {
        const std::string key = "bad/" + std::to_string(i);
        store_->put(key, "x");
        store_->failDownload(key);
    }
    store_->put("good.txt", "ok");

    const auto outcome = run(false);

    ASSERT_EQ(outcome.status(), TransferOutcome::Status::Failed);
    EXPECT_EQ(outcome.errorCount(), 6);
    EXPECT_EQ(outcome.totals().error_count, 6);
    EXPECT_EQ(outcome.firstError()->kind, ErrorKind::Transfer);
    EXPECT_EQ(readFile(temp_.path() / "good.txt"), "ok");
    EXPECT_FALSE(fs::exists(temp_.path() / "bad" / "0"));
}

TEST_F(TransferEngineTest, PerObjectDeadlineFailsSlowObject) {
    putScenarioObjects();
    store_->put("slow.bin", std::string(64, 's'));
    store_->setKeyLatency("slow.bin", std::chrono::seconds(5));
    config_.per_object_timeout = std::chrono::milliseconds(40);

    const auto started = std::chrono::steady_clock::now();
    const auto outcome = run(false);

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
    ASSERT_EQ(outcome.status(), TransferOutcome::Status::Failed);
    EXPECT_EQ(outcome.errorCount(), 1);
    ASSERT_TRUE(outcome.firstError().has_value());
    EXPECT_EQ(outcome.firstError()->kind, ErrorKind::Transfer);
    EXPECT_EQ(outcome.firstError()->key, "slow.bin");
    EXPECT_NE(outcome.firstError()->message.find("deadline exceeded"), std::string::npos);
    EXPECT_FALSE(fs::exists(temp_.path() / "slow.bin"));

    EXPECT_EQ(outcome.totals().files_found, 4);
    EXPECT_EQ(outcome.totals().files_downloaded, 3);
    EXPECT_EQ(outcome.totals().total_bytes, 350);
    EXPECT_EQ(readFile(temp_.path() / "f2.txt"), std::string(200, '2'));
}

TEST_F(TransferEngineTest, ListingFailureStillDrainsQueuedWork) {
    store_->setPageSize(2);
    for (int i = 0; i < 6; ++i) {
        store_->put("k" + std::to_string(i), "v");
    }
    store_->failListingAfter(1);

    const auto outcome = run(false);

    ASSERT_EQ(outcome.status(), TransferOutcome::Status::Failed);
    EXPECT_EQ(outcome.firstError()->kind, ErrorKind::Listing);
    EXPECT_EQ(outcome.totals().files_found, 2);
    EXPECT_EQ(outcome.totals().files_downloaded, 2);
}

TEST_F(TransferEngineTest, PaginatedListingLargerThanQueue) {
    store_->setPageSize(7);
    config_.queue_capacity = 2;
    config_.max_workers = 3;
    for (int i = 0; i < 50; ++i) {
        store_->put("many/" + std::to_string(i), "0123456789");
    }

    const auto outcome = run(false);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.totals().files_found, 50);
    EXPECT_EQ(outcome.totals().files_downloaded, 50);
    EXPECT_EQ(outcome.totals().total_bytes, 500);
    EXPECT_LE(store_->maxActiveDownloads(), 3);
}

TEST_F(TransferEngineTest, EmptyListingSucceeds) {
    const auto outcome = run(false);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.totals(), ProgressSnapshot{});
}

TEST_F(TransferEngineTest, CancelledBeforeStartTransfersNothing) {
    putScenarioObjects();
    CancellationSource source;
    source.cancel();

    const auto outcome = run(false, nullptr, source.token());

    EXPECT_EQ(outcome.status(), TransferOutcome::Status::Canceled);
    EXPECT_EQ(outcome.summary(), "download operation canceled");
    EXPECT_EQ(store_->downloadCalls(), 0);
}

TEST_F(TransferEngineTest, CancellationStopsInFlightTransfers) {
    putScenarioObjects();
    store_->blockDownloads();
    CancellationSource source;

    std::thread canceller([&source]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.cancel();
    });
    const auto outcome = run(false, nullptr, source.token());
    canceller.join();

    EXPECT_EQ(outcome.status(), TransferOutcome::Status::Canceled);
    EXPECT_LE(store_->downloadCalls(), config_.max_workers);
    EXPECT_EQ(outcome.totals().files_downloaded, 0);
    EXPECT_FALSE(fs::exists(temp_.path() / "f1.txt"));
    EXPECT_FALSE(fs::exists(temp_.path() / "f2.txt"));

    // Transfers that were in flight are reported, the outcome stays Canceled.
    EXPECT_GE(outcome.errorCount(), 1);
    EXPECT_LE(outcome.errorCount(), config_.max_workers);
    EXPECT_EQ(outcome.summary(), "download operation canceled");
}

TEST_F(TransferEngineTest, OperationDeadlineCancelsRun) {
    putScenarioObjects();
    store_->blockDownloads();
    config_.operation_timeout = std::chrono::milliseconds(50);

    const auto outcome = run(false);

    EXPECT_EQ(outcome.status(), TransferOutcome::Status::Canceled);
}

TEST_F(TransferEngineTest, CreatesMissingDestination) {
    store_->put("f.txt", "x");
    const auto destination = temp_.path() / "new" / "root";

    const auto outcome = engine_.run("bucket", "", destination, false, config_, nullptr);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(readFile(destination / "f.txt"), "x");
}

TEST_F(TransferEngineTest, UncreatableDestinationFails) {
    store_->put("f.txt", "x");
    writeFile(temp_.path() / "file", "x");

    const auto outcome = engine_.run("bucket", "", temp_.path() / "file" / "root", false, config_, nullptr);

    ASSERT_EQ(outcome.status(), TransferOutcome::Status::Failed);
    EXPECT_EQ(outcome.firstError()->message.rfind("download path doesn't exist and couldn't be created", 0), 0u);
    EXPECT_EQ(store_->listCalls(), 0);
}

TEST_F(TransferEngineTest, RejectsInvalidArguments) {
    EXPECT_THROW(static_cast<void>(engine_.run("", "", temp_.path(), false, config_, nullptr)),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(engine_.run("bucket", "", fs::path{}, false, config_, nullptr)),
                 std::invalid_argument);

    config_.max_workers = 0;
    EXPECT_THROW(static_cast<void>(run(false)), std::invalid_argument);
    EXPECT_THROW(TransferEngine{nullptr}, std::invalid_argument);
}

TEST_F(TransferEngineTest, PrefixLimitsDownloads) {
    putScenarioObjects();

    const auto outcome = engine_.run("bucket", "dir/", temp_.path(), false, config_, nullptr);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.totals().files_found, 1);
    EXPECT_TRUE(fs::exists(temp_.path() / "dir" / "f3.txt"));
    EXPECT_FALSE(fs::exists(temp_.path() / "f1.txt"));
}

#include "s3downloader/error_collector.hpp"

#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using s3downloader::ErrorCollector;
using s3downloader::ErrorKind;
using s3downloader::ProgressAggregator;
using s3downloader::ProgressStream;

TEST(ErrorCollectorTest, KeepsErrorsInArrivalOrder) {
    ProgressAggregator progress;
    ErrorCollector errors{4, progress};

    errors.report({ErrorKind::Transfer, "a", "first"});
    errors.report({ErrorKind::Filesystem, "b", "second"});
    errors.close();

    const auto retained = errors.drain();
    ASSERT_EQ(retained.size(), 2u);
    EXPECT_EQ(retained[0].message, "first");
    EXPECT_EQ(retained[0].kind, ErrorKind::Transfer);
    EXPECT_EQ(retained[1].key, "b");
}

TEST(ErrorCollectorTest, DetailIsLossyButCountIsNot) {
    ProgressAggregator progress;
    ErrorCollector errors{2, progress};

    for (int i = 0; i < 5; ++i) {
        errors.report({ErrorKind::Transfer, std::to_string(i), "boom " + std::to_string(i)});
    }
    errors.close();

    EXPECT_EQ(errors.errorCount(), 5);
    EXPECT_EQ(progress.snapshot().error_count, 5);
    const auto retained = errors.drain();
    ASSERT_EQ(retained.size(), 2u);
    EXPECT_EQ(retained.front().message, "boom 0");
}

TEST(ErrorCollectorTest, ReportPublishesProgress) {
    ProgressStream stream{4};
    ProgressAggregator progress{&stream};
    ErrorCollector errors{1, progress};

    errors.report({ErrorKind::Listing, {}, "error listing objects: denied"});

    auto snapshot = stream.tryPop();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->error_count, 1);
}

TEST(ErrorCollectorTest, ConcurrentReportsAreAllCounted) {
    ProgressAggregator progress;
    ErrorCollector errors{3, progress};

    std::vector<std::thread> reporters;
    for (int t = 0; t < 6; ++t) {
        reporters.emplace_back([&errors]() {
            for (int i = 0; i < 50; ++i) {
                errors.report({ErrorKind::Transfer, "k", "failed"});
            }
        });
    }
    for (auto& t : reporters) {
        t.join();
    }
    errors.close();

    EXPECT_EQ(errors.errorCount(), 300);
    EXPECT_EQ(errors.drain().size(), 3u);
}

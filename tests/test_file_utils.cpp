#include "s3downloader/file_utils.hpp"

#include "temp_directory.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace fs = std::filesystem;
namespace fileutils = s3downloader::fileutils;

TEST(FileUtilsTest, ResolvesNestedKeyBelowRoot) {
    const fs::path root{"/data/out"};
    EXPECT_EQ(fileutils::resolveLocalPath(root, "a/b/c.txt"), root / "a" / "b" / "c.txt");
    EXPECT_EQ(fileutils::resolveLocalPath(root, "f1.txt"), root / "f1.txt");
}

TEST(FileUtilsTest, DropsEmptyAndDotSegments) {
    const fs::path root{"/data/out"};
    EXPECT_EQ(fileutils::resolveLocalPath(root, "/a//./b.txt"), root / "a" / "b.txt");
}

TEST(FileUtilsTest, RejectsKeysEscapingRoot) {
    const fs::path root{"/data/out"};
    EXPECT_THROW(fileutils::resolveLocalPath(root, "../etc/passwd"), std::invalid_argument);
    EXPECT_THROW(fileutils::resolveLocalPath(root, "a/../../b"), std::invalid_argument);
}

TEST(FileUtilsTest, RejectsKeysWithoutFileName) {
    const fs::path root{"/data/out"};
    EXPECT_THROW(fileutils::resolveLocalPath(root, ""), std::invalid_argument);
    EXPECT_THROW(fileutils::resolveLocalPath(root, "/./"), std::invalid_argument);
}

TEST(FileUtilsTest, EnsureDirectoryExistsCreatesParents) {
    s3downloader::test::TempDirectory temp;
    const auto nested = temp.path() / "a" / "b" / "c";

    EXPECT_FALSE(fileutils::ensureDirectoryExists(nested));
    EXPECT_TRUE(fs::is_directory(nested));
    EXPECT_FALSE(fileutils::ensureDirectoryExists(nested));
}

TEST(FileUtilsTest, EnsureDirectoryExistsIsSafeConcurrently) {
    s3downloader::test::TempDirectory temp;
    const auto nested = temp.path() / "shared" / "dir";

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&nested]() { EXPECT_FALSE(fileutils::ensureDirectoryExists(nested)); });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_TRUE(fs::is_directory(nested));
}

TEST(FileUtilsTest, EnsureDirectoryExistsFailsWhenFileIsInTheWay) {
    s3downloader::test::TempDirectory temp;
    std::ofstream(temp.path() / "blocker") << "x";

    EXPECT_TRUE(fileutils::ensureDirectoryExists(temp.path() / "blocker" / "child"));
    EXPECT_TRUE(fileutils::ensureDirectoryExists({}));
}

TEST(FileUtilsTest, FileExists) {
    s3downloader::test::TempDirectory temp;
    EXPECT_TRUE(fileutils::fileExists(temp.path()));
    EXPECT_FALSE(fileutils::fileExists(temp.path() / "missing"));
}

/**
 * @file test_filescanner.cpp
 * @brief Unit tests for the FileScanner class
 *
 * ## Test Coverage
 *
 * ### Basic Scanning
 * - ScansEmptyDirectory: Empty directory handling
 * - RecordsOnlyRegularFiles: Directories are walked, not recorded
 * - DetectsFileSize: Accurate size reporting (1 byte, 1 KB)
 * - RecordsParentDirectory: parent_directory of nested files
 * - NormalizesRoot: Trailing separator on the root
 *
 * ### Ordering
 * - SortsBySizeDescending / SizeTiesSortByPath
 * - SortsByAgeStalestFirst / AgeTiesSortByPath
 *
 * ### Links and Errors
 * - SurvivesSymlinkCycle: A link back to an ancestor terminates
 * - ScansLinkedDirectoryOnce / DoesNotFollowLinksOutOfTree
 * - DoesNotRecordFileLinks
 * - ThrowsOnNonExistentRoot / ThrowsOnFileRoot
 * - ReportsProgress
 */

#include <gtest/gtest.h>
#include "filescanner.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

class FileScannerTest : public ::testing::Test {
protected:
    /** @brief Path to temporary test directory */
    std::filesystem::path test_dir;

    FileScanner scanner;

    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() /
            ("antichonk_filescanner_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    void createFile(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }

    void createDir(const std::string& name) {
        std::filesystem::create_directories(test_dir / name);
    }

    /** @brief Sets the modification time to @p days days ago */
    void setAge(const std::string& name, int days) {
        std::filesystem::last_write_time(
            test_dir / name,
            FileRecord::Clock::now() - std::chrono::hours(24 * days));
    }

    static std::string name(const FileRecord& record) {
        return record.getPath().filename().string();
    }
};

TEST_F(FileScannerTest, ScansEmptyDirectory) {
    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);

    EXPECT_TRUE(results.empty());
}

TEST_F(FileScannerTest, RecordsOnlyRegularFiles) {
    createDir("empty_dir");
    createDir("subdir");
    createFile("subdir/file.txt", "test");

    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(name(results[0]), "file.txt");
}

TEST_F(FileScannerTest, DetectsFileSize) {
    createFile("small.txt", "x");
    createFile("medium.txt", std::string(1024, 'x'));

    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(name(results[0]), "medium.txt");
    EXPECT_EQ(results[0].getFileSize(), 1024u);
    EXPECT_EQ(name(results[1]), "small.txt");
    EXPECT_EQ(results[1].getFileSize(), 1u);
}

TEST_F(FileScannerTest, RecordsParentDirectory) {
    createFile("root_file.txt", "root");
    createFile("subdir/deepdir/deep_file.txt", "deep");

    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);

    ASSERT_EQ(results.size(), 2u);
    for (const auto& record : results) {
        EXPECT_TRUE(record.getPath().is_absolute());
        if (name(record) == "deep_file.txt") {
            EXPECT_EQ(record.getParentDirectory(), test_dir / "subdir" / "deepdir");
        } else {
            EXPECT_EQ(record.getParentDirectory(), test_dir);
        }
    }
}

TEST_F(FileScannerTest, NormalizesRoot) {
    createFile("file.txt", "test");

    auto results = scanner.scanDirectory(test_dir.string() + "/", OrderBy::Size);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].getParentDirectory(), test_dir);
    EXPECT_EQ(FileScanner::normalizeRoot(test_dir.string() + "/"), test_dir);
}

TEST_F(FileScannerTest, SortsBySizeDescending) {
    createFile("a", std::string(10, 'x'));
    createFile("b", std::string(30, 'x'));
    createFile("c", std::string(20, 'x'));

    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(name(results[0]), "b");
    EXPECT_EQ(name(results[1]), "c");
    EXPECT_EQ(name(results[2]), "a");
}

TEST_F(FileScannerTest, SizeTiesSortByPath) {
    createFile("zebra.txt", "same");
    createFile("apple.txt", "same");
    createFile("sub/banana.txt", "same");

    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(name(results[0]), "apple.txt");
    EXPECT_EQ(results[1].getPath(), test_dir / "sub" / "banana.txt");
    EXPECT_EQ(name(results[2]), "zebra.txt");
}

TEST_F(FileScannerTest, SortsByAgeStalestFirst) {
    createFile("recent.txt", "r");
    createFile("old.txt", "o");
    createFile("ancient.txt", "a");
    setAge("recent.txt", 1);
    setAge("old.txt", 100);
    setAge("ancient.txt", 1000);

    auto results = scanner.scanDirectory(test_dir, OrderBy::Age);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(name(results[0]), "ancient.txt");
    EXPECT_EQ(name(results[1]), "old.txt");
    EXPECT_EQ(name(results[2]), "recent.txt");
}

TEST_F(FileScannerTest, AgeTiesSortByPath) {
    createFile("b.txt", "b");
    createFile("a.txt", "a");
    auto when = FileRecord::Clock::now() - std::chrono::hours(48);
    std::filesystem::last_write_time(test_dir / "a.txt", when);
    std::filesystem::last_write_time(test_dir / "b.txt", when);

    auto results = scanner.scanDirectory(test_dir, OrderBy::Age);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(name(results[0]), "a.txt");
    EXPECT_EQ(name(results[1]), "b.txt");
}

TEST_F(FileScannerTest, SurvivesSymlinkCycle) {
    createFile("dir/file.txt", "test");
    std::filesystem::create_directory_symlink(test_dir, test_dir / "dir" / "loop");

    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].getPath(), test_dir / "dir" / "file.txt");
}

/**
 * @test ScansLinkedDirectoryOnce
 * @brief A link to a directory inside the tree does not list its files a
 *        second time under the link path
 */
TEST_F(FileScannerTest, ScansLinkedDirectoryOnce) {
    createFile("real/x", "data");
    std::filesystem::create_directory_symlink(test_dir / "real", test_dir / "link");

    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].getPath(), test_dir / "real" / "x");
    EXPECT_EQ(results[0].getParentDirectory(), test_dir / "real");
}

TEST_F(FileScannerTest, DoesNotFollowLinksOutOfTree) {
    auto outside = test_dir.string() + "_outside";
    std::filesystem::remove_all(outside);
    std::filesystem::create_directories(outside);
    std::ofstream(std::filesystem::path(outside) / "linked.txt") << "linked";
    std::filesystem::create_directory_symlink(outside, test_dir / "link");
    createFile("own.txt", "own");

    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);
    std::filesystem::remove_all(outside);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(name(results[0]), "own.txt");
}

TEST_F(FileScannerTest, DoesNotRecordFileLinks) {
    createFile("real.txt", "real");
    std::filesystem::create_symlink(test_dir / "real.txt", test_dir / "alias.txt");

    auto results = scanner.scanDirectory(test_dir, OrderBy::Size);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(name(results[0]), "real.txt");
}

TEST_F(FileScannerTest, ThrowsOnNonExistentRoot) {
    EXPECT_THROW(scanner.scanDirectory("/nonexistent/antichonk/path", OrderBy::Size),
                 ScanError);
}

TEST_F(FileScannerTest, ThrowsOnFileRoot) {
    createFile("file.txt", "test");

    EXPECT_THROW(scanner.scanDirectory(test_dir / "file.txt", OrderBy::Age),
                 ScanError);
}

TEST_F(FileScannerTest, ReportsProgress) {
    for (int i = 0; i < 150; ++i) {
        createFile("f" + std::to_string(i), "x");
    }

    std::vector<int> reports;
    auto results = scanner.scanDirectory(test_dir, OrderBy::Size,
                                         [&](int count) { reports.push_back(count); });

    EXPECT_EQ(results.size(), 150u);
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0], 100);
    EXPECT_EQ(reports[1], 150);
}

TEST(OrderByTest, ParsesCommandLineValues) {
    EXPECT_EQ(parseOrderBy("age"), OrderBy::Age);
    EXPECT_EQ(parseOrderBy("size"), OrderBy::Size);
    EXPECT_FALSE(parseOrderBy("Size").has_value());
    EXPECT_FALSE(parseOrderBy("").has_value());
    EXPECT_EQ(toString(OrderBy::Age), "age");
}

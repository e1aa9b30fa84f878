/**
 * @file test_filerecord.cpp
 * @brief Unit tests for FileRecord and the formatting helpers
 *
 * @see FileRecord
 * @see formatBytes()
 * @see formatAge()
 */

#include <gtest/gtest.h>
#include "filerecord.hpp"
#include "utils.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

/**
 * @test BasicConstruction
 * @brief Verifies construction and getters, parent directory derivation
 */
TEST(FileRecordTest, BasicConstruction) {
    auto now = FileRecord::Clock::now();
    FileRecord record("/data/movies/film.mkv", 1024, now);

    EXPECT_EQ(record.getPath(), "/data/movies/film.mkv");
    EXPECT_EQ(record.getParentDirectory(), "/data/movies");
    EXPECT_EQ(record.getFileSize(), 1024u);
    EXPECT_EQ(record.getModifiedTime(), now);
    EXPECT_EQ(record.getDisplayName(), "film.mkv");
}

TEST(FileRecordTest, SizeFormatted) {
    auto now = FileRecord::Clock::now();

    EXPECT_EQ(FileRecord("/a", 0, now).getSizeFormatted(), "0 B");
    EXPECT_EQ(FileRecord("/a", 512, now).getSizeFormatted(), "512.0 B");
    EXPECT_EQ(FileRecord("/a", 1536, now).getSizeFormatted(), "1.5 KB");
}

/**
 * @test AgeInDays
 * @brief Verifies whole-day ages, including future timestamps
 *
 * A file modified in the future counts as zero days old.
 */
TEST(FileRecordTest, AgeInDays) {
    auto now = FileRecord::Clock::now();
    FileRecord old_record("/old", 1, now - std::chrono::hours(24 * 10 + 5));
    FileRecord future_record("/future", 1, now + std::chrono::hours(48));

    EXPECT_EQ(old_record.getAgeDays(now), 10);
    EXPECT_EQ(old_record.getAgeFormatted(now), "10 days");
    EXPECT_EQ(future_record.getAgeDays(now), 0);
    EXPECT_EQ(future_record.getAgeFormatted(now), "0 days");
}

TEST(FileRecordTest, ExistsOnDisk) {
    auto path = std::filesystem::temp_directory_path() / "antichonk_filerecord_test.txt";
    std::ofstream(path) << "data";

    FileRecord record(path, 4, FileRecord::Clock::now());
    EXPECT_TRUE(record.existsOnDisk());

    std::filesystem::remove(path);
    EXPECT_FALSE(record.existsOnDisk());
}

/**
 * @test FormatBytesUnits
 * @brief Verifies binary unit selection in formatBytes()
 */
TEST(UtilsTest, FormatBytesUnits) {
    EXPECT_EQ(formatBytes(0), "0 B");
    EXPECT_EQ(formatBytes(1023), "1023.0 B");
    EXPECT_EQ(formatBytes(1024), "1.0 KB");
    EXPECT_EQ(formatBytes(1048576), "1.0 MB");
    EXPECT_EQ(formatBytes(1073741824ULL), "1.0 GB");
    EXPECT_EQ(formatBytes(1099511627776ULL * 2048), "2048.0 TB");
}

TEST(UtilsTest, FormatAge) {
    EXPECT_EQ(formatAge(0), "0 days");
    EXPECT_EQ(formatAge(1), "1 day");
    EXPECT_EQ(formatAge(400), "400 days");
    EXPECT_EQ(formatAge(-3), "0 days");
}

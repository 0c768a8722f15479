/**
 * @file test_filerecord.cpp
 * @brief Unit tests for the FileRecord class
 */

#include <gtest/gtest.h>
#include "errors.hpp"
#include "filerecord.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class FileRecordTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   ("neardup_filerecord_" + std::string(info->name()) + "_" +
                    std::to_string(::getpid()));
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }
};

/**
 * @test FromPathReadsMetadata
 * @brief Size and modification time come from the filesystem, the path is
 *        made absolute
 */
TEST_F(FileRecordTest, FromPathReadsMetadata) {
    auto path = test_dir / "sub" / ".." / "data.txt";
    {
        std::ofstream file(test_dir / "data.txt");
        file << "twelve bytes";
    }
    const auto mtime = fs::file_time_type::clock::now() - std::chrono::hours(24);
    fs::last_write_time(test_dir / "data.txt", mtime);

    auto record = FileRecord::fromPath(path);

    EXPECT_EQ(record.getPath(), (test_dir / "data.txt").lexically_normal().string());
    EXPECT_EQ(record.getFileSize(), 12u);
    EXPECT_EQ(record.getDisplayName(), "data.txt");
    EXPECT_FALSE(record.hasSignature());
    EXPECT_FALSE(record.zeroFiles());

    const auto age = FileRecord::Clock::now() - record.getModifiedTime();
    EXPECT_GT(age, std::chrono::hours(23));
    EXPECT_LT(age, std::chrono::hours(25));
}

TEST_F(FileRecordTest, MissingFileThrows) {
    EXPECT_THROW(FileRecord::fromPath(test_dir / "missing.txt"), FileOperationError);
}

TEST_F(FileRecordTest, EmptyFile) {
    std::ofstream(test_dir / "empty.txt").close();

    auto record = FileRecord::fromPath(test_dir / "empty.txt");
    EXPECT_TRUE(record.zeroFiles());
}

TEST_F(FileRecordTest, StoresSignature) {
    FileRecord record("/data/a.txt", 3, FileRecord::Clock::now(), FileRecord::Clock::now());
    record.setSignature(Signature(std::vector<uint32_t>{1, 2, 3}));

    ASSERT_TRUE(record.hasSignature());
    EXPECT_EQ(record.getSignature()->size(), 3u);
    EXPECT_EQ(record.getDisplayName(), "a.txt");
}

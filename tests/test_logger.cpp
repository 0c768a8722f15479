/**
 * @file test_logger.cpp
 * @brief Unit tests for the structured Logger
 */

#include <gtest/gtest.h>
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

TEST(LoggerTest, FormatsJsonRecord) {
    auto record = Logger::formatRecord(Logger::Level::Info, "Moved file",
                                       {{"operation", "move"}, {"group_id", "4"}});
    EXPECT_EQ(record["level"], "INFO");
    EXPECT_EQ(record["logger"], "neardup");
    EXPECT_EQ(record["message"], "Moved file");
    EXPECT_EQ(record["operation"], "move");
    EXPECT_EQ(record["group_id"], "4");
    EXPECT_FALSE(record.contains("timestamp"));
}

TEST(LoggerTest, FieldValuesSurviveEscaping) {
    auto record = Logger::formatRecord(Logger::Level::Error, "Failed",
                                       {{"path", "/tmp/my file.txt"},
                                        {"error", "said \"no\""},
                                        {"empty", ""}});
    auto parsed = nlohmann::json::parse(record.dump());
    EXPECT_EQ(parsed["path"], "/tmp/my file.txt");
    EXPECT_EQ(parsed["error"], "said \"no\"");
    EXPECT_EQ(parsed["empty"], "");
}

TEST(LoggerTest, ConsoleHidesDebugUnlessVerbose) {
    std::ostringstream out;
    Logger logger(&out);

    logger.debug("hidden", {{"k", "v"}});
    logger.info("shown", {{"k", "v"}});
    EXPECT_EQ(out.str(), "shown\n");

    out.str("");
    logger.setVerbose(true);
    logger.debug("detail", {{"k", "v"}});
    EXPECT_EQ(out.str(), "detail k=v\n");
}

TEST(LoggerTest, ConsolePrefixesWarningsAndErrors) {
    std::ostringstream out;
    Logger logger(&out);

    logger.warning("careful");
    logger.error("broken");
    EXPECT_EQ(out.str(), "warning: careful\nerror: broken\n");
}

TEST(LoggerTest, SilentLoggerWritesNothing) {
    Logger quiet{nullptr};
    EXPECT_NO_THROW(quiet.error("nobody hears this"));
}

/**
 * @test FileSinkReceivesEveryLevel
 * @brief The log file gets one JSON object per record, debug included
 */
TEST(LoggerTest, FileSinkReceivesEveryLevel) {
    auto path = fs::temp_directory_path() /
                ("neardup_logger_" + std::to_string(::getpid())) / "run.log";
    Logger logger(nullptr);

    ASSERT_TRUE(logger.openFile(path));
    logger.debug("Signing", {{"path", "/a.txt"}});
    logger.info("Moved", {{"status", "moved"}});
    logger.closeFile();

    std::ifstream file(path);
    std::vector<nlohmann::json> records;
    std::string line;
    while (std::getline(file, line)) {
        records.push_back(nlohmann::json::parse(line));
    }

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["level"], "DEBUG");
    EXPECT_EQ(records[0]["message"], "Signing");
    EXPECT_EQ(records[0]["path"], "/a.txt");
    EXPECT_TRUE(records[0]["timestamp"].is_string());
    EXPECT_EQ(records[1]["level"], "INFO");
    EXPECT_EQ(records[1]["status"], "moved");

    fs::remove_all(path.parent_path());
}

TEST(LoggerTest, FileSinkToleratesInvalidUtf8) {
    auto path = fs::temp_directory_path() /
                ("neardup_logger_utf8_" + std::to_string(::getpid())) / "run.log";
    Logger logger(nullptr);

    ASSERT_TRUE(logger.openFile(path));
    EXPECT_NO_THROW(logger.info("Moved", {{"source", "/data/caf\xe9.txt"}}));
    logger.closeFile();

    std::ifstream file(path);
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(file, line)));
    EXPECT_EQ(nlohmann::json::parse(line)["message"], "Moved");

    fs::remove_all(path.parent_path());
}

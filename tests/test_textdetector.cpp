/**
 * @file test_textdetector.cpp
 * @brief Unit tests for the TextDetector class
 */

#include <gtest/gtest.h>
#include "textdetector.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

TEST(TextDetectorTest, PlainAsciiIsText) {
    TextDetector detector;
    EXPECT_TRUE(detector.isText("hello world\nsecond line\ttabbed\r\n"));
    EXPECT_DOUBLE_EQ(TextDetector::printableRatio("hello"), 1.0);
}

TEST(TextDetectorTest, EmptySampleIsText) {
    TextDetector detector;
    EXPECT_TRUE(detector.isText(""));
    EXPECT_DOUBLE_EQ(TextDetector::printableRatio(""), 1.0);
}

TEST(TextDetectorTest, MultiByteUtf8IsText) {
    TextDetector detector;
    // é, €, 😀
    EXPECT_TRUE(detector.isText("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
}

/**
 * @test InvalidUtf8IsNotText
 * @brief Stray continuation bytes, overlong forms and surrogates fail
 *        decoding outright
 */
TEST(TextDetectorTest, InvalidUtf8IsNotText) {
    TextDetector detector;
    EXPECT_LT(TextDetector::printableRatio("abc\x80"), 0.0);
    EXPECT_LT(TextDetector::printableRatio("\xC0\xAF"), 0.0);
    EXPECT_LT(TextDetector::printableRatio("\xED\xA0\x80"), 0.0);
    EXPECT_LT(TextDetector::printableRatio("\xF5\x80\x80\x80"), 0.0);
    EXPECT_FALSE(detector.isText("caf\xE9"));
}

TEST(TextDetectorTest, ControlCharactersLowerTheRatio) {
    TextDetector detector;
    std::string sample = "abcdefgh";
    sample += std::string("\x01\x02", 2);

    EXPECT_DOUBLE_EQ(TextDetector::printableRatio(sample), 0.8);
    EXPECT_TRUE(detector.isText(sample));

    sample += '\x03';
    EXPECT_FALSE(detector.isText(sample));

    TextDetector lenient(0.5);
    EXPECT_TRUE(lenient.isText(sample));
}

TEST(TextDetectorTest, NulBytesAreBinary) {
    TextDetector detector;
    EXPECT_FALSE(detector.isText(std::string(16, '\0')));
}

/**
 * @test TruncatedSequenceAtSampleEnd
 * @brief A multi-byte sequence cut off by the sample boundary is only
 *        accepted when the sample is known to be truncated
 */
TEST(TextDetectorTest, TruncatedSequenceAtSampleEnd) {
    const std::string cut = "euro \xE2\x82";

    EXPECT_LT(TextDetector::printableRatio(cut, false), 0.0);
    EXPECT_DOUBLE_EQ(TextDetector::printableRatio(cut, true), 1.0);
}

TEST(TextDetectorTest, DetectsFileContent) {
    auto dir = fs::temp_directory_path() / ("neardup_textdetector_" + std::to_string(::getpid()));
    fs::create_directories(dir);

    {
        std::ofstream text(dir / "text.txt", std::ios::binary);
        text << "plain text file\n";
        std::ofstream binary(dir / "binary.txt", std::ios::binary);
        binary << std::string("\x7F" "ELF\x02\x01\x01\x00\x00\x00", 10);
    }

    // 'e' then a two byte sequence straddling the sample boundary
    std::string large(TextDetector::SAMPLE_SIZE - 1, 'e');
    large += "\xC3\xA9 tail";
    {
        std::ofstream out(dir / "large.txt", std::ios::binary);
        out << large;
    }

    TextDetector detector;
    EXPECT_TRUE(detector.isTextFile(dir / "text.txt"));
    EXPECT_FALSE(detector.isTextFile(dir / "binary.txt"));
    EXPECT_TRUE(detector.isTextFile(dir / "large.txt"));
    EXPECT_FALSE(detector.isTextFile(dir / "missing.txt"));

    fs::remove_all(dir);
}

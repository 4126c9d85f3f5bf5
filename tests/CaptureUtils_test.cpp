#include <gtest/gtest.h>
#include "capturepush/capture_utils.hpp"
#include "capturepush/generic_exception.hpp"
#include "MockCapture.hpp"

TEST(CaptureUtilsTest, HashesAndEncodings) {
    EXPECT_EQ(CaptureUtils::sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(CaptureUtils::sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::string hello = "hello world";
    EXPECT_EQ(CaptureUtils::toBase64((const unsigned char *)hello.data(), hello.size()), "aGVsbG8gd29ybGQ=");
}

TEST(CaptureUtilsTest, NormalizesWhitespace) {
    EXPECT_EQ(CaptureUtils::normalizeWhitespace("  Linear \t Algebra\n"), "Linear Algebra");
    EXPECT_EQ(CaptureUtils::normalizeWhitespace(""), "");
    EXPECT_EQ(CaptureUtils::normalizeWhitespace(" \n "), "");
}

TEST(CaptureUtilsTest, EscapesPathComponents) {
    EXPECT_EQ(CaptureUtils::escapePathComponent("10001-alice"), "10001-alice");
    EXPECT_EQ(CaptureUtils::escapePathComponent("a/b"), "a%2Fb");
    EXPECT_EQ(CaptureUtils::escapePathComponent(".."), "%2E.");
    EXPECT_NE(CaptureUtils::escapePathComponent("a b"), CaptureUtils::escapePathComponent("a_b"));
}

TEST(CaptureUtilsTest, ParsesCalendarDates) {
    time_t t = 0;
    ASSERT_TRUE(CaptureUtils::parseISODate("2024-02-29", t));
    EXPECT_EQ(CaptureUtils::formatISODate(t), "2024-02-29");
    EXPECT_FALSE(CaptureUtils::parseISODate("2023-02-29", t));
    EXPECT_FALSE(CaptureUtils::parseISODate("2024-02-29x", t));
    EXPECT_FALSE(CaptureUtils::parseISODate("yesterday", t));
}

TEST(CaptureUtilsTest, WritesFilesAtomically) {
    std::string dir = MakeTestDir("utils");
    std::string path = dir + "/nested/deeper/file.txt";

    CaptureUtils::makeDirectories(dir + "/nested/deeper");
    CaptureUtils::writeFileAtomically(path, "first");
    CaptureUtils::writeFileAtomically(path, "second");
    EXPECT_EQ(CaptureUtils::readFile(path), "second");

    auto names = CaptureUtils::listDirectory(dir + "/nested/deeper");
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "file.txt");

    CaptureUtils::removeTree(dir + "/nested");
    EXPECT_FALSE(CaptureUtils::fileExists(path));
    EXPECT_THROW(CaptureUtils::readFile(path), GenericException);
    RemoveTestDir(dir);
}

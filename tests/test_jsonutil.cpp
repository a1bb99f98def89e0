#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/JsonUtil.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace iperf_discovery {
namespace jsonutil {

namespace {
    std::chrono::system_clock::time_point utc(int year, int mon, int day, int h, int m, int s) {
        std::tm tm_struct = {};
        tm_struct.tm_year = year - 1900;
        tm_struct.tm_mon = mon - 1;
        tm_struct.tm_mday = day;
        tm_struct.tm_hour = h;
        tm_struct.tm_min = m;
        tm_struct.tm_sec = s;
        return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
    }
}

TEST(JsonUtilTest, EscapeEmptyString) {
    EXPECT_EQ(escape(""), "");
}

TEST(JsonUtilTest, EscapeNormalString) {
    EXPECT_EQ(escape("MAC=00:11:22:33:44:55"), "MAC=00:11:22:33:44:55");
}

TEST(JsonUtilTest, EscapeQuoteAndBackslash) {
    EXPECT_EQ(escape("He said \"Hello\""), "He said \\\"Hello\\\"");
    EXPECT_EQ(escape("Gi1\\0\\3"), "Gi1\\\\0\\\\3");
}

TEST(JsonUtilTest, EscapeReadableControls) {
    EXPECT_EQ(escape("a\nb\rc\td\be\ff"), "a\\nb\\rc\\td\\be\\ff");
}

TEST(JsonUtilTest, EscapeNullCharacter) {
    std::string input = "Test";
    input += '\0';
    input += "End";
    EXPECT_EQ(escape(input), "Test\\u0000End");
}

TEST(JsonUtilTest, EscapeAllControlCharacters) {
    for (int i = 0; i < 0x20; ++i) {
        if (i == '\t' || i == '\n' || i == '\r' || i == '\b' || i == '\f') continue;
        std::string input(1, static_cast<char>(i));
        std::ostringstream expected;
        expected << "\\u" << std::hex << std::setw(4) << std::setfill('0') << i;
        EXPECT_EQ(escape(input), expected.str()) << "Failed for control character " << i;
    }
}

TEST(JsonUtilTest, EscapeLeavesUtf8Alone) {
    EXPECT_EQ(escape("caf\xc3\xa9 \xE2\x9C\x93"), "caf\xc3\xa9 \xE2\x9C\x93");
}

TEST(JsonUtilTest, TimeToIsoEpoch) {
    EXPECT_EQ(time_to_iso(std::chrono::system_clock::time_point{}), "1970-01-01T00:00:00Z");
}

TEST(JsonUtilTest, TimeToIsoValidTime) {
    EXPECT_EQ(time_to_iso(utc(2023, 12, 25, 12, 30, 45)), "2023-12-25T12:30:45Z");
    EXPECT_EQ(time_to_iso(utc(2024, 2, 29, 0, 0, 0)), "2024-02-29T00:00:00Z");
}

TEST(JsonUtilTest, TimeToIsoDropsSubseconds) {
    auto tp = utc(2025, 4, 17, 10, 2, 3) + std::chrono::milliseconds(987);
    EXPECT_EQ(time_to_iso(tp), "2025-04-17T10:02:03Z");
}

TEST(JsonUtilTest, TimeToIsoCurrentTimeShape) {
    std::string result = time_to_iso(std::chrono::system_clock::now());
    ASSERT_EQ(result.length(), 20u);
    EXPECT_EQ(result[4], '-');
    EXPECT_EQ(result[7], '-');
    EXPECT_EQ(result[10], 'T');
    EXPECT_EQ(result[13], ':');
    EXPECT_EQ(result[16], ':');
    EXPECT_EQ(result[19], 'Z');
}

}
}

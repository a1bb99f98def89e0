#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/AccessoryWriter.h"
#include "../src/core/Logging.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace iperf_discovery {

namespace fs = std::filesystem;

class AccessoryWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_console(false);
        dir = fs::temp_directory_path() / ("iperf_discovery_acc_" + std::to_string(::getpid()));
        fs::create_directories(dir);
        path = (dir / "iperfaccessory").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
        Logger::instance().set_console(true);
    }

    std::string contents() {
        std::ifstream f(path);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    static Device device(const char* ip, Attributes attrs) {
        return Device{*HostAddress::from_string(ip), std::move(attrs)};
    }

    fs::path dir;
    std::string path;
};

TEST_F(AccessoryWriterTest, FormatsOneLine) {
    auto d = device("192.168.1.2", {{"MAC", "00:11:22:33:44:55"}, {"Batt", "Full"}, {"PoeV", "48V"}, {"NsType", "Ethernet"}});
    EXPECT_EQ(format_accessory_line(d), "192.168.1.2: MAC=00:11:22:33:44:55;Batt=Full;PoeV=48V;NsType=Ethernet");
}

TEST_F(AccessoryWriterTest, WritesDevicesInOrder) {
    ScanResult r;
    r.devices.push_back(device("10.0.0.3", {{"MAC", "a"}}));
    r.devices.push_back(device("10.0.0.7", {{"MAC", "b"}, {"Batt", "Low"}}));
    ASSERT_TRUE(write_accessory_file(path, r));
    EXPECT_EQ(contents(), "10.0.0.3: MAC=a\n10.0.0.7: MAC=b;Batt=Low\n");
}

TEST_F(AccessoryWriterTest, RewriteTruncates) {
    ScanResult r;
    r.devices.push_back(device("10.0.0.3", {{"MAC", "a"}}));
    r.devices.push_back(device("10.0.0.7", {{"MAC", "b"}}));
    ASSERT_TRUE(write_accessory_file(path, r));
    ASSERT_TRUE(write_accessory_file(path, ScanResult{}));
    EXPECT_EQ(contents(), "");
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(AccessoryWriterTest, UnwritablePathFails) {
    EXPECT_FALSE(write_accessory_file((dir / "missing" / "iperfaccessory").string(), ScanResult{}));
}

TEST_F(AccessoryWriterTest, ClearRemovesStaleFile) {
    { std::ofstream f(path); f << "stale\n"; }
    EXPECT_TRUE(clear_accessory_file(path));
    EXPECT_FALSE(fs::exists(path));
    EXPECT_TRUE(clear_accessory_file(path));
}

}

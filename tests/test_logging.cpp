#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Logging.h"
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

namespace iperf_discovery {

namespace fs = std::filesystem;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
        Logger::instance().set_console(false);
        path = fs::temp_directory_path() / ("iperf_discovery_log_" + std::to_string(::getpid()) + ".log");
    }

    void TearDown() override {
        Logger::instance().close_file();
        Logger::instance().set_level(LogLevel::Info);
        Logger::instance().set_console(true);
        std::error_code ec;
        fs::remove(path, ec);
    }

    std::vector<std::string> lines() {
        Logger::instance().close_file();
        std::ifstream f(path);
        std::vector<std::string> out;
        std::string line;
        while (std::getline(f, line)) out.push_back(line);
        return out;
    }

    fs::path path;
};

TEST_F(LoggingTest, SingletonInstance) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, SetLogLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.set_level(LogLevel::Trace);
    EXPECT_EQ(logger.level(), LogLevel::Trace);
}

TEST_F(LoggingTest, LogLevelEnumValues) {
    EXPECT_EQ(static_cast<int>(LogLevel::Error), 0);
    EXPECT_EQ(static_cast<int>(LogLevel::Warn), 1);
    EXPECT_EQ(static_cast<int>(LogLevel::Info), 2);
    EXPECT_EQ(static_cast<int>(LogLevel::Debug), 3);
    EXPECT_EQ(static_cast<int>(LogLevel::Trace), 4);
}

TEST_F(LoggingTest, LineFormat) {
    Logger& logger = Logger::instance();
    ASSERT_TRUE(logger.open_file(path.string()));
    logger.info("Starting TCP port scan on 192.168.1.0/30");
    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(std::regex_match(out[0], std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2},\d{3} \[INFO\] Starting TCP port scan on 192\.168\.1\.0/30)")))
        << out[0];
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger& logger = Logger::instance();
    ASSERT_TRUE(logger.open_file(path.string()));
    logger.set_level(LogLevel::Warn);
    logger.error("e");
    logger.warn("w");
    logger.info("i");
    logger.debug("d");
    logger.trace("t");
    auto out = lines();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_NE(out[0].find("[ERROR] e"), std::string::npos);
    EXPECT_NE(out[1].find("[WARNING] w"), std::string::npos);
}

TEST_F(LoggingTest, AllPrefixesAtTrace) {
    Logger& logger = Logger::instance();
    ASSERT_TRUE(logger.open_file(path.string()));
    logger.set_level(LogLevel::Trace);
    logger.log(LogLevel::Error, "x");
    logger.log(LogLevel::Warn, "x");
    logger.log(LogLevel::Info, "x");
    logger.log(LogLevel::Debug, "x");
    logger.log(LogLevel::Trace, "x");
    auto out = lines();
    ASSERT_EQ(out.size(), 5u);
    EXPECT_NE(out[0].find("[ERROR]"), std::string::npos);
    EXPECT_NE(out[1].find("[WARNING]"), std::string::npos);
    EXPECT_NE(out[2].find("[INFO]"), std::string::npos);
    EXPECT_NE(out[3].find("[DEBUG]"), std::string::npos);
    EXPECT_NE(out[4].find("[TRACE]"), std::string::npos);
}

TEST_F(LoggingTest, OpenFileTruncates) {
    {
        std::ofstream f(path);
        f << "previous run\n";
    }
    ASSERT_TRUE(Logger::instance().open_file(path.string()));
    Logger::instance().info("fresh");
    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NE(out[0].find("fresh"), std::string::npos);
}

TEST_F(LoggingTest, OpenFileFailureKeepsRunning) {
    EXPECT_FALSE(Logger::instance().open_file("/nonexistent-dir/iperfdiscovery.log"));
    EXPECT_NO_THROW(Logger::instance().error("still alive"));
}

TEST_F(LoggingTest, ConsoleSinkWritesToStderr) {
    Logger& logger = Logger::instance();
    logger.set_console(true);
    testing::internal::CaptureStderr();
    logger.info("to console");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[INFO] to console"), std::string::npos);

    logger.set_console(false);
    testing::internal::CaptureStderr();
    logger.info("hidden");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST_F(LoggingTest, ThreadSafety) {
    Logger& logger = Logger::instance();
    ASSERT_TRUE(logger.open_file(path.string()));

    const int num_threads = 10;
    const int logs_per_thread = 100;
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                logger.info("Thread " + std::to_string(i) + " log " + std::to_string(j));
            }
        });
    }
    for (auto& thread : threads) thread.join();

    auto out = lines();
    ASSERT_EQ(out.size(), static_cast<size_t>(num_threads * logs_per_thread));
    for (const auto& line : out) EXPECT_NE(line.find("[INFO] Thread "), std::string::npos);
}

TEST_F(LoggingTest, ConcurrentLevelChanges) {
    Logger& logger = Logger::instance();
    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([&, i]() {
            logger.set_level(static_cast<LogLevel>(i % 5));
            logger.info("Thread " + std::to_string(i));
        });
    }
    for (auto& thread : threads) thread.join();
    LogLevel current = logger.level();
    EXPECT_TRUE(current >= LogLevel::Error && current <= LogLevel::Trace);
}

}

#include "core/ArgumentParser.h"
#include "core/Config.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace iperf_discovery {

class ArgumentParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "iperf-discovery");
        std::vector<char*> argv;
        for(auto& a : args) argv.push_back(&a[0]);
        return parser.parse(static_cast<int>(argv.size()), argv.data(), cfg);
    }

    ArgumentParser parser;
    Config cfg;
};

TEST_F(ArgumentParserTest, NetworkOnly) {
    EXPECT_TRUE(parse({"192.168.1.0/24"}));
    EXPECT_EQ(cfg.network, "192.168.1.0/24");
    EXPECT_FALSE(cfg.timeout.has_value());
    EXPECT_FALSE(cfg.use_options_file);
    EXPECT_FALSE(cfg.verbose);
    EXPECT_EQ(cfg.accessory_file, "iperfaccessory");
    EXPECT_EQ(cfg.log_file, "iperfdiscovery.log");
    EXPECT_EQ(cfg.concurrency, DEFAULT_CONCURRENCY);
}

TEST_F(ArgumentParserTest, ShortAndLongTimeout) {
    EXPECT_TRUE(parse({"-t", "0.05", "10.0.0.0/30"}));
    ASSERT_TRUE(cfg.timeout.has_value());
    EXPECT_DOUBLE_EQ(*cfg.timeout, 0.05);

    Config other;
    cfg = other;
    EXPECT_TRUE(parse({"10.0.0.0/30", "--timeout", "0.1"}));
    EXPECT_DOUBLE_EQ(*cfg.timeout, 0.1);
}

TEST_F(ArgumentParserTest, OutOfRangeTimeoutIsAcceptedForLaterWarning) {
    EXPECT_TRUE(parse({"-t", "2", "10.0.0.0/30"}));
    EXPECT_DOUBLE_EQ(*cfg.timeout, 2.0);
}

TEST_F(ArgumentParserTest, OptionsFlags) {
    EXPECT_TRUE(parse({"-o", "10.0.0.0/24"}));
    EXPECT_TRUE(cfg.use_options_file);
    EXPECT_EQ(cfg.options_file, DEFAULT_OPTIONS_FILE);

    cfg = Config{};
    EXPECT_TRUE(parse({"--options-file", "/tmp/opts.conf", "10.0.0.0/24"}));
    EXPECT_TRUE(cfg.use_options_file);
    EXPECT_EQ(cfg.options_file, "/tmp/opts.conf");
}

TEST_F(ArgumentParserTest, OutputsAndTuning) {
    EXPECT_TRUE(parse({"--verbose", "--output", "acc.txt", "--log-file", "run.log", "--json", "-", "--pretty",
                       "--concurrency", "32", "--query-timeout", "1.5", "--require-marker", "172.16.0.0/16"}));
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.accessory_file, "acc.txt");
    EXPECT_EQ(cfg.log_file, "run.log");
    EXPECT_EQ(cfg.json_output, "-");
    EXPECT_TRUE(cfg.pretty);
    EXPECT_EQ(cfg.concurrency, 32);
    EXPECT_DOUBLE_EQ(cfg.query_timeout, 1.5);
    EXPECT_TRUE(cfg.require_marker);
    EXPECT_EQ(cfg.network, "172.16.0.0/16");
}

TEST_F(ArgumentParserTest, HelpAndVersionExitCleanly) {
    testing::internal::CaptureStdout();
    EXPECT_FALSE(parse({"--help"}));
    std::string help = testing::internal::GetCapturedStdout();
    EXPECT_EQ(parser.exit_code(), 0);
    EXPECT_NE(help.find("usage: iperf-discovery"), std::string::npos);
    EXPECT_NE(help.find("--timeout"), std::string::npos);

    testing::internal::CaptureStdout();
    EXPECT_FALSE(parse({"-v"}));
    std::string version = testing::internal::GetCapturedStdout();
    EXPECT_EQ(parser.exit_code(), 0);
    EXPECT_EQ(version.rfind("iperf-discovery ", 0), 0u);
}

TEST_F(ArgumentParserTest, MissingNetworkIsUsageError) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"-t", "0.05"}));
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(parser.exit_code(), 2);
}

TEST_F(ArgumentParserTest, UsageErrors) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"--bogus", "10.0.0.0/24"}));
    EXPECT_EQ(parser.exit_code(), 2);
    EXPECT_FALSE(parse({"10.0.0.0/24", "--timeout"}));
    EXPECT_EQ(parser.exit_code(), 2);
    EXPECT_FALSE(parse({"--timeout", "fast", "10.0.0.0/24"}));
    EXPECT_EQ(parser.exit_code(), 2);
    EXPECT_FALSE(parse({"--concurrency", "4x", "10.0.0.0/24"}));
    EXPECT_EQ(parser.exit_code(), 2);
    EXPECT_FALSE(parse({"10.0.0.0/24", "10.0.1.0/24"}));
    EXPECT_EQ(parser.exit_code(), 2);
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("Unknown arg: --bogus"), std::string::npos);
}

TEST_F(ArgumentParserTest, PrintHelpListsEveryFlag) {
    std::ostringstream os;
    parser.print_help(os);
    for(const char* flag : {"--timeout", "--options", "--options-file", "--verbose", "--output", "--log-file",
                            "--json", "--pretty", "--concurrency", "--query-timeout", "--require-marker"}) {
        EXPECT_NE(os.str().find(flag), std::string::npos) << flag;
    }
}

}

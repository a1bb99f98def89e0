#include "core/Config.h"
#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Logging.h"
#include "core/Errors.h"
#include "discovery/NetworkRange.h"
#include <cstdint>
#include <vector>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    // argv[0] plus space separated words
    std::vector<std::string> args{"iperf-discovery"};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t next = input.find(' ', pos);
        if (next == std::string::npos) {
            args.push_back(input.substr(pos));
            break;
        }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(&arg[0]);

    iperf_discovery::Logger::instance().set_console(false);
    iperf_discovery::ArgumentParser parser;
    iperf_discovery::Config cfg;
    cfg.use_options_file = false;
    if (!parser.parse(static_cast<int>(argv.size()), argv.data(), cfg)) return 0;
    cfg.use_options_file = false;

    iperf_discovery::ConfigValidator validator;
    if (!validator.validate(cfg)) return 0;
    try {
        auto range = iperf_discovery::NetworkRange::parse(cfg.network);
        (void)range.host_count();
        (void)validator.build_scan_config(cfg);
    } catch (const iperf_discovery::DiscoveryError&) {
        // rejected input is an expected outcome
    }
    return 0;
}

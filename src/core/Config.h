#pragma once
#include "Discovery.h"
#include <string>
#include <optional>

namespace iperf_discovery {

inline constexpr char DEFAULT_OPTIONS_FILE[] = "/mnt/mmc3/iperfaccessory.conf";
inline constexpr char DEFAULT_ACCESSORY_FILE[] = "iperfaccessory";
inline constexpr char DEFAULT_LOG_FILE[] = "iperfdiscovery.log";
inline constexpr char ACCESSORY_MARKER[] = "iPerf Remote";

// Command line state. ConfigValidator turns it into a ScanConfig.
struct Config {
    std::string network;                  // positional CIDR text
    std::optional<double> timeout;        // -t/--timeout, honored only inside [0.010, 0.160]
    bool use_options_file = false;        // -o/--options
    std::string options_file = DEFAULT_OPTIONS_FILE;
    bool verbose = false;                 // mirror log to stderr
    std::string accessory_file = DEFAULT_ACCESSORY_FILE;
    std::string log_file = DEFAULT_LOG_FILE;
    std::string json_output;              // empty = none, "-" = stdout
    bool pretty = false;
    int concurrency = DEFAULT_CONCURRENCY;
    double query_timeout = DEFAULT_QUERY_TIMEOUT;
    bool require_marker = false;          // only accept replies naming the accessory
};

}

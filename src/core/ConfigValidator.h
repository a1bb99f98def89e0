#pragma once
#include "Config.h"
#include "Discovery.h"
#include <optional>
#include <string>

namespace iperf_discovery {

class ConfigValidator {
public:
    // Usage errors are reported on stderr; returns false if the run must not start.
    bool validate(const Config& cfg);

    // Effective probe timeout: default < options file (when enabled) < command line.
    // Out-of-range or unreadable overrides are logged and skipped.
    double resolve_timeout(const Config& cfg);

    // First in-range "timeout=" line of an options file.
    std::optional<double> load_options_timeout(const std::string& path);

    // Throws InvalidConfig when the result would be rejected by the engine.
    ScanConfig build_scan_config(const Config& cfg);

    static bool timeout_in_range(double seconds);

private:
    static std::optional<double> parse_seconds(const std::string& text);
};

}

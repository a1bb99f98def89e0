#include "ConfigValidator.h"
#include "Logging.h"
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <iomanip>

namespace iperf_discovery {

namespace {
    std::string fmt_seconds(double s) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << s << "s";
        return oss.str();
    }
}

bool ConfigValidator::validate(const Config& cfg) {
    if(cfg.network.empty()) {
        std::cerr << "Missing network argument (e.g. 192.168.1.0/24)\n";
        return false;
    }
    if(cfg.concurrency < 1 || cfg.concurrency > MAX_CONCURRENCY) {
        std::cerr << "--concurrency must be between 1 and " << MAX_CONCURRENCY << "\n";
        return false;
    }
    if(!std::isfinite(cfg.query_timeout) || cfg.query_timeout <= 0 || cfg.query_timeout > MAX_QUERY_TIMEOUT) {
        std::cerr << "--query-timeout must be in (0, " << MAX_QUERY_TIMEOUT << "] seconds\n";
        return false;
    }
    if(cfg.accessory_file.empty()) {
        std::cerr << "--output requires a file name\n";
        return false;
    }
    if(cfg.use_options_file && cfg.options_file.empty()) {
        std::cerr << "--options-file requires a path\n";
        return false;
    }
    return true;
}

bool ConfigValidator::timeout_in_range(double seconds) {
    return std::isfinite(seconds) && seconds >= MIN_SCAN_TIMEOUT && seconds <= MAX_SCAN_TIMEOUT;
}

std::optional<double> ConfigValidator::parse_seconds(const std::string& text) {
    if(text.empty()) return std::nullopt;
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if(used != text.size()) return std::nullopt;
        return v;
    } catch(const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> ConfigValidator::load_options_timeout(const std::string& path) {
    auto& log = Logger::instance();
    std::ifstream f(path);
    if(!f) {
        log.error("Failed to read " + path);
        return std::nullopt;
    }
    std::string line;
    while(std::getline(f, line)) {
        size_t start = line.find_first_not_of(" \t\r\n");
        if(start == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r\n");
        line = line.substr(start, end - start + 1);
        if(line.rfind("timeout=", 0) != 0) continue;
        std::string value = line.substr(8);
        value = value.substr(0, value.find('='));
        auto parsed = parse_seconds(value);
        if(!parsed) {
            log.error("Invalid timeout format in " + path + ": " + line);
            continue;
        }
        if(timeout_in_range(*parsed)) {
            log.debug("Parsed timeout from " + path + ": " + fmt_seconds(*parsed));
            return parsed;
        }
        log.warn("Timeout out of range: " + fmt_seconds(*parsed));
    }
    log.debug("No valid timeout found in " + path);
    return std::nullopt;
}

double ConfigValidator::resolve_timeout(const Config& cfg) {
    double timeout = MIN_SCAN_TIMEOUT;
    if(cfg.use_options_file) {
        if(auto from_file = load_options_timeout(cfg.options_file)) timeout = *from_file;
    }
    if(cfg.timeout) {
        if(timeout_in_range(*cfg.timeout)) {
            timeout = *cfg.timeout;
        } else {
            Logger::instance().warn("Timeout " + fmt_seconds(*cfg.timeout) + " out of range (0.010-0.160), using " + fmt_seconds(timeout));
        }
    }
    return timeout;
}

ScanConfig ConfigValidator::build_scan_config(const Config& cfg) {
    ScanConfig sc;
    sc.timeout = resolve_timeout(cfg);
    sc.query_timeout = cfg.query_timeout;
    sc.concurrency = cfg.concurrency;
    sc.verbose = cfg.verbose;
    if(cfg.require_marker) sc.required_marker = ACCESSORY_MARKER;
    validate_scan_config(sc);
    return sc;
}

}

#include "Discovery.h"
#include "Errors.h"
#include <boost/asio/ip/address_v4.hpp>
#include <cmath>

namespace iperf_discovery {

std::string HostAddress::to_string() const {
    return std::to_string((value >> 24) & 0xFF) + "." + std::to_string((value >> 16) & 0xFF) + "." +
           std::to_string((value >> 8) & 0xFF) + "." + std::to_string(value & 0xFF);
}

std::optional<HostAddress> HostAddress::from_string(const std::string& text) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(text, ec);
    if(ec) return std::nullopt;
    return HostAddress{addr.to_uint()};
}

void validate_scan_config(const ScanConfig& cfg) {
    if(!std::isfinite(cfg.timeout) || cfg.timeout < MIN_SCAN_TIMEOUT || cfg.timeout > MAX_SCAN_TIMEOUT) {
        throw InvalidConfig("timeout " + std::to_string(cfg.timeout) + "s outside [0.010, 0.160]");
    }
    if(!std::isfinite(cfg.query_timeout) || cfg.query_timeout <= 0 || cfg.query_timeout > MAX_QUERY_TIMEOUT) {
        throw InvalidConfig("query timeout " + std::to_string(cfg.query_timeout) + "s outside (0, 60]");
    }
    if(cfg.port == 0) throw InvalidConfig("port 0");
    if(cfg.payload.empty()) throw InvalidConfig("empty query payload");
    if(cfg.concurrency < 1 || cfg.concurrency > MAX_CONCURRENCY) {
        throw InvalidConfig("concurrency " + std::to_string(cfg.concurrency) + " outside [1, " + std::to_string(MAX_CONCURRENCY) + "]");
    }
}

const std::string* Device::find(const std::string& key) const {
    for(const auto& kv : attributes) {
        if(kv.first == key) return &kv.second;
    }
    return nullptr;
}

const char* to_string(OutcomeKind kind) {
    switch(kind) {
        case OutcomeKind::Unreachable: return "unreachable";
        case OutcomeKind::TimedOut: return "timed_out";
        case OutcomeKind::QueryFailed: return "query_failed";
        case OutcomeKind::ParseFailed: return "parse_failed";
        case OutcomeKind::Discovered: return "discovered";
    }
    return "unknown";
}

}

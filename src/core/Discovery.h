#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <functional>
#include <cstdint>
#include <cstddef>
#include <utility>

namespace iperf_discovery {

inline constexpr uint16_t ACCESSORY_PORT = 2359;
inline constexpr char QUERY_PAYLOAD[] = "TA:getattrlong"; // recognized by the accessory firmware
inline constexpr double MIN_SCAN_TIMEOUT = 0.010;
inline constexpr double MAX_SCAN_TIMEOUT = 0.160;
inline constexpr double DEFAULT_QUERY_TIMEOUT = 5.0;
inline constexpr double MAX_QUERY_TIMEOUT = 60.0;
inline constexpr size_t MAX_RESPONSE_BYTES = 4096;
inline constexpr int DEFAULT_CONCURRENCY = 128;
inline constexpr int MAX_CONCURRENCY = 1024;

// IPv4 address in host byte order.
struct HostAddress {
    uint32_t value = 0;

    std::string to_string() const;
    static std::optional<HostAddress> from_string(const std::string& text);
};

inline bool operator==(const HostAddress& a, const HostAddress& b){ return a.value == b.value; }
inline bool operator!=(const HostAddress& a, const HostAddress& b){ return a.value != b.value; }
inline bool operator<(const HostAddress& a, const HostAddress& b){ return a.value < b.value; }

struct ScanConfig {
    double timeout = MIN_SCAN_TIMEOUT;             // connect budget per host, seconds
    double query_timeout = DEFAULT_QUERY_TIMEOUT;  // whole query exchange, seconds
    uint16_t port = ACCESSORY_PORT;
    std::string payload = QUERY_PAYLOAD;
    int concurrency = DEFAULT_CONCURRENCY;         // hosts in flight at once
    std::string required_marker;                   // empty = any well-formed reply
    bool verbose = false;
};

// Throws InvalidConfig.
void validate_scan_config(const ScanConfig& cfg);

// Ordered attribute name -> value, in response order.
using Attributes = std::vector<std::pair<std::string, std::string>>;

struct Device {
    HostAddress address;
    Attributes attributes;

    const std::string* find(const std::string& key) const;
};

enum class OutcomeKind { Unreachable, TimedOut, QueryFailed, ParseFailed, Discovered };

const char* to_string(OutcomeKind kind);

struct ProbeOutcome {
    OutcomeKind kind = OutcomeKind::Unreachable;
    std::optional<Device> device; // set only for Discovered
    std::string detail;           // human readable reason for failures

    bool responsive() const { return kind == OutcomeKind::QueryFailed || kind == OutcomeKind::ParseFailed || kind == OutcomeKind::Discovered; }
};

struct DiagnosticEvent {
    HostAddress address;
    ProbeOutcome outcome;
    std::chrono::milliseconds elapsed{0};
};

using DiagnosticSink = std::function<void(const DiagnosticEvent&)>;

struct ScanSummary {
    size_t scanned = 0;    // hosts that reached a terminal outcome
    size_t responsive = 0; // port open
    size_t discovered = 0; // valid accessories
};

struct ScanResult {
    std::string network;
    size_t enumerated = 0;
    std::vector<Device> devices; // enumeration order
    ScanSummary summary;
    bool cancelled = false;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
};

}

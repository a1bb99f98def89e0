#pragma once
#include <stdexcept>
#include <string>

namespace iperf_discovery {

// Run-aborting failures. Per-host failures never throw; they are ProbeOutcome values.
class DiscoveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidRange : public DiscoveryError {
public:
    explicit InvalidRange(const std::string& what) : DiscoveryError("invalid range: " + what) {}
};

class InvalidConfig : public DiscoveryError {
public:
    explicit InvalidConfig(const std::string& what) : DiscoveryError("invalid config: " + what) {}
};

// Contract violation inside the engine (a host recorded twice, an address outside the run).
class InternalAggregationError : public DiscoveryError {
public:
    explicit InternalAggregationError(const std::string& what) : DiscoveryError("internal aggregation error: " + what) {}
};

}

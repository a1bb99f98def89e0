#pragma once
#include "../core/Discovery.h"
#include "NetworkRange.h"
#include <map>
#include <mutex>
#include <vector>

namespace iperf_discovery {

// Collects per-host outcomes for one run. record() is the single mutation point and is safe
// to call from any worker; finalize() resequences devices into enumeration order.
class ResultAggregator {
public:
    explicit ResultAggregator(NetworkRange range);

    // Throws InternalAggregationError for a second record of the same host or a host outside the range.
    void record(HostAddress address, ProbeOutcome outcome);

    ScanResult finalize() const;

    size_t recorded() const;

private:
    NetworkRange range_;
    std::vector<bool> seen_;           // by enumeration index
    std::map<uint64_t, Device> devices_; // enumeration index -> device
    ScanSummary summary_;
    mutable std::mutex mutex_;
};

}

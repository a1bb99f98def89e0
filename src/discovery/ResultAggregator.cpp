#include "ResultAggregator.h"
#include "../core/Errors.h"

namespace iperf_discovery {

ResultAggregator::ResultAggregator(NetworkRange range)
    : range_(range), seen_(static_cast<size_t>(range.host_count()), false) {}

void ResultAggregator::record(HostAddress address, ProbeOutcome outcome) {
    auto index = range_.index_of(address);
    if(!index) throw InternalAggregationError(address.to_string() + " is not part of " + range_.to_string());
    if(outcome.kind == OutcomeKind::Discovered && (!outcome.device || outcome.device->address != address)) {
        throw InternalAggregationError("discovered outcome for " + address.to_string() + " carries no matching device");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if(seen_[*index]) throw InternalAggregationError(address.to_string() + " recorded twice");
    seen_[*index] = true;
    ++summary_.scanned;
    if(outcome.responsive()) ++summary_.responsive;
    if(outcome.kind == OutcomeKind::Discovered) {
        ++summary_.discovered;
        devices_.emplace(*index, std::move(*outcome.device));
    }
}

ScanResult ResultAggregator::finalize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ScanResult result;
    result.network = range_.to_string();
    result.enumerated = static_cast<size_t>(range_.host_count());
    result.summary = summary_;
    result.devices.reserve(devices_.size());
    for(const auto& entry : devices_) result.devices.push_back(entry.second);
    return result;
}

size_t ResultAggregator::recorded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_.scanned;
}

}

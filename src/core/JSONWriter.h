#pragma once
#include "Discovery.h"
#include <string>

namespace iperf_discovery {

// {"meta":{...},"summary":{...},"devices":[{"address":..,"attributes":{..}}]}
// Attribute order follows the accessory reply.
class JSONWriter {
public:
    std::string write(const ScanResult& result, const ScanConfig& config, bool pretty = false) const;
};

}

#pragma once
#include "Discovery.h"
#include <string>

namespace iperf_discovery {

// "<IP>: key1=value1;key2=value2"
std::string format_accessory_line(const Device& device);

// Truncates `path` and writes one line per device in result order. Logs and returns false on I/O failure.
bool write_accessory_file(const std::string& path, const ScanResult& result);

// Removes a stale accessory file from a previous run. Missing file is not an error.
bool clear_accessory_file(const std::string& path);

}

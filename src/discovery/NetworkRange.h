#pragma once
#include "../core/Discovery.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace iperf_discovery {

// IPv4 network (address + prefix). Host bits of the address are masked off.
// Usable hosts exclude network and broadcast for prefixes up to /30; /31 and /32 use every address.
class NetworkRange {
public:
    NetworkRange(HostAddress address, int prefix); // throws InvalidRange

    // "a.b.c.d/len", "a.b.c.d/m.m.m.m" or a bare address (/32). Throws InvalidRange.
    static NetworkRange parse(const std::string& text);

    HostAddress network() const { return HostAddress{network_}; }
    HostAddress broadcast() const;
    int prefix() const { return prefix_; }

    uint64_t host_count() const;
    HostAddress host_at(uint64_t index) const; // index < host_count()
    std::optional<uint64_t> index_of(HostAddress address) const;

    std::string to_string() const;

private:
    uint32_t first_host() const;

    uint32_t network_;
    int prefix_;
};

// Ordered, duplicate free, restartable.
std::vector<HostAddress> enumerate(const NetworkRange& range);

}

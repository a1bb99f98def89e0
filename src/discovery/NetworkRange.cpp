#include "NetworkRange.h"
#include "../core/Errors.h"
#include <cctype>

namespace iperf_discovery {

namespace {
    uint32_t prefix_mask(int prefix) {
        if(prefix <= 0) return 0;
        return 0xFFFFFFFFu << (32 - prefix);
    }

    // Contiguous netmask -> prefix length, -1 if the mask has holes.
    int mask_to_prefix(uint32_t mask) {
        int prefix = 0;
        while(prefix < 32 && (mask & (0x80000000u >> prefix))) ++prefix;
        return prefix_mask(prefix) == mask ? prefix : -1;
    }

    int parse_prefix(const std::string& text, const std::string& whole) {
        if(text.find('.') != std::string::npos) {
            auto mask = HostAddress::from_string(text);
            if(!mask) throw InvalidRange("malformed netmask in '" + whole + "'");
            int p = mask_to_prefix(mask->value);
            if(p < 0) throw InvalidRange("non-contiguous netmask in '" + whole + "'");
            return p;
        }
        if(text.empty() || text.size() > 2) throw InvalidRange("bad prefix length in '" + whole + "'");
        for(char c : text) {
            if(!std::isdigit(static_cast<unsigned char>(c))) throw InvalidRange("bad prefix length in '" + whole + "'");
        }
        return std::stoi(text);
    }
}

NetworkRange::NetworkRange(HostAddress address, int prefix) : network_(0), prefix_(prefix) {
    if(prefix < 0 || prefix > 32) throw InvalidRange("prefix /" + std::to_string(prefix) + " outside [0, 32]");
    network_ = address.value & prefix_mask(prefix);
}

NetworkRange NetworkRange::parse(const std::string& text) {
    auto slash = text.find('/');
    std::string addr_part = text.substr(0, slash);
    auto addr = HostAddress::from_string(addr_part);
    if(!addr) throw InvalidRange("malformed address '" + text + "'");
    int prefix = 32;
    if(slash != std::string::npos) prefix = parse_prefix(text.substr(slash + 1), text);
    return NetworkRange(*addr, prefix);
}

HostAddress NetworkRange::broadcast() const {
    return HostAddress{network_ | ~prefix_mask(prefix_)};
}

uint32_t NetworkRange::first_host() const {
    return prefix_ <= 30 ? network_ + 1 : network_;
}

uint64_t NetworkRange::host_count() const {
    uint64_t size = uint64_t{1} << (32 - prefix_);
    return prefix_ <= 30 ? size - 2 : size;
}

HostAddress NetworkRange::host_at(uint64_t index) const {
    return HostAddress{static_cast<uint32_t>(first_host() + index)};
}

std::optional<uint64_t> NetworkRange::index_of(HostAddress address) const {
    if(address.value < first_host()) return std::nullopt;
    uint64_t index = address.value - first_host();
    if(index >= host_count()) return std::nullopt;
    return index;
}

std::string NetworkRange::to_string() const {
    return HostAddress{network_}.to_string() + "/" + std::to_string(prefix_);
}

std::vector<HostAddress> enumerate(const NetworkRange& range) {
    std::vector<HostAddress> hosts;
    const uint64_t count = range.host_count();
    hosts.reserve(static_cast<size_t>(count));
    for(uint64_t i = 0; i < count; ++i) hosts.push_back(range.host_at(i));
    return hosts;
}

}

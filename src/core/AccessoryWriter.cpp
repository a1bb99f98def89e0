#include "AccessoryWriter.h"
#include "Logging.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace iperf_discovery {

std::string format_accessory_line(const Device& device) {
    std::string line = device.address.to_string() + ": ";
    bool first = true;
    for(const auto& kv : device.attributes) {
        if(!first) line.push_back(';');
        line += kv.first + "=" + kv.second;
        first = false;
    }
    return line;
}

bool write_accessory_file(const std::string& path, const ScanResult& result) {
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if(!f) {
        Logger::instance().error("Failed to write to " + path + ": " + std::strerror(errno));
        return false;
    }
    for(const auto& d : result.devices) f << format_accessory_line(d) << '\n';
    f.flush();
    if(!f) {
        Logger::instance().error("Failed to write to " + path);
        return false;
    }
    Logger::instance().debug("Wrote " + std::to_string(result.devices.size()) + " entries to " + path);
    return true;
}

bool clear_accessory_file(const std::string& path) {
    if(std::remove(path.c_str()) == 0) {
        Logger::instance().debug("Cleared accessory file: " + path);
        return true;
    }
    if(errno == ENOENT) return true;
    Logger::instance().error("Failed to remove " + path + ": " + std::strerror(errno));
    return false;
}

}

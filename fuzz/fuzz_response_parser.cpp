#include "discovery/ResponseParser.h"
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string_view input(reinterpret_cast<const char*>(data), size);

    auto attrs = iperf_discovery::parse_response(input);
    if (attrs) {
        for (const auto& kv : *attrs) {
            if (kv.first.empty()) std::abort();
        }
    }

    if (auto normalized = iperf_discovery::normalize_firmware_reply(input)) {
        if (!iperf_discovery::is_valid_utf8(*normalized)) std::abort();
        (void)iperf_discovery::parse_response(*normalized);
    }
    return 0;
}

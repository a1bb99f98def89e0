#pragma once
#include <string>
#include <string_view>
#include <chrono>

namespace iperf_discovery {
namespace jsonutil {

// JSON string body (no surrounding quotes).
std::string escape(std::string_view s);

// UTC, second precision: 2025-04-17T10:02:03Z
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}

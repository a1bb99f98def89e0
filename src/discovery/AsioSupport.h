#pragma once
#include "../core/CancellationToken.h"
#include <boost/asio/io_context.hpp>
#include <chrono>

namespace iperf_discovery {
namespace detail {

inline constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{10};

inline std::chrono::steady_clock::duration seconds_to_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(seconds));
}

// Pumps io until `done` flips. Returns false if the token fired first; the caller
// must then close its I/O objects and drain io before returning.
inline bool run_until(boost::asio::io_context& io, const bool& done, const CancellationToken& cancel) {
    while(!done) {
        if(cancel.cancelled()) return false;
        io.run_one_for(CANCEL_POLL_INTERVAL);
        if(io.stopped()) io.restart();
    }
    return true;
}

}
}

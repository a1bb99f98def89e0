#include "PortProbe.h"
#include "AsioSupport.h"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/error.hpp>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace iperf_discovery {

const char* to_string(ProbeStatus status) {
    switch(status) {
        case ProbeStatus::Reachable: return "reachable";
        case ProbeStatus::Unreachable: return "unreachable";
        case ProbeStatus::TimedOut: return "timed_out";
        case ProbeStatus::Aborted: return "aborted";
    }
    return "unknown";
}

ProbeStatus classify_connect(const boost::system::error_code& ec,
                             std::chrono::steady_clock::duration elapsed,
                             std::chrono::steady_clock::duration timeout) {
    if(elapsed >= timeout) return ProbeStatus::TimedOut;
    if(!ec) return ProbeStatus::Reachable;
    if(ec == asio::error::operation_aborted || ec == asio::error::timed_out) return ProbeStatus::TimedOut;
    return ProbeStatus::Unreachable;
}

ProbeReply AsioPortProbe::probe(HostAddress address, uint16_t port, double timeout, const CancellationToken& cancel) {
    asio::io_context io;
    tcp::socket socket(io);
    asio::steady_timer timer(io);
    const tcp::endpoint ep(asio::ip::address_v4(address.value), port);
    const auto budget = detail::seconds_to_duration(timeout);

    boost::system::error_code ec;
    socket.open(ep.protocol(), ec);
    if(ec) return {ProbeStatus::Unreachable, "socket open failed: " + ec.message()};

    bool done = false;
    boost::system::error_code connect_ec;
    std::chrono::steady_clock::duration elapsed{};
    const auto start = std::chrono::steady_clock::now();

    socket.async_connect(ep, [&](const boost::system::error_code& e){
        elapsed = std::chrono::steady_clock::now() - start;
        connect_ec = e;
        done = true;
        timer.cancel();
    });
    timer.expires_after(budget);
    timer.async_wait([&](const boost::system::error_code& e){
        if(e != asio::error::operation_aborted) {
            boost::system::error_code ignored;
            socket.close(ignored); // completes the connect with operation_aborted
        }
    });

    if(!detail::run_until(io, done, cancel)) {
        boost::system::error_code ignored;
        socket.close(ignored);
        timer.cancel();
        io.run();
        return {ProbeStatus::Aborted, "cancelled"};
    }
    io.run(); // drain the cancelled timer

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);

    ProbeStatus status = classify_connect(connect_ec, elapsed, budget);
    switch(status) {
        case ProbeStatus::Reachable: return {status, ""};
        case ProbeStatus::TimedOut: return {status, "no answer within " + std::to_string(timeout) + "s"};
        default: return {status, connect_ec.message()};
    }
}

}

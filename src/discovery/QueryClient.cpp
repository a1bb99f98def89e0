#include "QueryClient.h"
#include "AsioSupport.h"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/error.hpp>
#include <algorithm>
#include <array>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace iperf_discovery {

const char* to_string(QueryStatus status) {
    switch(status) {
        case QueryStatus::Response: return "response";
        case QueryStatus::TimedOut: return "timed_out";
        case QueryStatus::ConnectionClosed: return "connection_closed";
        case QueryStatus::SendFailed: return "send_failed";
        case QueryStatus::Aborted: return "aborted";
    }
    return "unknown";
}

namespace {

// connect -> write -> read* under one deadline. All handlers run on the caller's thread.
class QueryExchange {
public:
    QueryExchange(asio::io_context& io, tcp::endpoint ep, const std::string& payload)
        : socket_(io), timer_(io), ep_(ep), payload_(payload) {}

    void start(std::chrono::steady_clock::duration budget) {
        boost::system::error_code ec;
        socket_.open(ep_.protocol(), ec);
        if(ec) { finish(QueryStatus::ConnectionClosed, "socket open failed: " + ec.message()); return; }
        timer_.expires_after(budget);
        timer_.async_wait([this](const boost::system::error_code& e){ on_deadline(e); });
        socket_.async_connect(ep_, [this](const boost::system::error_code& e){ on_connect(e); });
    }

    void abort() {
        boost::system::error_code ignored;
        socket_.close(ignored);
        timer_.cancel();
    }

    const bool& done() const { return finished_; }
    QueryReply take_reply() { return std::move(reply_); }

private:
    void on_deadline(const boost::system::error_code& e) {
        if(e == asio::error::operation_aborted || finished_) return;
        expired_ = true;
        boost::system::error_code ignored;
        socket_.close(ignored); // pending operation completes with operation_aborted
    }

    void on_connect(const boost::system::error_code& e) {
        if(finished_) return;
        if(e) { finish(expired_ ? QueryStatus::TimedOut : QueryStatus::ConnectionClosed, e.message()); return; }
        asio::async_write(socket_, asio::buffer(payload_), [this](const boost::system::error_code& we, size_t){ on_write(we); });
    }

    void on_write(const boost::system::error_code& e) {
        if(finished_) return;
        if(e) { finish(expired_ ? QueryStatus::TimedOut : QueryStatus::SendFailed, e.message()); return; }
        read_more();
    }

    void read_more() {
        socket_.async_read_some(asio::buffer(chunk_), [this](const boost::system::error_code& e, size_t n){ on_read(e, n); });
    }

    void on_read(const boost::system::error_code& e, size_t n) {
        if(finished_) return;
        size_t room = MAX_RESPONSE_BYTES - bytes_.size();
        bytes_.append(chunk_.data(), std::min(n, room));
        if(bytes_.size() >= MAX_RESPONSE_BYTES) { finish(QueryStatus::Response, "read limit reached"); return; }
        if(!e) { read_more(); return; }
        if(e == asio::error::eof) { finish(QueryStatus::Response, ""); return; }
        if(!bytes_.empty()) { finish(QueryStatus::Response, e.message()); return; }
        finish(expired_ ? QueryStatus::TimedOut : QueryStatus::ConnectionClosed, expired_ ? "no reply before deadline" : e.message());
    }

    void finish(QueryStatus status, std::string detail) {
        if(finished_) return;
        finished_ = true;
        reply_.status = status;
        reply_.detail = std::move(detail);
        if(status == QueryStatus::Response) reply_.bytes = std::move(bytes_);
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        timer_.cancel();
    }

    tcp::socket socket_;
    asio::steady_timer timer_;
    tcp::endpoint ep_;
    const std::string& payload_;
    std::array<char, 1024> chunk_{};
    std::string bytes_;
    bool expired_ = false;
    bool finished_ = false;
    QueryReply reply_;
};

}

QueryReply AsioQueryClient::query(HostAddress address, uint16_t port, const std::string& payload,
                                  double timeout, const CancellationToken& cancel) {
    asio::io_context io;
    QueryExchange exchange(io, tcp::endpoint(asio::ip::address_v4(address.value), port), payload);
    exchange.start(detail::seconds_to_duration(timeout));
    if(!detail::run_until(io, exchange.done(), cancel)) {
        exchange.abort();
        io.run();
        return {QueryStatus::Aborted, "", "cancelled"};
    }
    io.run(); // drain handlers cancelled by finish()
    return exchange.take_reply();
}

}

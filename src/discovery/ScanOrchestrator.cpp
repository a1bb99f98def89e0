#include "ScanOrchestrator.h"
#include "ResultAggregator.h"
#include "ResponseParser.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <thread>
#include <vector>

namespace iperf_discovery {

namespace {
    void transition(HostAddress host, HostState state) {
        auto& log = Logger::instance();
        if(log.level() >= LogLevel::Trace) log.trace(host.to_string() + " -> " + to_string(state));
    }

    ProbeOutcome make_outcome(OutcomeKind kind, std::string detail) {
        ProbeOutcome o;
        o.kind = kind;
        o.detail = std::move(detail);
        return o;
    }

    std::string excerpt(const std::string& bytes) {
        static const size_t MAX_EXCERPT = 64;
        std::string out;
        for(char c : bytes.substr(0, MAX_EXCERPT)) out.push_back(std::isprint(static_cast<unsigned char>(c)) ? c : '.');
        if(bytes.size() > MAX_EXCERPT) out += "...";
        return out;
    }

    std::string seconds(double s) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << s << "s";
        return oss.str();
    }
}

const char* to_string(HostState state) {
    switch(state) {
        case HostState::Pending: return "pending";
        case HostState::Probing: return "probing";
        case HostState::Querying: return "querying";
        case HostState::Parsing: return "parsing";
        case HostState::Unreachable: return "unreachable";
        case HostState::TimedOut: return "timed_out";
        case HostState::QueryFailed: return "query_failed";
        case HostState::ParseFailed: return "parse_failed";
        case HostState::Discovered: return "discovered";
    }
    return "unknown";
}

ScanOrchestrator::ScanOrchestrator(ScanConfig config)
    : ScanOrchestrator(std::move(config), std::make_unique<AsioPortProbe>(), std::make_unique<AsioQueryClient>()) {}

ScanOrchestrator::ScanOrchestrator(ScanConfig config, PortProbePtr probe, QueryClientPtr client)
    : config_(std::move(config)), probe_(std::move(probe)), client_(std::move(client)) {
    validate_scan_config(config_);
    if(!probe_ || !client_) throw InvalidConfig("missing probe or query client");
}

std::optional<ProbeOutcome> ScanOrchestrator::process_host(HostAddress address, const CancellationToken& cancel) {
    transition(address, HostState::Probing);
    ProbeReply probed;
    try {
        probed = probe_->probe(address, config_.port, config_.timeout, cancel);
    } catch(const std::exception& ex) {
        transition(address, HostState::Unreachable);
        return make_outcome(OutcomeKind::Unreachable, ex.what());
    }
    switch(probed.status) {
        case ProbeStatus::Aborted: return std::nullopt;
        case ProbeStatus::Unreachable:
            transition(address, HostState::Unreachable);
            return make_outcome(OutcomeKind::Unreachable, probed.detail);
        case ProbeStatus::TimedOut:
            transition(address, HostState::TimedOut);
            return make_outcome(OutcomeKind::TimedOut, probed.detail);
        case ProbeStatus::Reachable: break;
    }
    if(cancel.cancelled()) return std::nullopt;

    transition(address, HostState::Querying);
    QueryReply reply;
    try {
        reply = client_->query(address, config_.port, config_.payload, config_.query_timeout, cancel);
    } catch(const std::exception& ex) {
        transition(address, HostState::QueryFailed);
        return make_outcome(OutcomeKind::QueryFailed, ex.what());
    }
    if(reply.status == QueryStatus::Aborted) return std::nullopt;
    if(reply.status != QueryStatus::Response) {
        transition(address, HostState::QueryFailed);
        std::string detail = to_string(reply.status);
        if(!reply.detail.empty()) detail += ": " + reply.detail;
        return make_outcome(OutcomeKind::QueryFailed, detail);
    }

    transition(address, HostState::Parsing);
    ProbeOutcome outcome = interpret_reply(address, reply.bytes);
    transition(address, outcome.kind == OutcomeKind::Discovered ? HostState::Discovered : HostState::ParseFailed);
    return outcome;
}

ProbeOutcome ScanOrchestrator::interpret_reply(HostAddress address, const std::string& bytes) const {
    auto normalized = normalize_firmware_reply(bytes);
    if(!normalized) return make_outcome(OutcomeKind::ParseFailed, "reply is not valid UTF-8");
    if(!config_.required_marker.empty() && normalized->find(config_.required_marker) == std::string::npos) {
        return make_outcome(OutcomeKind::ParseFailed, "reply lacks '" + config_.required_marker + "': " + excerpt(*normalized));
    }
    auto attrs = parse_response(*normalized);
    if(!attrs) return make_outcome(OutcomeKind::ParseFailed, "malformed reply: '" + excerpt(*normalized) + "'");
    ProbeOutcome outcome;
    outcome.kind = OutcomeKind::Discovered;
    outcome.device = Device{address, std::move(*attrs)};
    return outcome;
}

void ScanOrchestrator::notify(const DiagnosticEvent& event) {
    if(!sink_) return;
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_(event);
}

ScanResult ScanOrchestrator::run(const NetworkRange& range, const CancellationToken& cancel) {
    const auto wall_start = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();
    const uint64_t total = range.host_count();
    const size_t workers = static_cast<size_t>(std::min<uint64_t>(static_cast<uint64_t>(config_.concurrency), total));
    Logger::instance().info("Starting TCP port scan on " + range.to_string() + " (" + std::to_string(total) + " hosts, port " +
                            std::to_string(config_.port) + ", timeout " + seconds(config_.timeout) + ", " +
                            std::to_string(workers) + " workers)");

    ResultAggregator aggregator(range);
    std::atomic<uint64_t> next{0};
    std::atomic<bool> halted{false};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&]() {
        while(!halted.load() && !cancel.cancelled()) {
            const uint64_t index = next.fetch_add(1);
            if(index >= total) break;
            const HostAddress host = range.host_at(index);
            const auto host_start = std::chrono::steady_clock::now();
            std::optional<ProbeOutcome> outcome;
            try {
                outcome = process_host(host, cancel);
                if(!outcome) {
                    Logger::instance().debug(host.to_string() + " interrupted by cancellation");
                    continue;
                }
                DiagnosticEvent event{host, *outcome,
                    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - host_start)};
                aggregator.record(host, std::move(*outcome));
                notify(event);
            } catch(...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if(!failure) failure = std::current_exception();
                halted.store(true);
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    try {
        for(size_t i = 0; i < workers; ++i) pool.emplace_back(worker);
    } catch(const std::system_error& ex) {
        Logger::instance().error(std::string("failed to start scan worker: ") + ex.what());
        halted.store(true);
        for(auto& t : pool) t.join();
        throw;
    }
    for(auto& t : pool) t.join();
    if(failure) std::rethrow_exception(failure);

    ScanResult result = aggregator.finalize();
    result.cancelled = cancel.cancelled();
    result.start_time = wall_start;
    result.end_time = std::chrono::system_clock::now();

    const auto elapsed = std::chrono::steady_clock::now() - start;
    Logger::instance().info(std::string(result.cancelled ? "Scan cancelled" : "Scan completed") + ": " +
                            std::to_string(result.summary.scanned) + "/" + std::to_string(result.enumerated) + " scanned, " +
                            std::to_string(result.summary.responsive) + " responsive, " +
                            std::to_string(result.summary.discovered) + " discovered (" + seconds(std::chrono::duration<double>(elapsed).count()) + ")");
    return result;
}

}

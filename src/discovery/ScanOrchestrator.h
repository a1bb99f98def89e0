#pragma once
#include "../core/Discovery.h"
#include "../core/CancellationToken.h"
#include "NetworkRange.h"
#include "PortProbe.h"
#include "QueryClient.h"
#include <mutex>
#include <optional>
#include <string>

namespace iperf_discovery {

// Per-host lifecycle. The last five are terminal (TimedOut covers the probe phase only).
enum class HostState { Pending, Probing, Querying, Parsing, Unreachable, TimedOut, QueryFailed, ParseFailed, Discovered };

const char* to_string(HostState state);

// Drives enumerate -> probe -> query -> parse -> aggregate for one network.
// At most config.concurrency hosts are in flight; every host is attempted once.
class ScanOrchestrator {
public:
    explicit ScanOrchestrator(ScanConfig config); // Asio probe and query client
    ScanOrchestrator(ScanConfig config, PortProbePtr probe, QueryClientPtr client);

    // Called once per host that reaches a terminal state; calls are serialized.
    void set_diagnostic_sink(DiagnosticSink sink) { sink_ = std::move(sink); }

    // Blocks until every host is terminal or the token fires. A cancelled run returns only
    // hosts that finished before it; hosts interrupted mid-flight are not recorded.
    // Throws InternalAggregationError on a contract violation.
    ScanResult run(const NetworkRange& range, const CancellationToken& cancel = CancellationToken());

    const ScanConfig& config() const { return config_; }

private:
    std::optional<ProbeOutcome> process_host(HostAddress address, const CancellationToken& cancel);
    ProbeOutcome interpret_reply(HostAddress address, const std::string& bytes) const;
    void notify(const DiagnosticEvent& event);

    ScanConfig config_;
    PortProbePtr probe_;
    QueryClientPtr client_;
    DiagnosticSink sink_;
    std::mutex sink_mutex_;
};

}

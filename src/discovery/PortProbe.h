#pragma once
#include "../core/Discovery.h"
#include "../core/CancellationToken.h"
#include <boost/system/error_code.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace iperf_discovery {

enum class ProbeStatus { Reachable, Unreachable, TimedOut, Aborted };

const char* to_string(ProbeStatus status);

struct ProbeReply {
    ProbeStatus status = ProbeStatus::Unreachable;
    std::string detail;
};

// One bounded TCP connect per call. Never sends data; the connection is closed before returning.
class PortProbe {
public:
    virtual ~PortProbe() = default;
    virtual ProbeReply probe(HostAddress address, uint16_t port, double timeout, const CancellationToken& cancel) = 0;
};

using PortProbePtr = std::unique_ptr<PortProbe>;

// A completion observed at or after the deadline counts as TimedOut, whatever the error code says.
ProbeStatus classify_connect(const boost::system::error_code& ec,
                             std::chrono::steady_clock::duration elapsed,
                             std::chrono::steady_clock::duration timeout);

class AsioPortProbe : public PortProbe {
public:
    ProbeReply probe(HostAddress address, uint16_t port, double timeout, const CancellationToken& cancel) override;
};

}

#pragma once
#include "../core/Discovery.h"
#include "../core/CancellationToken.h"
#include <memory>
#include <string>

namespace iperf_discovery {

enum class QueryStatus { Response, TimedOut, ConnectionClosed, SendFailed, Aborted };

const char* to_string(QueryStatus status);

struct QueryReply {
    QueryStatus status = QueryStatus::ConnectionClosed;
    std::string bytes;  // Response only, possibly empty
    std::string detail;
};

// Opens its own connection (the probe connection is never reused), writes the payload and
// reads until the peer closes, MAX_RESPONSE_BYTES arrive or the timeout elapses.
// Bytes read before the deadline are returned as a Response; TimedOut means nothing arrived.
class QueryClient {
public:
    virtual ~QueryClient() = default;
    virtual QueryReply query(HostAddress address, uint16_t port, const std::string& payload,
                             double timeout, const CancellationToken& cancel) = 0;
};

using QueryClientPtr = std::unique_ptr<QueryClient>;

class AsioQueryClient : public QueryClient {
public:
    QueryReply query(HostAddress address, uint16_t port, const std::string& payload,
                     double timeout, const CancellationToken& cancel) override;
};

}

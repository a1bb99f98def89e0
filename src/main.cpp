#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Logging.h"
#include "core/Errors.h"
#include "core/CancellationToken.h"
#include "core/AccessoryWriter.h"
#include "core/JSONWriter.h"
#include "discovery/NetworkRange.h"
#include "discovery/ScanOrchestrator.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

using namespace iperf_discovery;

namespace {

// SIGINT/SIGTERM trip the token from a helper thread; the scan returns its partial result.
class InterruptWatcher {
public:
    explicit InterruptWatcher(CancellationToken token)
        : signals_(io_, SIGINT, SIGTERM), work_(boost::asio::make_work_guard(io_)) {
        signals_.async_wait([token](const boost::system::error_code& ec, int signo){
            if(ec) return;
            Logger::instance().info("Scan interrupted by user (signal " + std::to_string(signo) + ")");
            token.cancel();
        });
        thread_ = std::thread([this]{ io_.run(); });
    }
    ~InterruptWatcher() {
        boost::system::error_code ignored;
        signals_.cancel(ignored);
        work_.reset();
        io_.stop();
        if(thread_.joinable()) thread_.join();
    }
    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    boost::asio::io_context io_;
    boost::asio::signal_set signals_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;
};

void log_event(const DiagnosticEvent& ev) {
    auto& log = Logger::instance();
    const std::string host = ev.address.to_string();
    switch(ev.outcome.kind) {
        case OutcomeKind::Discovered:
            log.info("Valid iPerf Remote at " + host + " (" + std::to_string(ev.elapsed.count()) + "ms)");
            break;
        case OutcomeKind::ParseFailed:
            log.info("Invalid iPerf Remote at " + host + ": " + ev.outcome.detail);
            break;
        default:
            log.debug(host + ": " + to_string(ev.outcome.kind) + (ev.outcome.detail.empty() ? "" : " (" + ev.outcome.detail + ")"));
    }
}

void log_summary(const ScanResult& r, uint16_t port) {
    auto& log = Logger::instance();
    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(3) << std::chrono::duration<double>(r.end_time - r.start_time).count() << "s";
    log.info("Summary:");
    log.info("  Total IPs scanned: " + std::to_string(r.summary.scanned) + "/" + std::to_string(r.enumerated));
    log.info("  Hosts with port " + std::to_string(port) + " open: " + std::to_string(r.summary.responsive));
    log.info("  Valid iPerf Remotes: " + std::to_string(r.summary.discovered));
    log.info("  Invalid responses: " + std::to_string(r.summary.responsive - r.summary.discovered));
    log.info("  Total time: " + elapsed.str());
}

bool write_json(const std::string& target, const ScanResult& result, const ScanConfig& sc, bool pretty) {
    JSONWriter writer;
    std::string json = writer.write(result, sc, pretty);
    if(target == "-") { std::cout << json; return static_cast<bool>(std::cout); }
    std::ofstream ofs(target);
    if(!ofs) { Logger::instance().error("Failed to write JSON report to " + target); return false; }
    ofs << json;
    return static_cast<bool>(ofs);
}

}

int main(int argc, char** argv) {
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

    auto& log = Logger::instance();
    log.set_console(cfg.verbose);
    log.set_level(LogLevel::Debug);
    if(!log.open_file(cfg.log_file)) {
        std::cerr << "Cannot open log file " << cfg.log_file << " (continuing without it)\n";
    }

    ConfigValidator validator;
    if(!validator.validate(cfg)) return 2;

    if(!clear_accessory_file(cfg.accessory_file)) {
        log.warn("Stale " + cfg.accessory_file + " left in place until the scan rewrites it");
    }

    try {
        NetworkRange range = NetworkRange::parse(cfg.network);
        ScanConfig sc = validator.build_scan_config(cfg);

        ScanOrchestrator orchestrator(sc);
        orchestrator.set_diagnostic_sink(log_event);

        CancellationToken token;
        ScanResult result;
        {
            InterruptWatcher watcher(token);
            result = orchestrator.run(range, token);
        }

        bool ok = write_accessory_file(cfg.accessory_file, result);
        if(!cfg.json_output.empty()) ok = write_json(cfg.json_output, result, sc, cfg.pretty) && ok;
        log_summary(result, sc.port);
        return ok ? 0 : 1;
    } catch(const InvalidRange& ex) {
        std::cerr << "Invalid network address: " << cfg.network << " (" << ex.what() << ")\n";
        log.error(ex.what());
        return 2;
    } catch(const InvalidConfig& ex) {
        std::cerr << ex.what() << "\n";
        log.error(ex.what());
        return 2;
    } catch(const InternalAggregationError& ex) {
        std::cerr << ex.what() << "\n";
        log.error(ex.what());
        return 3;
    } catch(const std::exception& ex) {
        std::cerr << "Unexpected error: " << ex.what() << "\n";
        log.error(std::string("Unexpected error: ") + ex.what());
        return 3;
    }
}

#include "JSONWriter.h"
#include "JsonUtil.h"
#include "BuildInfo.h"
#include <iomanip>
#include <sstream>

namespace iperf_discovery {

namespace {
    using jsonutil::escape; using jsonutil::time_to_iso;

    std::string quote(const std::string& s) { return "\"" + escape(s) + "\""; }

    std::string number(double v) {
        std::ostringstream oss;
        oss << std::setprecision(6) << v;
        return oss.str();
    }

    // Objects and arrays written member by member; `pretty` adds two-space indentation.
    class Emitter {
    public:
        explicit Emitter(bool pretty) : pretty_(pretty) {}

        void open(char brace) { os_ << brace; ++depth_; first_ = true; }
        void close(char brace) {
            --depth_;
            if(!first_) newline();
            os_ << brace;
            first_ = false;
        }
        void key(const std::string& k) {
            separator();
            os_ << quote(k) << (pretty_ ? ": " : ":");
        }
        void element() { separator(); }
        void raw(const std::string& v) { os_ << v; first_ = false; }
        void member(const std::string& k, const std::string& raw_value) { key(k); raw(raw_value); }

        std::string str() const { return os_.str(); }

    private:
        void separator() {
            if(!first_) os_ << ',';
            newline();
            first_ = true;
        }
        void newline() {
            if(!pretty_) return;
            os_ << '\n' << std::string(static_cast<size_t>(depth_) * 2, ' ');
        }

        std::ostringstream os_;
        bool pretty_;
        int depth_ = 0;
        bool first_ = true;
    };
}

std::string JSONWriter::write(const ScanResult& result, const ScanConfig& config, bool pretty) const {
    Emitter e(pretty);
    e.open('{');

    e.key("meta"); e.open('{');
    e.member("tool", quote("iperf-discovery"));
    e.member("version", quote(buildinfo::APP_VERSION));
    e.member("network", quote(result.network));
    e.member("port", std::to_string(config.port));
    e.member("timeout", number(config.timeout));
    e.member("query_timeout", number(config.query_timeout));
    e.member("start_time", quote(time_to_iso(result.start_time)));
    e.member("end_time", quote(time_to_iso(result.end_time)));
    e.member("cancelled", result.cancelled ? "true" : "false");
    e.close('}');

    e.key("summary"); e.open('{');
    e.member("enumerated", std::to_string(result.enumerated));
    e.member("scanned", std::to_string(result.summary.scanned));
    e.member("responsive", std::to_string(result.summary.responsive));
    e.member("discovered", std::to_string(result.summary.discovered));
    e.close('}');

    e.key("devices"); e.open('[');
    for(const auto& d : result.devices) {
        e.element(); e.open('{');
        e.member("address", quote(d.address.to_string()));
        e.key("attributes"); e.open('{');
        for(const auto& kv : d.attributes) e.member(kv.first, quote(kv.second));
        e.close('}');
        e.close('}');
    }
    e.close(']');

    e.close('}');
    std::string out = e.str();
    out.push_back('\n');
    return out;
}

}

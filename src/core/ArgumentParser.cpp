#include "ArgumentParser.h"
#include "BuildInfo.h"
#include <iostream>
#include <stdexcept>

namespace iperf_discovery {

namespace {
    bool need_int(const std::string& v, const char* flag, int& out) {
        try {
            size_t used = 0;
            int n = std::stoi(v, &used);
            if(used != v.size()) throw std::invalid_argument(v);
            out = n;
            return true;
        } catch(const std::exception&) {
            std::cerr << "Invalid integer for " << flag << ": " << v << "\n";
            return false;
        }
    }

    bool need_double(const std::string& v, const char* flag, double& out) {
        try {
            size_t used = 0;
            double d = std::stod(v, &used);
            if(used != v.size()) throw std::invalid_argument(v);
            out = d;
            return true;
        } catch(const std::exception&) {
            std::cerr << "Invalid number for " << flag << ": " << v << "\n";
            return false;
        }
    }
}

ArgumentParser::ArgumentParser() {
    specs_ = {
        {"--timeout", "-t", ArgKind::Double, "Probe timeout in seconds (0.010-0.160, default 0.010)",
            [](const std::string& v, Config& c){ double d = 0; if(!need_double(v, "--timeout", d)) return false; c.timeout = d; return true; }},
        {"--options", "-o", ArgKind::None, "Read timeout= from the options file",
            [](const std::string&, Config& c){ c.use_options_file = true; return true; }},
        {"--options-file", "", ArgKind::String, std::string("Options file path (default ") + DEFAULT_OPTIONS_FILE + ")",
            [](const std::string& v, Config& c){ c.options_file = v; c.use_options_file = true; return true; }},
        {"--verbose", "", ArgKind::None, "Mirror the log on the console",
            [](const std::string&, Config& c){ c.verbose = true; return true; }},
        {"--output", "", ArgKind::String, std::string("Accessory file (default ") + DEFAULT_ACCESSORY_FILE + ")",
            [](const std::string& v, Config& c){ c.accessory_file = v; return true; }},
        {"--log-file", "", ArgKind::String, std::string("Log file, overwritten each run (default ") + DEFAULT_LOG_FILE + ")",
            [](const std::string& v, Config& c){ c.log_file = v; return true; }},
        {"--json", "", ArgKind::String, "Write a JSON report to FILE (- for stdout)",
            [](const std::string& v, Config& c){ c.json_output = v; return true; }},
        {"--pretty", "", ArgKind::None, "Indent the JSON report",
            [](const std::string&, Config& c){ c.pretty = true; return true; }},
        {"--concurrency", "", ArgKind::Int, "Hosts probed at once (1-1024, default 128)",
            [](const std::string& v, Config& c){ return need_int(v, "--concurrency", c.concurrency); }},
        {"--query-timeout", "", ArgKind::Double, "Query exchange timeout in seconds (default 5.0)",
            [](const std::string& v, Config& c){ return need_double(v, "--query-timeout", c.query_timeout); }},
        {"--require-marker", "", ArgKind::None, std::string("Only accept replies containing '") + ACCESSORY_MARKER + "'",
            [](const std::string&, Config& c){ c.require_marker = true; return true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find(const std::string& flag) const {
    for(const auto& s : specs_) {
        if(flag == s.name || (!s.short_name.empty() && flag == s.short_name)) return &s;
    }
    return nullptr;
}

void ArgumentParser::print_help(std::ostream& os) const {
    os << "usage: iperf-discovery [options] network\n\n"
       << "Discover NetAlly Test Accessories running iPerf3 servers on a network.\n\n"
       << "  network                       IPv4 network to scan (e.g. 192.168.1.0/24)\n";
    auto line = [&](const std::string& name, const std::string& help){
        os << "  " << name;
        if(name.size() < 30) for(size_t i = name.size(); i < 30; ++i) os << ' '; else os << ' ';
        os << help << "\n";
    };
    for(const auto& s : specs_) {
        std::string name = s.short_name.empty() ? s.name : s.short_name + ", " + s.name;
        if(s.kind != ArgKind::None) name += s.kind == ArgKind::String ? " FILE" : " N";
        line(name, s.help);
    }
    line("-v, --version", "Print version & exit");
    line("-h, --help", "Show this help");
}

void ArgumentParser::print_version(std::ostream& os) {
    os << "iperf-discovery " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
       << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
       << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = 0;
    bool have_network = false;
    for(int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if(a == "--help" || a == "-h") { print_help(std::cout); return false; }
        if(a == "--version" || a == "-v") { print_version(std::cout); return false; }
        if(a.size() > 1 && a[0] == '-') {
            const FlagSpec* spec = find(a);
            if(!spec) { std::cerr << "Unknown arg: " << a << "\n"; exit_code_ = 2; return false; }
            std::string val;
            if(spec->kind != ArgKind::None) {
                if(i + 1 >= argc || !argv[i + 1]) { std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
                val = argv[++i];
            }
            if(!spec->apply(val, cfg)) { exit_code_ = 2; return false; }
            continue;
        }
        if(have_network) { std::cerr << "Unexpected argument: " << a << "\n"; exit_code_ = 2; return false; }
        cfg.network = a;
        have_network = true;
    }
    if(!have_network) {
        std::cerr << "Missing network argument\n";
        print_help(std::cerr);
        exit_code_ = 2;
        return false;
    }
    return true;
}

}

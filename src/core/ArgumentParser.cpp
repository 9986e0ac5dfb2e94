#include "ArgumentParser.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <iostream>

namespace rack_scan {

namespace {
struct HelpLine { std::string name; std::string help; };
const std::vector<HelpLine>& help_lines(){
    static const std::vector<HelpLine> lines = {
        {"--subnet CIDR", "Subnet to scan (required)"},
        {"--network-id ID", "Network id recorded on scan and devices (default cli)"},
        {"--network-name NAME", "Human readable network name"},
        {"--scan-type quick|full|deep", "Scan depth (default full)"},
        {"--no-ports", "Skip TCP port scanning"},
        {"--port-scan-type T", "common|full|custom (full is scanned as common)"},
        {"--ports list", "Comma-separated custom ports (implies custom)"},
        {"--no-service-detection", "Skip banner grabbing"},
        {"--no-os-detection", "Skip OS heuristic"},
        {"--exclude list", "Comma-separated IPs or CIDR blocks to skip"},
        {"--exclude-file FILE", "File with exclusions, one per line"},
        {"--timeout S", "Per-probe timeout in seconds (default 5)"},
        {"--concurrency N", "Hosts probed at once (default 5)"},
        {"--progress-interval N", "Report progress every N hosts (default 50)"},
        {"--max-hosts N", "Refuse subnets larger than N hosts"},
        {"--banner-timeout MS", "Banner read deadline in ms (default 2000)"},
        {"--scanner NAME", "Scanner implementation (default builtin)"},
        {"--list-scanners", "List registered scanners & exit"},
        {"--output FILE", "Write JSON to FILE (default stdout)"},
        {"--pretty", "Pretty-print JSON"},
        {"--compact", "Minified JSON output"},
        {"--ndjson", "Emit NDJSON (meta, scan, devices)"},
        {"--progress", "Log each progress report"},
        {"--log-level L", "error|warn|info|debug|trace"},
        {"--drop-priv", "Drop capabilities except CAP_NET_RAW"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    return lines;
}
}

ArgumentParser::ArgumentParser() {
    specs_ = {
        {"--subnet", ArgKind::String, [](Config& c, const std::string& v){ c.subnet = v; }},
        {"--network-id", ArgKind::String, [](Config& c, const std::string& v){ c.network_id = v; }},
        {"--network-name", ArgKind::String, [](Config& c, const std::string& v){ c.network_name = v; }},
        {"--scan-type", ArgKind::String, [](Config& c, const std::string& v){ c.scan_type = v; }},
        {"--no-ports", ArgKind::None, [](Config& c, const std::string&){ c.scan_ports = false; }},
        {"--port-scan-type", ArgKind::String, [](Config& c, const std::string& v){ c.port_scan_type = v; }},
        {"--ports", ArgKind::CSV, [this](Config& c, const std::string& v){
            for(const auto& p : split_csv(v)){ int n=0; if(!need_int(p, "--ports", n)) return; c.custom_ports.push_back(n); } }},
        {"--no-service-detection", ArgKind::None, [](Config& c, const std::string&){ c.service_detection = false; }},
        {"--no-os-detection", ArgKind::None, [](Config& c, const std::string&){ c.os_detection = false; }},
        {"--exclude", ArgKind::CSV, [](Config& c, const std::string& v){ auto l = split_csv(v); c.exclude_ips.insert(c.exclude_ips.end(), l.begin(), l.end()); }},
        {"--exclude-file", ArgKind::String, [](Config& c, const std::string& v){ c.exclude_file = v; }},
        {"--timeout", ArgKind::Int, [this](Config& c, const std::string& v){ need_int(v, "--timeout", c.timeout_seconds); }},
        {"--concurrency", ArgKind::Int, [this](Config& c, const std::string& v){ need_int(v, "--concurrency", c.max_concurrent_hosts); }},
        {"--progress-interval", ArgKind::Int, [this](Config& c, const std::string& v){ need_int(v, "--progress-interval", c.progress_interval); }},
        {"--max-hosts", ArgKind::Int, [this](Config& c, const std::string& v){ int n=0; if(need_int(v, "--max-hosts", n)) c.max_hosts = n; }},
        {"--banner-timeout", ArgKind::Int, [this](Config& c, const std::string& v){ need_int(v, "--banner-timeout", c.banner_timeout_ms); }},
        {"--scanner", ArgKind::String, [](Config& c, const std::string& v){ c.scanner_name = v; }},
        {"--list-scanners", ArgKind::None, [](Config& c, const std::string&){ c.list_scanners = true; }},
        {"--output", ArgKind::String, [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--pretty", ArgKind::None, [](Config& c, const std::string&){ c.pretty = true; }},
        {"--compact", ArgKind::None, [](Config& c, const std::string&){ c.compact = true; }},
        {"--ndjson", ArgKind::None, [](Config& c, const std::string&){ c.ndjson = true; }},
        {"--progress", ArgKind::None, [](Config& c, const std::string&){ c.progress = true; }},
        {"--log-level", ArgKind::String, [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--drop-priv", ArgKind::None, [](Config& c, const std::string&){ c.drop_priv = true; }}
    };
}

std::vector<std::string> ArgumentParser::split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else if(c!=' ') cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

bool ArgumentParser::need_int(const std::string& v, const char* flag, int& out){
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if(used != v.size()) throw std::invalid_argument(v);
        out = n;
        return true;
    } catch(const std::exception&) {
        std::cerr << "Invalid integer for " << flag << ": " << v << "\n";
        bad_value_ = true;
        return false;
    }
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

void ArgumentParser::print_help(){
    std::cout << "rack-scan options:\n";
    for(const auto& l : help_lines()){
        std::cout << "  " << l.name;
        if(l.name.size() < 30) for(size_t i=l.name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << l.help << "\n";
    }
}

void ArgumentParser::print_version(){
    std::cout << "rack-scan " << rack_scan::buildinfo::APP_VERSION
              << " (git=" << rack_scan::buildinfo::GIT_COMMIT
              << ", compiler=" << rack_scan::buildinfo::COMPILER_ID << " " << rack_scan::buildinfo::COMPILER_VERSION
              << ", cxx_std=" << rack_scan::buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0;
    bad_value_ = false;
    for(int i=1; i<argc; ++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; print_help(); exit_code_ = 2; return false; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1 >= argc){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        spec->apply(cfg, val);
        if(bad_value_){ exit_code_ = 2; return false; }
    }
    return true;
}

}

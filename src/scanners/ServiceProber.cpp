#include "ServiceProber.h"
#include "../core/Socket.h"
#include "../core/Logging.h"
#include "../core/ScanContext.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <system_error>

namespace rack_scan {

namespace {
const std::map<int, std::string>& port_table(){
    static const std::map<int, std::string> table = {
        {21, "FTP"}, {22, "SSH"}, {23, "Telnet"}, {25, "SMTP"}, {53, "DNS"},
        {80, "HTTP"}, {110, "POP3"}, {143, "IMAP"}, {443, "HTTPS"}, {3306, "MySQL"},
        {3389, "RDP"}, {5432, "PostgreSQL"}, {5900, "VNC"}, {6379, "Redis"},
        {8080, "HTTP-Alt"}, {27017, "MongoDB"},
    };
    return table;
}

// Checked in order; the first token found in the upper-cased banner wins.
struct Signature { const char* token; const char* service; };
const Signature kSignatures[] = {
    {"SSH", "SSH"}, {"FTP", "FTP"}, {"HTTP", "HTTP"}, {"SMTP", "SMTP"},
    {"MYSQL", "MySQL"}, {"POSTGRESQL", "PostgreSQL"}, {"POP3", "POP3"},
    {"IMAP", "IMAP"}, {"REDIS", "Redis"}, {"RFB", "VNC"},
};

std::string trim(const std::string& s){
    auto b = s.find_first_not_of(" \t\r\n");
    if(b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}
}

bool ServiceProber::is_http_port(int port){
    return port == 80 || port == 8000 || port == 8008 || port == 8080 || port == 8888;
}

std::optional<std::string> ServiceProber::default_service(int port){
    auto it = port_table().find(port);
    if(it == port_table().end()) return std::nullopt;
    return it->second;
}

std::string ServiceProber::classify_banner(const std::string& banner, int port){
    std::string upper = banner;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    for(const auto& sig : kSignatures){
        if(upper.find(sig.token) != std::string::npos) return sig.service;
    }
    return default_service(port).value_or("unknown");
}

std::string ServiceProber::parse_version(const std::string& banner){
    std::istringstream ss(banner);
    std::vector<std::string> words;
    std::string w;
    while(ss >> w) words.push_back(w);
    for(size_t i=0; i<words.size(); ++i){
        if(words[i].find('v') != std::string::npos || words[i].find("Version") != std::string::npos){
            if(i + 1 < words.size()) return words[i+1];
        }
    }
    return "";
}

std::optional<ServiceInfo> ServiceProber::probe_service(const std::string& ip, int port) const {
    std::optional<Socket> sock;
    try {
        sock = connect_with_timeout(ip, port, connect_timeout_);
    } catch(const std::system_error& ex) {
        Logger::instance().debug("Service probe socket failed", {{"ip", ip}, {"port", std::to_string(port)}, {"error", ex.what()}});
        return std::nullopt;
    }
    if(!sock) return std::nullopt;

    ServiceInfo info;
    info.port = port;
    info.protocol = "tcp";

    // Text protocols that wait for the client need a nudge
    if(is_http_port(port) && !send_all(*sock, "GET / HTTP/1.0\r\n\r\n")) {
        Logger::instance().debug("HTTP probe write failed", {{"ip", ip}, {"port", std::to_string(port)}});
    }

    auto line = read_line(*sock, banner_timeout_);
    std::string banner = line ? trim(*line) : std::string();
    if(!banner.empty()){
        info.banner = banner;
        info.service = classify_banner(banner, port);
        info.version = parse_version(banner);
    } else {
        info.service = default_service(port).value_or("unknown");
    }
    return info;
}

std::vector<ServiceInfo> ServiceProber::detect_services(const std::string& ip, const std::vector<int>& ports, const ScanContext& context){
    std::vector<ServiceInfo> services;
    for(int port : ports){
        if(context.cancelled()) break;
        if(auto svc = probe_service(ip, port)) {
            Logger::instance().trace("Service on " + ip + ":" + std::to_string(port) + " = " + svc->service);
            services.push_back(std::move(*svc));
        }
    }
    return services;
}

}

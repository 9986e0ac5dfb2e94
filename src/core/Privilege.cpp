#include "Privilege.h"
#include "Logging.h"
#include <string>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#ifdef RACK_SCAN_HAVE_LIBCAP
#include <sys/capability.h>
#endif

namespace rack_scan {

// Helper function to log current capability state
static void log_capabilities(const std::string& context) {
#ifdef RACK_SCAN_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }

    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    } else {
        Logger::instance().warn("Failed to convert capabilities to text for " + context);
    }

    cap_free(caps);
#else
    Logger::instance().debug("Capabilities logging not available (libcap not compiled in) for " + context);
#endif
}

void drop_capabilities(bool keep_net_raw){
#ifdef RACK_SCAN_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities (keep_net_raw=" + std::string(keep_net_raw ? "true" : "false") + ")");
    log_capabilities("before drop");

    cap_t caps = cap_get_proc(); if(!caps) return; // best-effort
    bool had_raw = false;
    cap_flag_value_t v = CAP_CLEAR;
    if(cap_get_flag(caps, CAP_NET_RAW, CAP_PERMITTED, &v) == 0) had_raw = (v == CAP_SET);
    cap_clear(caps);
    if(keep_net_raw && had_raw){
        cap_value_t raw = CAP_NET_RAW;
        cap_set_flag(caps, CAP_PERMITTED, 1, &raw, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 1, &raw, CAP_SET);
    }
    if(cap_set_proc(caps)!=0){
        Logger::instance().error("cap_set_proc failed");
    } else {
        log_capabilities("after drop");
    }
    cap_free(caps);
#else
    (void)keep_net_raw;
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
#endif
}

bool is_privilege_available(){
#ifdef RACK_SCAN_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

bool has_net_raw_capability(){
    if(geteuid() == 0) return true;
#ifdef RACK_SCAN_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if(!caps) return false;
    cap_flag_value_t v = CAP_CLEAR;
    bool ok = cap_get_flag(caps, CAP_NET_RAW, CAP_EFFECTIVE, &v) == 0 && v == CAP_SET;
    cap_free(caps);
    return ok;
#else
    return false;
#endif
}

bool can_open_raw_icmp_socket(){
    int fd = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if(fd < 0) return false;
    ::close(fd);
    return true;
}

}

#pragma once
#include "Config.h"
#include <string>

namespace rack_scan {

class ConfigValidator {
public:
    // Normalizes cfg in place; prints the first problem to stderr and returns false if invalid.
    bool validate(Config& cfg);
    // Merges exclusions from cfg.exclude_file. Returns false if the file cannot be read.
    bool load_external_files(Config& cfg);

    static bool valid_port(int port) { return port >= 1 && port <= 65535; }
    // Upper bound for --timeout, well inside poll(2)'s millisecond range.
    static constexpr int kMaxTimeoutSeconds = 3600;
private:
    bool load_exclude_file(Config& cfg);
};

}

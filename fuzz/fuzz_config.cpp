#include "core/Config.h"
#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include <cstdint>
#include <vector>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    // Split into args on spaces; argv[0] is the program name
    std::vector<std::string> args{"rack-scan"};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t next = input.find(' ', pos);
        if (next == std::string::npos) {
            args.push_back(input.substr(pos));
            break;
        }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }

    rack_scan::ArgumentParser parser;
    rack_scan::Config cfg;
    if (parser.parse(static_cast<int>(argv.size()), argv.data(), cfg)) {
        cfg.exclude_file.clear(); // never touch the filesystem
        rack_scan::ConfigValidator validator;
        if (validator.validate(cfg)) {
            rack_scan::DiscoveryRule rule = rack_scan::make_rule(cfg);
            (void)rule;
        }
    }
    return 0;
}

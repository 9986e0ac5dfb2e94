#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace rack_scan {

class ArgumentParser {
public:
    ArgumentParser();

    // Returns false when the program should exit right away (help, version,
    // usage error); exit_code() then holds the status to return.
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    static void print_help();
    static void print_version();
    static std::vector<std::string> split_csv(const std::string& s);
private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec { const char* name; ArgKind kind; std::function<void(Config&, const std::string&)> apply; };

    const FlagSpec* find_spec(const std::string& flag) const;
    bool need_int(const std::string& v, const char* flag, int& out);

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
    bool bad_value_ = false;
};

}

#pragma once
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace hulud_scan {

struct Config;

class ArgumentParser {
public:
    // Fills cfg from argv. Returns false when the process should exit without scanning:
    // --help / --version (exit_code() == 0) or a usage error (exit_code() == 2).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    void print_help(std::ostream& os) const;
    void print_version(std::ostream& os) const;
private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        const char* alias; // short form or nullptr
        ArgKind kind;
        std::function<bool(const std::string&)> apply;
    };
    std::vector<FlagSpec> build_specs(Config& cfg);
    int exit_code_ = 0;
};

std::vector<std::string> split_csv(const std::string& s);

}

#pragma once
#include "Scanner.h"
#include "../scanners/GitQueries.h"
#include <string>
#include <vector>

namespace hulud_scan {

struct Config;

class ScannerRegistry {
public:
    void register_scanner(ScannerPtr scanner);
    // dependencies, files, git (minus any --skip-* selections); git_factory replaces the git CLI backend
    void register_all_default(const Config& cfg, GitQueriesFactory git_factory = nullptr);
    void run_all(ScanContext& context);
    std::vector<std::string> names() const;
private:
    bool is_enabled(const Config& cfg, const std::string& name) const;
    void run_one(Scanner& scanner, ScanContext& context);
    std::vector<ScannerPtr> scanners_;
};

}

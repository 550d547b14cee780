#pragma once
#include "../scanners/GitQueries.h"
#include <iosfwd>
#include <string>
#include <utility>

namespace hulud_scan {

struct Config;
class Logger;
class ThreatList;

// One invocation: the target project, or with cfg.recursive each discovered project in
// turn until one of them fails.
class ScanSession {
public:
    ScanSession(const Config& cfg, const ThreatList& threats, Logger& log, GitQueriesFactory git_factory = nullptr)
        : cfg_(cfg), threats_(threats), log_(log), git_factory_(std::move(git_factory)) {}

    // Writes one report per scanned project to out. Returns 1 once a project reaches
    // --fail-on-count, 0 otherwise.
    int run(std::ostream& out);
    int scan_project(const std::string& dir, std::ostream& out);
private:
    const Config& cfg_;
    const ThreatList& threats_;
    Logger& log_;
    GitQueriesFactory git_factory_;
};

}
